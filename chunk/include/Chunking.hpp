#pragma once
#include <Resolve.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>

namespace esmc
{
    // Id a chunk item is addressed by at runtime. Emitted as a string or number literal, as is.
    using ModuleId = std::variant<std::string, uint32_t>;

    std::string toString(const ModuleId &id);

    // A module compiled for one chunking context.
    class ChunkItem
    {
    public:
        ChunkItem(std::shared_ptr<const ChunkableModule> module_, std::string contextName)
            : m_module(std::move(module_)), m_ident(m_module->ident() + " (" + contextName + ")") {}

        const std::shared_ptr<const ChunkableModule> &module() const { return m_module; }
        // Equal for the same module under the same chunking context
        const std::string &ident() const { return m_ident; }

    private:
        std::shared_ptr<const ChunkableModule> m_module;
        std::string m_ident;
    };

    struct Environment
    {
        std::string name;
        // Whether the host provides require() for modules left out of the bundle
        bool supportsCommonJsExternals = true;
    };

    class ChunkingContext
    {
    public:
        virtual ~ChunkingContext() = default;
        virtual const Environment &environment() const = 0;
        virtual std::shared_ptr<const ChunkItem> chunkItem(const std::shared_ptr<const ChunkableModule> &module) const = 0;
        virtual ModuleId chunkItemId(const ChunkItem &item) const = 0;
    };

    // The chunk items of a chunk which evaluate asynchronously. Computed by the caller over the whole chunk,
    // only queried here.
    class AsyncModuleInfo
    {
    public:
        void insert(const ChunkItem &item) { referencedAsyncModules.insert(item.ident()); }
        bool contains(const ChunkItem &item) const { return referencedAsyncModules.contains(item.ident()); }
        size_t size() const { return referencedAsyncModules.size(); }
        const std::unordered_set<std::string> &idents() const { return referencedAsyncModules; }

    private:
        std::unordered_set<std::string> referencedAsyncModules;
    };
}
