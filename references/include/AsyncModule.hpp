#pragma once
#include <Chunking.hpp>
#include <CodeGeneration.hpp>
#include <ImportReference.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace esmc
{
    // What the async module wrapper of a compiled module needs to know
    struct AsyncModuleOptions
    {
        bool hasTopLevelAwait = false;
        bool operator==(const AsyncModuleOptions &other) const = default;
    };

    // Everything needed to decide whether a module evaluates asynchronously: its own top level await
    // and the imports whose bindings may be promises.
    class AsyncModule
    {
    public:
        // Duplicate references are dropped, the first occurrence keeps its position
        AsyncModule(std::shared_ptr<const ChunkableModule> module_, const std::vector<std::shared_ptr<const ImportReference>> &references_,
                     bool hasTopLevelAwait_, bool importExternals_);

        const std::shared_ptr<const ChunkableModule> &module() const { return m_module; }
        const std::vector<std::shared_ptr<const ImportReference>> &references() const { return m_references; }
        bool hasTopLevelAwait() const { return m_hasTopLevelAwait; }
        bool importExternals() const { return m_importExternals; }

        // Top level await, or external modules imported as ESM (which always load asynchronously).
        // Does not look at other modules.
        bool isSelfAsync(const Resolver &resolver) const;

        // Identifiers of imported bindings that have to be awaited: externals when imported as ESM, and modules whose
        // chunk item is in the async set. Chunking policy is not considered. No duplicates, in reference order.
        std::vector<std::string> asyncIdents(const Resolver &resolver, const ChunkingContext &chunkingContext, const AsyncModuleInfo &asyncModuleInfo) const;

        // None when no async set was supplied, i.e. async modules are not wanted for this output at all
        std::optional<AsyncModuleOptions> moduleOptions(const AsyncModuleInfo *asyncModuleInfo) const;

        CodeGeneration codeGeneration(const Resolver &resolver, const ChunkingContext &chunkingContext, const AsyncModuleInfo *asyncModuleInfo) const;

    private:
        std::shared_ptr<const ChunkableModule> m_module;
        std::vector<std::shared_ptr<const ImportReference>> m_references;
        bool m_hasTopLevelAwait;
        bool m_importExternals;
    };

    // var __turbopack_async_dependencies__ = __turbopack_handle_async_dependencies__([a, b]);
    // [a, b] = __turbopack_async_dependencies__.then ? (await __turbopack_async_dependencies__)() : __turbopack_async_dependencies__;
    void addAsyncDependencyHandler(Program &program, const std::vector<std::string> &idents);
}
