#pragma once
#include <Chunking.hpp>
#include <Resolve.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace esmc
{
    // An ecmascript module known by path
    class StaticModule : public ChunkableModule
    {
    public:
        explicit StaticModule(std::string path_) : path(std::move(path_)) {}
        std::string ident() const override { return path; }

    private:
        std::string path;
    };

    // Something a request can resolve to that is not an ecmascript module, e.g. an image
    class StaticAsset : public Module
    {
    public:
        explicit StaticAsset(std::string path_) : path(std::move(path_)) {}
        std::string ident() const override { return "asset " + path; }

    private:
        std::string path;
    };

    // Answers from a fixed table. Requests without an entry do not resolve.
    class StaticResolver : public Resolver
    {
    public:
        void add(const std::string &origin, const std::string &specifier, ResolveResult result, std::optional<std::string> transition = std::nullopt);

        ResolveResult resolve(const ResolveOrigin &origin, const Request &request, const ReferenceSubType &subType) const override;

        // Number of resolve() calls so far
        size_t calls() const { return m_calls; }

    private:
        // origin, transition, specifier
        std::map<std::tuple<std::string, std::optional<std::string>, std::string>, ResolveResult> table;
        mutable std::atomic<size_t> m_calls{0};
    };

    // Assigns ids from a table, falling back to the module's ident. Chunk items are created once per module.
    class StaticChunkingContext : public ChunkingContext
    {
    public:
        StaticChunkingContext(Environment env_ = {"browser", true}) : env(std::move(env_)) {}

        void setId(const std::string &moduleIdent, ModuleId id);
        void setEnvironment(Environment environment_) { env = std::move(environment_); }

        const Environment &environment() const override { return env; }
        std::shared_ptr<const ChunkItem> chunkItem(const std::shared_ptr<const ChunkableModule> &module) const override;
        ModuleId chunkItemId(const ChunkItem &item) const override;

    private:
        Environment env;
        std::unordered_map<std::string, ModuleId> ids;
        mutable std::mutex mutex;
        mutable std::unordered_map<std::string, std::shared_ptr<const ChunkItem>> items;
    };
}
