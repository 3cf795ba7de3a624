#pragma once
#include <AsyncModule.hpp>
#include <Manifest.hpp>
#include <Node.hpp>
#include <StaticGraph.hpp>
#include <memory>
#include <vector>

namespace esmc
{
    // The modules of a manifest with their references, plus the resolver and chunking context answering for them.
    struct ModuleGraph
    {
        struct Entry
        {
            std::shared_ptr<const ChunkableModule> module;
            std::vector<std::shared_ptr<const ImportReference>> references;
            std::shared_ptr<const AsyncModule> asyncModule;
            Program::Kind kind = Program::Kind::Module;
            std::vector<Node> body{};
        };

        StaticResolver resolver;
        StaticChunkingContext chunkingContext;
        // Only ecmascript modules, in manifest order
        std::vector<Entry> modules;

        const Entry *find(const std::string &path) const;
    };

    // Throws ConfigError for module declarations in script bodies
    std::unique_ptr<ModuleGraph> buildGraph(const Manifest &manifest, Logger &log);
}
