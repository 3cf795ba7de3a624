#include <Compiler.hpp>
#include <Emitter.hpp>
#include <Errors.hpp>
#include <algorithm>
#include <unordered_set>

namespace esmc
{
    AsyncModuleInfo computeAsyncModules(const ModuleGraph &graph, const Resolver &resolver, Logger &log)
    {
        std::unordered_set<std::string> async;
        for (auto &entry : graph.modules)
            if (entry.asyncModule->isSelfAsync(resolver))
            {
                log.print(Logger::Debug, "{} is self async", entry.module->ident());
                async.insert(entry.module->ident());
            }

        // Propagate to importers until nothing changes. Each pass adds at least one module, so this terminates.
        for (bool changed = true; changed;)
        {
            changed = false;
            for (auto &entry : graph.modules)
            {
                if (async.contains(entry.module->ident()))
                    continue;
                for (auto &reference : entry.references)
                {
                    if (reference->chunkingPolicy() != ChunkingPolicy::ParallelInheritAsync)
                        continue;
                    auto asset = reference->referencedAsset(resolver);
                    auto internal = std::get_if<ReferencedAsset::Internal>(&asset.data);
                    if (!internal || !async.contains(internal->module->ident()))
                        continue;
                    log.print(Logger::Debug, "{} is async because of {}", entry.module->ident(), reference->toString());
                    async.insert(entry.module->ident());
                    changed = true;
                    break;
                }
            }
        }

        AsyncModuleInfo info;
        for (auto &entry : graph.modules)
            if (async.contains(entry.module->ident()))
                info.insert(*graph.chunkingContext.chunkItem(entry.module));
        log.print(Logger::Info, "{} of {} modules are async", info.size(), graph.modules.size());
        return info;
    }

    std::vector<CompiledModule> compile(const ModuleGraph &graph, const Resolver &resolver, const Options &options, Logger &log)
    {
        std::optional<AsyncModuleInfo> info;
        if (options.asyncModules)
            info = computeAsyncModules(graph, resolver, log);
        const AsyncModuleInfo *asyncModuleInfo = info ? &*info : nullptr;

        for (auto &path : options.only)
            if (!graph.find(path))
                throw ConfigError("No ecmascript module named " + path);

        std::vector<CompiledModule> result;
        for (auto &entry : graph.modules)
        {
            auto path = entry.module->ident();
            if (!options.only.empty() && std::find(options.only.begin(), options.only.end(), path) == options.only.end())
                continue;
            log << Logger::Info << "Compiling " << path << '\n';

            std::vector<CodeGeneration> generations;
            generations.reserve(entry.references.size() + 1);
            for (auto &reference : entry.references)
                generations.push_back(reference->codeGeneration(resolver, graph.chunkingContext));
            generations.push_back(entry.asyncModule->codeGeneration(resolver, graph.chunkingContext, asyncModuleInfo));

            CompiledModule compiled{.path = path, .program = Program{entry.kind, entry.body}};
            applyCodeGeneration(compiled.program, generations);
            compiled.code = emit(compiled.program);
            compiled.selfAsync = entry.asyncModule->isSelfAsync(resolver);
            compiled.async = asyncModuleInfo && asyncModuleInfo->contains(*graph.chunkingContext.chunkItem(entry.module));
            compiled.asyncOptions = entry.asyncModule->moduleOptions(asyncModuleInfo);
            result.push_back(std::move(compiled));
        }
        return result;
    }
}
