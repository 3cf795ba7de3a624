#include <ModuleGraph.hpp>
#include <Errors.hpp>
#include <fmt/core.h>
#include <unordered_map>

namespace esmc
{
    const ModuleGraph::Entry *ModuleGraph::find(const std::string &path) const
    {
        for (auto &entry : modules)
            if (entry.module->ident() == path)
                return &entry;
        return nullptr;
    }

    static bool isModuleDeclaration(const std::string &line)
    {
        return line.starts_with("import ") || line.starts_with("import{") || line.starts_with("export ") || line.starts_with("export{");
    }

    std::unique_ptr<ModuleGraph> buildGraph(const Manifest &manifest, Logger &log)
    {
        auto graph = std::make_unique<ModuleGraph>();
        graph->chunkingContext.setEnvironment(manifest.environment);

        std::unordered_map<std::string, std::shared_ptr<const Module>> handles;
        for (auto &m : manifest.modules)
        {
            if (m.asset)
                handles.emplace(m.path, std::make_shared<const StaticAsset>(m.path));
            else
                handles.emplace(m.path, std::make_shared<const StaticModule>(m.path));
            if (m.id)
                graph->chunkingContext.setId(m.path, *m.id);
        }
        // Targets nobody declared still resolve, they just have no references of their own
        const auto handleFor = [&](const std::string &path) -> std::shared_ptr<const Module>
        {
            auto it = handles.find(path);
            if (it == handles.end())
            {
                log.print(Logger::Warning, "{}: module {} is imported but not declared", manifest.name, path);
                it = handles.emplace(path, std::make_shared<const StaticModule>(path)).first;
            }
            return it->second;
        };

        for (auto &m : manifest.modules)
        {
            if (m.asset)
                continue;
            ModuleGraph::Entry entry;
            entry.module = std::static_pointer_cast<const ChunkableModule>(handles.at(m.path));
            entry.kind = m.script ? Program::Kind::Script : Program::Kind::Module;

            for (auto &import : m.imports)
            {
                ResolveResult result;
                for (size_t i = 0; i < import.targets.size(); i++)
                {
                    auto &target = import.targets[i];
                    ResolveResult::Item item{ResolveResult::Item::Unresolvable{}};
                    switch (target.kind)
                    {
                    case Manifest::Target::Kind::Module:
                        item.data = ResolveResult::Item::Module{handleFor(target.value)};
                        break;
                    case Manifest::Target::Kind::External:
                        item.data = ResolveResult::Item::External{target.value};
                        break;
                    case Manifest::Target::Kind::Ignore:
                        item.data = ResolveResult::Item::Ignore{};
                        break;
                    case Manifest::Target::Kind::Unresolvable:
                        break;
                    }
                    result.primary.emplace_back(i ? std::to_string(i) : std::string{}, std::move(item));
                }
                graph->resolver.add(m.path, import.specifier, std::move(result));
                entry.references.push_back(std::make_shared<const ImportReference>(
                    ResolveOrigin{m.path}, Request::parse(import.specifier), import.annotations,
                    IssueSource{manifest.name, static_cast<uint32_t>(import.line), static_cast<uint32_t>(import.line)},
                    import.part, m.importExternals));
            }

            for (auto &line : m.body)
            {
                if (!isModuleDeclaration(line))
                    entry.body.push_back(Node::verbatim(line));
                else if (m.script)
                    throw ConfigError(fmt::format("{}: script {} cannot contain module declaration: {}", manifest.name, m.path, line));
                else
                    entry.body.push_back(Node::moduleDecl(line));
            }

            entry.asyncModule = std::make_shared<const AsyncModule>(entry.module, entry.references, m.topLevelAwait, m.importExternals);
            log.print(Logger::Debug, "{}: {} references, {} body items", m.path, entry.references.size(), entry.body.size());
            graph->modules.push_back(std::move(entry));
        }
        return graph;
    }
}
