#include <StaticGraph.hpp>

namespace esmc
{
    void StaticResolver::add(const std::string &origin, const std::string &specifier, ResolveResult result, std::optional<std::string> transition)
    {
        table.insert_or_assign(std::make_tuple(origin, std::move(transition), specifier), std::move(result));
    }

    ResolveResult StaticResolver::resolve(const ResolveOrigin &origin, const Request &request, const ReferenceSubType &) const
    {
        m_calls++;
        if (auto it = table.find(std::make_tuple(origin.path, origin.transition, request.specifier)); it != table.end())
            return it->second;
        // A transition without its own entry resolves like the plain origin
        if (origin.transition)
            if (auto it = table.find(std::make_tuple(origin.path, std::optional<std::string>{}, request.specifier)); it != table.end())
                return it->second;
        return ResolveResult{};
    }

    void StaticChunkingContext::setId(const std::string &moduleIdent, ModuleId id)
    {
        ids.insert_or_assign(moduleIdent, std::move(id));
    }

    std::shared_ptr<const ChunkItem> StaticChunkingContext::chunkItem(const std::shared_ptr<const ChunkableModule> &module) const
    {
        std::lock_guard lock{mutex};
        auto &item = items[module->ident()];
        if (!item)
            item = std::make_shared<const ChunkItem>(module, env.name);
        return item;
    }

    ModuleId StaticChunkingContext::chunkItemId(const ChunkItem &item) const
    {
        auto ident = item.module()->ident();
        if (auto it = ids.find(ident); it != ids.end())
            return it->second;
        return ident;
    }
}
