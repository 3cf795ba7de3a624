#include <ReferencedAsset.hpp>
#include <MagicIdentifier.hpp>

namespace esmc
{
    ReferencedAsset ReferencedAsset::fromResolveResult(const ResolveResult &result)
    {
        // TODO: honor multiple keyed results once the import side can bind more than one module per request
        for (auto &[_, item] : result.primary)
        {
            if (auto external = std::get_if<ResolveResult::Item::External>(&item.data))
                return ReferencedAsset{External{external->request}};
            if (auto resolved = std::get_if<ResolveResult::Item::Module>(&item.data))
                if (auto chunkable = std::dynamic_pointer_cast<const ChunkableModule>(resolved->module))
                    return ReferencedAsset{Internal{std::move(chunkable)}};
            // Ignored and unresolvable entries are skipped
        }
        return ReferencedAsset{};
    }

    std::optional<std::string> ReferencedAsset::ident() const
    {
        if (auto internal = std::get_if<Internal>(&data))
            return identForModule(*internal->module);
        if (auto external = std::get_if<External>(&data))
            return identForExternal(external->request);
        return std::nullopt;
    }

    std::string identForModule(const ChunkableModule &module)
    {
        return mangle("imported module " + module.ident());
    }

    std::string identForExternal(const std::string &request)
    {
        return mangle("external " + request);
    }
}
