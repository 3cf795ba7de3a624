#include <ImportReference.hpp>
#include <Errors.hpp>
#include <Hoisting.hpp>
#include <algorithm>

namespace esmc
{
    ImportAnnotations::ImportAnnotations(std::vector<std::pair<std::string, std::string>> entries_)
    {
        for (auto &[key, value] : entries_)
            set(std::move(key), std::move(value));
    }

    void ImportAnnotations::set(std::string key, std::string value)
    {
        auto it = std::find_if(m_entries.begin(), m_entries.end(), [&key](const auto &entry)
                               { return entry.first == key; });
        if (it != m_entries.end())
            it->second = std::move(value);
        else
            m_entries.emplace_back(std::move(key), std::move(value));
    }

    std::optional<std::string_view> ImportAnnotations::get(std::string_view key) const
    {
        for (auto &[k, v] : m_entries)
            if (k == key)
                return std::string_view{v};
        return std::nullopt;
    }

    std::string ImportAnnotations::toString() const
    {
        if (m_entries.empty())
            return "{}";
        std::string result = "{ ";
        for (size_t i = 0; i < m_entries.size(); i++)
        {
            if (i)
                result += ", ";
            result += m_entries[i].first + ": " + m_entries[i].second;
        }
        return result + " }";
    }

    ImportReference::ImportReference(ResolveOrigin origin_, Request request_, ImportAnnotations annotations_,
                                     std::optional<IssueSource> issueSource_, std::optional<std::string> exportName_,
                                     bool importExternals_)
        : m_origin(std::move(origin_)), m_request(std::move(request_)), m_annotations(std::move(annotations_)),
          m_issueSource(std::move(issueSource_)), m_exportName(std::move(exportName_)), m_importExternals(importExternals_)
    {
    }

    ResolveOrigin ImportReference::effectiveOrigin() const
    {
        if (auto transition = m_annotations.transition())
            return m_origin.withTransition(std::string{*transition});
        return m_origin;
    }

    ReferenceSubType ImportReference::subType() const
    {
        return ReferenceSubType{m_exportName};
    }

    ResolveResult ImportReference::resolveReference(const Resolver &resolver) const
    {
        return resolver.resolve(effectiveOrigin(), m_request, subType());
    }

    ReferencedAsset ImportReference::referencedAsset(const Resolver &resolver) const
    {
        return ReferencedAsset::fromResolveResult(resolveReference(resolver));
    }

    std::pair<ReferencedAsset, std::optional<std::string>> ImportReference::classifyAndIdentify(const Resolver &resolver) const
    {
        auto asset = referencedAsset(resolver);
        auto ident = asset.ident();
        return {std::move(asset), std::move(ident)};
    }

    ChunkingPolicy ImportReference::chunkingPolicy() const
    {
        auto chunkingType = m_annotations.chunkingType();
        if (!chunkingType || *chunkingType == "parallel")
            return ChunkingPolicy::ParallelInheritAsync;
        if (*chunkingType == "none")
            return ChunkingPolicy::Excluded;
        throw ConfigError::unknownChunkingType(std::string{*chunkingType});
    }

    static Node moduleIdLiteral(const ModuleId &id)
    {
        if (auto str = std::get_if<std::string>(&id))
            return Node::string(*str);
        return Node::number(std::get<uint32_t>(id));
    }

    static CodeGeneration::Visitor hoist(Node stmt)
    {
        return [stmt = std::move(stmt)](Program &program)
        { insertHoistedStmt(program, stmt); };
    }

    CodeGeneration ImportReference::codeGeneration(const Resolver &resolver, const ChunkingContext &chunkingContext) const
    {
        CodeGeneration generation;
        auto policy = chunkingPolicy();
        auto resolved = resolveReference(resolver);

        // Fail at runtime, when the import is evaluated, not now
        if (resolved.isUnresolvable())
        {
            generation.visitors.push_back(hoist(Node::exprStmt(throwModuleNotFoundExpr(m_request.toString()))));
            return generation;
        }

        if (policy == ChunkingPolicy::Excluded)
            return generation;

        auto asset = ReferencedAsset::fromResolveResult(resolved);
        auto ident = asset.ident();
        if (!ident)
            return generation;

        if (auto internal = std::get_if<ReferencedAsset::Internal>(&asset.data))
        {
            auto id = chunkingContext.chunkItemId(*chunkingContext.chunkItem(internal->module));
            generation.visitors.push_back(hoist(Node::varDecl(
                "var", Node::ident(*ident),
                Node::call(Node::ident("__turbopack_import__"), {moduleIdLiteral(id)}))));
        }
        else if (auto external = std::get_if<ReferencedAsset::External>(&asset.data))
        {
            if (!chunkingContext.environment().supportsCommonJsExternals)
                throw UnsupportedFeature::externalModules(external->request);
            // An ESM external would be more accurate, the runtime only offers these two
            auto init = m_importExternals
                            ? Node::call(Node::ident("__turbopack_external_import__"), {Node::string(external->request)})
                            : Node::call(Node::ident("__turbopack_external_require__"), {Node::string(external->request), Node::ident("true")});
            generation.visitors.push_back(hoist(Node::varDecl("var", Node::ident(*ident), std::move(init))));
        }
        return generation;
    }

    std::string ImportReference::toString() const
    {
        return "import " + m_request.toString() + ' ' + m_annotations.toString();
    }
}
