#include <AsyncModule.hpp>
#include <Hoisting.hpp>
#include <algorithm>
#include <unordered_set>

namespace esmc
{
    AsyncModule::AsyncModule(std::shared_ptr<const ChunkableModule> module_, const std::vector<std::shared_ptr<const ImportReference>> &references_,
                             bool hasTopLevelAwait_, bool importExternals_)
        : m_module(std::move(module_)), m_hasTopLevelAwait(hasTopLevelAwait_), m_importExternals(importExternals_)
    {
        std::unordered_set<ImportReference> seen;
        for (auto &reference : references_)
            if (seen.insert(*reference).second)
                m_references.push_back(reference);
    }

    bool AsyncModule::isSelfAsync(const Resolver &resolver) const
    {
        if (m_hasTopLevelAwait)
            return true;
        return m_importExternals && std::any_of(m_references.begin(), m_references.end(), [&resolver](const auto &reference)
                                                { return reference->referencedAsset(resolver).isExternal(); });
    }

    std::vector<std::string> AsyncModule::asyncIdents(const Resolver &resolver, const ChunkingContext &chunkingContext, const AsyncModuleInfo &asyncModuleInfo) const
    {
        std::vector<std::string> idents;
        std::unordered_set<std::string> seen;
        for (auto &reference : m_references)
        {
            auto asset = reference->referencedAsset(resolver);
            bool async = false;
            if (asset.isExternal())
                async = m_importExternals;
            else if (auto internal = std::get_if<ReferencedAsset::Internal>(&asset.data))
                async = asyncModuleInfo.contains(*chunkingContext.chunkItem(internal->module));
            if (!async)
                continue;
            if (auto ident = asset.ident(); ident && seen.insert(*ident).second)
                idents.push_back(std::move(*ident));
        }
        return idents;
    }

    std::optional<AsyncModuleOptions> AsyncModule::moduleOptions(const AsyncModuleInfo *asyncModuleInfo) const
    {
        if (!asyncModuleInfo)
            return std::nullopt;
        // Only the module's own await decides this, importing externals as ESM does not
        return AsyncModuleOptions{.hasTopLevelAwait = m_hasTopLevelAwait};
    }

    CodeGeneration AsyncModule::codeGeneration(const Resolver &resolver, const ChunkingContext &chunkingContext, const AsyncModuleInfo *asyncModuleInfo) const
    {
        CodeGeneration generation;
        if (!asyncModuleInfo)
            return generation;
        auto idents = asyncIdents(resolver, chunkingContext, *asyncModuleInfo);
        if (!idents.empty())
            generation.visitors.push_back([idents = std::move(idents)](Program &program)
                                          { addAsyncDependencyHandler(program, idents); });
        return generation;
    }

    void addAsyncDependencyHandler(Program &program, const std::vector<std::string> &idents)
    {
        static const std::string dependencies = "__turbopack_async_dependencies__";
        std::vector<Node> elements;
        elements.reserve(idents.size());
        for (auto &ident : idents)
            elements.push_back(Node::ident(ident));

        insertHoistedStmt(program, Node::varDecl("var", Node::ident(dependencies),
                                                 Node::call(Node::ident("__turbopack_handle_async_dependencies__"), {Node::array(elements)})));

        // Only await if the handler actually returned a promise
        auto resolved = Node::conditional(Node::member(Node::ident(dependencies), "then"),
                                          Node::call(Node::paren(Node::await(Node::ident(dependencies))), {}),
                                          Node::ident(dependencies));
        insertHoistedStmt(program, Node::exprStmt(Node::assign(Node::arrayPattern(std::move(elements)), std::move(resolved))));
    }
}
