#pragma once
#include <Chunking.hpp>
#include <CodeGeneration.hpp>
#include <ReferencedAsset.hpp>
#include <Resolve.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace esmc
{
    // The `with { ... }` attributes of an import statement, in source order.
    class ImportAnnotations
    {
    public:
        static constexpr std::string_view transitionKey = "turbopack-transition";
        static constexpr std::string_view chunkingTypeKey = "turbopack-chunking-type";

        ImportAnnotations() = default;
        explicit ImportAnnotations(std::vector<std::pair<std::string, std::string>> entries_);

        // Replaces the value if the key is present already
        void set(std::string key, std::string value);
        std::optional<std::string_view> get(std::string_view key) const;

        std::optional<std::string_view> transition() const { return get(transitionKey); }
        std::optional<std::string_view> chunkingType() const { return get(chunkingTypeKey); }

        const std::vector<std::pair<std::string, std::string>> &entries() const { return m_entries; }
        // { key: value, key: value } or {}
        std::string toString() const;

        bool operator==(const ImportAnnotations &other) const = default;

    private:
        std::vector<std::pair<std::string, std::string>> m_entries;
    };

    enum class ChunkingPolicy
    {
        ParallelInheritAsync, // Placed in the same chunk group, async-ness propagates to the importer
        Excluded,             // Not chunked, no import statement is generated
    };

    // Span of the import in its source file, for diagnostics
    struct IssueSource
    {
        std::string path;
        uint32_t start{};
        uint32_t end{};
        bool operator==(const IssueSource &other) const = default;
    };

    // One static `import` of a module. Immutable after construction and compared field by field,
    // so equal references can share cached results.
    class ImportReference
    {
    public:
        ImportReference(ResolveOrigin origin_, Request request_, ImportAnnotations annotations_ = {},
                        std::optional<IssueSource> issueSource_ = std::nullopt, std::optional<std::string> exportName_ = std::nullopt,
                        bool importExternals_ = false);

        const ResolveOrigin &origin() const { return m_origin; }
        const Request &request() const { return m_request; }
        const ImportAnnotations &annotations() const { return m_annotations; }
        const std::optional<IssueSource> &issueSource() const { return m_issueSource; }
        const std::optional<std::string> &exportName() const { return m_exportName; }
        bool importExternals() const { return m_importExternals; }

        // The origin with the annotated transition applied
        ResolveOrigin effectiveOrigin() const;
        ReferenceSubType subType() const;

        ResolveResult resolveReference(const Resolver &resolver) const;
        ReferencedAsset referencedAsset(const Resolver &resolver) const;
        std::pair<ReferencedAsset, std::optional<std::string>> classifyAndIdentify(const Resolver &resolver) const;

        // Throws ConfigError for an annotation value other than "parallel" or "none"
        ChunkingPolicy chunkingPolicy() const;

        // Hoisted import statement for the referenced module, or a throwing statement if the request does not resolve.
        // Throws UnsupportedFeature for an external module the chunking context cannot load.
        CodeGeneration codeGeneration(const Resolver &resolver, const ChunkingContext &chunkingContext) const;

        // import <request> <annotations>
        std::string toString() const;

        bool operator==(const ImportReference &other) const = default;

    private:
        ResolveOrigin m_origin;
        Request m_request;
        ImportAnnotations m_annotations;
        std::optional<IssueSource> m_issueSource;
        std::optional<std::string> m_exportName;
        bool m_importExternals;
    };
}

namespace std
{
    template <>
    struct hash<esmc::ImportReference>
    {
        size_t operator()(const esmc::ImportReference &reference) const
        {
            auto seed = hash<esmc::ResolveOrigin>()(reference.origin());
            seed = esmc::hashCombine(seed, hash<esmc::Request>()(reference.request()));
            for (auto &[key, value] : reference.annotations().entries())
                seed = esmc::hashCombine(esmc::hashCombine(seed, hash<string>()(key)), hash<string>()(value));
            if (auto &source = reference.issueSource())
                seed = esmc::hashCombine(esmc::hashCombine(seed, hash<string>()(source->path)), (size_t{source->start} << 32) | source->end);
            seed = esmc::hashCombine(seed, hash<optional<string>>()(reference.exportName()));
            return esmc::hashCombine(seed, reference.importExternals());
        }
    };
}
