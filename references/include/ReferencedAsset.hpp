#pragma once
#include <Resolve.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace esmc
{
    // What an import points at, as far as code generation is concerned.
    struct ReferencedAsset
    {
        // A module bundled into the output
        struct Internal
        {
            std::shared_ptr<const ChunkableModule> module;
            bool operator==(const Internal &other) const { return module == other.module; }
        };
        // A module left to the host's module system
        struct External
        {
            std::string request;
            bool operator==(const External &other) const = default;
        };
        // Ignored, or resolved to something that cannot be placed in a chunk
        struct Unclassified
        {
            bool operator==(const Unclassified &) const = default;
        };

        std::variant<Unclassified, Internal, External> data{};

        // Takes the first entry that is external or a chunkable module, in resolver order.
        // Later keyed entries are not considered even if they would match.
        static ReferencedAsset fromResolveResult(const ResolveResult &result);

        // Mangled name of the binding the referenced module is imported into, none if Unclassified
        std::optional<std::string> ident() const;

        bool isInternal() const { return std::holds_alternative<Internal>(data); }
        bool isExternal() const { return std::holds_alternative<External>(data); }

        bool operator==(const ReferencedAsset &other) const = default;
    };

    std::string identForModule(const ChunkableModule &module);
    std::string identForExternal(const std::string &request);
}
