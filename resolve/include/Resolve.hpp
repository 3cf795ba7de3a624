#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace esmc
{
    // Anything the resolver can hand back. Identity is the ident string.
    class Module
    {
    public:
        virtual ~Module() = default;
        virtual std::string ident() const = 0;
    };

    // Capability: the module can be placed into an ecmascript chunk. Checked by downcasting a resolved Module.
    class ChunkableModule : public Module
    {
    };

    // The literal import specifier together with the way it has to be resolved.
    struct Request
    {
        enum class Kind
        {
            Relative, // ./a, ../a
            Absolute, // /a
            Module,   // fs, react/jsx-runtime, @scope/pkg
            Unknown,  // Empty or otherwise unclassifiable
        };
        std::string specifier;
        Kind kind = Kind::Unknown;

        static Request parse(std::string specifier);
        const std::string &toString() const { return specifier; }

        bool operator==(const Request &other) const = default;
    };

    // Where a request is resolved from. A transition switches the resolve options used for the request.
    struct ResolveOrigin
    {
        std::string path;
        std::optional<std::string> transition{};

        ResolveOrigin withTransition(std::string name) const
        {
            return ResolveOrigin{path, std::move(name)};
        }

        bool operator==(const ResolveOrigin &other) const = default;
    };

    // Import of the whole module, or only of the part that provides one export.
    struct ReferenceSubType
    {
        std::optional<std::string> part{};

        bool isImportPart() const { return part.has_value(); }
        std::string toString() const { return part ? "import part " + *part : "import"; }

        bool operator==(const ReferenceSubType &other) const = default;
    };

    struct ResolveResult
    {
        struct Item
        {
            struct Module
            {
                std::shared_ptr<const esmc::Module> module;
                bool operator==(const Module &other) const { return module == other.module; }
            };
            // Left to the host's module system, carries the request to use at runtime
            struct External
            {
                std::string request;
                bool operator==(const External &other) const = default;
            };
            struct Ignore
            {
                bool operator==(const Ignore &) const = default;
            };
            struct Unresolvable
            {
                bool operator==(const Unresolvable &) const = default;
            };
            std::variant<Module, External, Ignore, Unresolvable> data;

            bool operator==(const Item &other) const = default;
        };

        // Ordered by key as supplied by the resolver. Usually a single entry with an empty key.
        std::vector<std::pair<std::string, Item>> primary{};

        bool isUnresolvable() const;

        static ResolveResult module(std::shared_ptr<const esmc::Module> module);
        static ResolveResult external(std::string request);
        static ResolveResult ignore();
        static ResolveResult unresolvable();

        bool operator==(const ResolveResult &other) const = default;
    };

    class Resolver
    {
    public:
        virtual ~Resolver() = default;
        virtual ResolveResult resolve(const ResolveOrigin &origin, const Request &request, const ReferenceSubType &subType) const = 0;
    };
}

namespace esmc
{
    // Mixes hashes the way boost::hash_combine does, plain xor collapses equal fields
    inline size_t hashCombine(size_t seed, size_t value)
    {
        return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
    }
}

namespace std
{
    template <>
    struct hash<esmc::Request>
    {
        size_t operator()(const esmc::Request &request) const
        {
            return esmc::hashCombine(hash<string>()(request.specifier), static_cast<size_t>(request.kind));
        }
    };

    template <>
    struct hash<esmc::ResolveOrigin>
    {
        size_t operator()(const esmc::ResolveOrigin &origin) const
        {
            return esmc::hashCombine(hash<string>()(origin.path), hash<optional<string>>()(origin.transition));
        }
    };

    template <>
    struct hash<esmc::ReferenceSubType>
    {
        size_t operator()(const esmc::ReferenceSubType &subType) const
        {
            return hash<optional<string>>()(subType.part);
        }
    };
}
