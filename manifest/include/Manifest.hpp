#pragma once
#include <Chunking.hpp>
#include <ImportReference.hpp>
#include <Log.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace esmc
{
    /*
     * Describes a module graph together with what the resolver answers for every import. Line based, '#' starts a comment line.
     *
     *   environment <name> [externals=on|off]
     *   module <path> [tla] [import-externals] [script] [asset] [id=<id>]
     *   import <specifier> -> <target>[, <target>...] [chunking-type=<value>] [transition=<value>] [part=<export>]
     *   body <source text>
     *
     * A target is one of: module <path>, external <request>, ignore, unresolvable.
     * import and body lines belong to the closest module line above them.
     */
    struct Manifest
    {
        struct Target
        {
            enum class Kind
            {
                Module,
                External,
                Ignore,
                Unresolvable,
            };
            Kind kind;
            std::string value{}; // Path or request, empty for ignore/unresolvable
            bool operator==(const Target &other) const = default;
        };

        struct Import
        {
            std::string specifier;
            std::vector<Target> targets;
            ImportAnnotations annotations{};
            std::optional<std::string> part{};
            uint64_t line = 0;
        };

        struct Module
        {
            std::string path;
            bool topLevelAwait = false;
            bool importExternals = false;
            bool script = false;
            bool asset = false; // Not an ecmascript module, only something imports can point at
            std::optional<ModuleId> id{};
            std::vector<Import> imports{};
            std::vector<std::string> body{};
            uint64_t line = 0;
        };

        std::string name; // File name, used for diagnostics
        Environment environment{"browser", true};
        std::vector<Module> modules;

        const Module *find(std::string_view path) const;
    };

    // Throws ConfigError naming the line on malformed input
    Manifest parseManifest(std::string_view source, std::string name, Logger &log);
}
