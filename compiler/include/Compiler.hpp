#pragma once
#include <AsyncModule.hpp>
#include <Log.hpp>
#include <ModuleGraph.hpp>
#include <optional>
#include <string>
#include <vector>

namespace esmc
{
    struct Options
    {
        // Supply a graph-wide async set. Without one no module gets async wrapping or dependency handling.
        bool asyncModules = true;
        // Paths of the modules to compile, all if empty
        std::vector<std::string> only{};
    };

    struct CompiledModule
    {
        std::string path;
        Program program;
        std::string code;
        bool selfAsync = false;
        // Member of the graph wide async set, always false if async modules are off
        bool async = false;
        // Input for choosing the async module wrapper, none if async modules are off
        std::optional<AsyncModuleOptions> asyncOptions;
    };

    // Fixed point over the whole graph: a module is async if it is self async or imports an async module
    // through a reference that inherits async-ness.
    AsyncModuleInfo computeAsyncModules(const ModuleGraph &graph, const Resolver &resolver, Logger &log);

    // Rewrites every module: hoisted imports first, then the async dependency handler.
    std::vector<CompiledModule> compile(const ModuleGraph &graph, const Resolver &resolver, const Options &options, Logger &log);
}
