#include <CLI/CLI.hpp>
#include <Compiler.hpp>
#include <Log.hpp>
#include <Manifest.hpp>
#include <ModuleGraph.hpp>
#include <ResolveCache.hpp>
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>

int main(int argc, char **argv)
{
    using namespace esmc;
    auto start = std::chrono::high_resolution_clock::now();
    std::string manifestPath;
    unsigned loglvl = 1;
    bool noAsyncInfo = false;
    bool printAsync = false;
    Options options;

    CLI::App app{"Hoists import bindings and async dependency handling into ecmascript modules"};
    app.add_option("-f,--file,manifest", manifestPath, "Module graph manifest")->check(CLI::ExistingFile)->required();
    app.add_option("-l,--log-level", loglvl, "Verbosity of the output (0-3)")->check(CLI::Range(0, 3));
    app.add_option("-m,--module", options.only, "Only print these modules");
    app.add_flag("--no-async-info", noAsyncInfo, "Compile without a graph-wide async module set");
    app.add_flag("--print-async", printAsync, "Report async modules and wrapper decisions")->excludes("--no-async-info");
    CLI11_PARSE(app, argc, argv);
    options.asyncModules = !noAsyncInfo;

    auto log = Logger::console(loglvl);
    try
    {
        std::ifstream file{manifestPath};
        std::stringstream source;
        source << file.rdbuf();
        auto manifest = parseManifest(source.str(), manifestPath, log);
        auto graph = buildGraph(manifest, log);
        ResolveCache resolver{graph->resolver, log};

        auto compiled = compile(*graph, resolver, options, log);
        if (printAsync)
        {
            std::cout << "// async modules:";
            for (auto &module : compiled)
                if (module.async)
                    std::cout << ' ' << module.path;
            std::cout << "\n\n";
        }
        for (auto &module : compiled)
        {
            std::cout << "// " << module.path << '\n'
                      << module.code;
            if (printAsync)
            {
                std::cout << "// async: " << (module.async ? "yes" : "no") << ", self async: " << (module.selfAsync ? "yes" : "no");
                if (module.asyncOptions)
                    std::cout << ", async wrapper, top level await: " << (module.asyncOptions->hasTopLevelAwait ? "yes" : "no");
                std::cout << '\n';
            }
            std::cout << '\n';
        }

        auto stats = resolver.stats();
        log.print(Logger::Debug, "resolve cache: {} hits, {} misses", stats.hits, stats.misses);
    }
    catch (const std::exception &e)
    {
        log << Logger::Error << e.what() << '\n';
        return 1;
    }

    auto end = std::chrono::high_resolution_clock::now();
    log << Logger::Info << "Finished in " << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() << "ms\n";
    return 0;
}
