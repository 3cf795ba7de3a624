#pragma once
#include <Node.hpp>
#include <functional>
#include <string>
#include <vector>

namespace esmc
{
    // Deferred edits to one program. Producing a CodeGeneration has no side effects, the visitors run later,
    // once, in a single pass owned by whoever rewrites the program.
    struct CodeGeneration
    {
        using Visitor = std::function<void(Program &)>;
        std::vector<Visitor> visitors{};

        bool empty() const { return visitors.empty(); }
    };

    // Runs the visitors in order: generations first to last, visitors within a generation first to last.
    void applyCodeGeneration(Program &program, const std::vector<CodeGeneration> &generations);

    // (() => { const e = new Error("Cannot find module '<request>'"); e.code = "MODULE_NOT_FOUND"; throw e; })()
    Node throwModuleNotFoundExpr(const std::string &request);
}
