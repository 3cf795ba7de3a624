#pragma once
#include <Node.hpp>
#include <string>

namespace esmc
{
    // Prints a node back to source text. The output of the synthesized statements is part of the runtime contract,
    // so the format is fixed: single spaces around binary tokens, ", " between list elements, double quoted strings.
    std::string emit(const Node &node);

    // One body item per line.
    std::string emit(const Program &program);

    // Double quoted, JSON style escapes.
    std::string quoteString(const std::string &str);
}
