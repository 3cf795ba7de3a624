#pragma once
#include <Node.hpp>

namespace esmc
{
    // The string literal statement marking where hoisted statements go.
    Node hoistingMarker();
    bool isHoistingMarker(const Node &item);

    // Inserts stmt right before the hoisting marker, creating the marker at the top of the body if there is none.
    // In module bodies a statement equal to one already hoisted is not inserted again. Script bodies do not check.
    void insertHoistedStmt(Program &program, Node stmt);
}
