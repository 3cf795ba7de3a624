#pragma once
#include <string>
#include <string_view>

namespace esmc
{
    // Encodes an arbitrary label into a valid JavaScript identifier of the form __TURBOPACK__<encoded>__.
    // Letters and digits are kept, a space becomes "__", a single '_' is kept and everything else
    // is written as lowercase hex code points between '$' characters. Equal labels give equal identifiers,
    // different labels give different identifiers.
    std::string mangle(std::string_view label);

    // Marker string the hoisting pass looks for. Computed once, read only afterwards.
    const std::string &hoistingLocation();
}
