#include <MagicIdentifier.hpp>
#include <fmt/core.h>
#include <cstdint>

namespace esmc
{
    static constexpr std::string_view prefix = "__TURBOPACK__";
    static constexpr std::string_view suffix = "__";

    // Decodes the code point starting at pos and advances pos past it.
    // Malformed sequences are taken byte by byte so that every input still maps to some output.
    static uint32_t nextCodePoint(std::string_view str, size_t &pos)
    {
        auto lead = static_cast<unsigned char>(str[pos]);
        size_t length = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2
                                      : (lead >> 4) == 0xe   ? 3
                                      : (lead >> 3) == 0x1e  ? 4
                                                             : 0;
        if (!length || pos + length > str.size())
        {
            pos++;
            return lead;
        }
        if (length == 1)
        {
            pos++;
            return lead;
        }
        uint32_t cp = lead & (0x7f >> length);
        for (size_t i = 1; i < length; i++)
        {
            auto c = static_cast<unsigned char>(str[pos + i]);
            if ((c & 0xc0) != 0x80)
            {
                pos++;
                return lead;
            }
            cp = (cp << 6) | (c & 0x3f);
        }
        pos += length;
        return cp;
    }

    static bool isPlain(uint32_t c)
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    std::string mangle(std::string_view label)
    {
        std::string result{prefix};
        result.reserve(prefix.size() + label.size() * 2 + suffix.size());
        for (size_t pos = 0; pos < label.size();)
        {
            auto c = nextCodePoint(label, pos);
            if (isPlain(c))
                result += static_cast<char>(c);
            else if (c == ' ')
                result += "__";
            else if (c == '_' && result.back() != '_')
                result += '_';
            else
                // Each escaped code point gets its own $...$ group, so runs of escapes stay unambiguous
                result += fmt::format("${:x}$", c);
        }
        result += suffix;
        return result;
    }

    const std::string &hoistingLocation()
    {
        static const std::string location = mangle("ecmascript hoisting location");
        return location;
    }
}
