#pragma once
#include <Log.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace esmc
{
    struct Token
    {
        enum class Type
        {
            word,           // Bare word: paths, specifiers, flags
            string_literal, // "..." for anything containing spaces, commas or '='
            int_literal,
            arrow,  // ->
            comma,  // ,
            assign, // =

            environment_,
            module_,
            import_,
            body_,

            eol,
        };
        Type type;
        std::variant<std::monostate, std::string, int64_t> value = {};
        uint64_t line = 0;

        // Text of a word or string literal
        const std::string &text() const { return std::get<std::string>(value); }
        // For diagnostics only
        std::string toString() const;
    };

    // Only recognized as the first word of a line
    inline const std::unordered_map<std::string_view, Token::Type> directives{
        {"environment", Token::Type::environment_},
        {"module", Token::Type::module_},
        {"import", Token::Type::import_},
        {"body", Token::Type::body_},
    };

    // Tokenizes a single manifest line. Returns nullopt and logs the reason on malformed input.
    std::optional<std::vector<Token>> tokenize(std::string_view line, uint64_t lineNumber, Logger &log);
}
