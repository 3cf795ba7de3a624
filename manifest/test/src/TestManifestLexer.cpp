#include <catch2/catch_test_macros.hpp>
#include <ManifestLexer.hpp>
#include <sstream>

using namespace esmc;

namespace
{
    std::vector<Token::Type> types(const std::vector<Token> &tokens)
    {
        std::vector<Token::Type> result;
        for (auto &token : tokens)
            result.push_back(token.type);
        return result;
    }
}

SCENARIO("Tokenizing manifest lines")
{
    auto log = Logger::silent();

    GIVEN("An import line")
    {
        auto tokens = tokenize(R"(import ./a -> module src/a.js, external "node:fs" chunking-type=none)", 3, log);
        REQUIRE(tokens);
        THEN("Directive, words, separators and the string are recognized")
        {
            REQUIRE(types(*tokens) == std::vector<Token::Type>{Token::Type::import_, Token::Type::word, Token::Type::arrow, Token::Type::word,
                                                               Token::Type::word, Token::Type::comma, Token::Type::word, Token::Type::string_literal,
                                                               Token::Type::word, Token::Type::assign, Token::Type::word, Token::Type::eol});
            REQUIRE((*tokens)[1].text() == "./a");
            REQUIRE((*tokens)[4].text() == "src/a.js");
            REQUIRE((*tokens)[7].text() == "node:fs");
        }
        THEN("Every token carries the line number")
        {
            for (auto &token : *tokens)
                REQUIRE(token.line == 3);
        }
    }

    GIVEN("Numbers")
    {
        auto tokens = tokenize("module m.js id=42", 1, log);
        REQUIRE(tokens);
        THEN("Whole numeric words become int literals")
        {
            REQUIRE((*tokens)[4].type == Token::Type::int_literal);
            REQUIRE(std::get<int64_t>((*tokens)[4].value) == 42);
        }
        THEN("Words starting with digits stay words")
        {
            auto other = tokenize("module 1.js", 1, log);
            REQUIRE(other);
            REQUIRE((*other)[1].type == Token::Type::word);
            REQUIRE((*other)[1].text() == "1.js");
        }
    }

    GIVEN("Directive names after the first word")
    {
        auto tokens = tokenize("import module -> module module", 1, log);
        REQUIRE(tokens);
        THEN("They are plain words")
        {
            REQUIRE(types(*tokens) == std::vector<Token::Type>{Token::Type::import_, Token::Type::word, Token::Type::arrow, Token::Type::word,
                                                               Token::Type::word, Token::Type::eol});
        }
    }

    GIVEN("Escapes in strings")
    {
        auto tokens = tokenize(R"(import "a \"b\"\\c" -> ignore)", 1, log);
        REQUIRE(tokens);
        THEN("They are decoded")
        {
            REQUIRE((*tokens)[1].text() == "a \"b\"\\c");
        }
    }

    GIVEN("Malformed strings")
    {
        std::stringstream errors;
        log.setStream(Logger::Error, &errors);
        THEN("An unterminated string is reported")
        {
            REQUIRE_FALSE(tokenize(R"(import "abc -> ignore)", 7, log));
            REQUIRE(errors.str().find("Unterminated string in manifest line 7") != std::string::npos);
        }
        THEN("An unknown escape is reported")
        {
            REQUIRE_FALSE(tokenize(R"(import "a\qb" -> ignore)", 2, log));
            REQUIRE(errors.str().find("Invalid escape sequence") != std::string::npos);
        }
    }

    GIVEN("An empty line")
    {
        auto tokens = tokenize("   ", 1, log);
        THEN("Only the end of line is produced")
        {
            REQUIRE(tokens);
            REQUIRE(types(*tokens) == std::vector<Token::Type>{Token::Type::eol});
        }
    }
}
