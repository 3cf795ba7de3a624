#include <ManifestLexer.hpp>
#include <cctype>
#include <charconv>

namespace esmc
{
    std::string Token::toString() const
    {
        switch (type)
        {
        case Type::word:
            return "word " + text();
        case Type::string_literal:
            return "string \"" + text() + '"';
        case Type::int_literal:
            return "int " + std::to_string(std::get<int64_t>(value));
        case Type::arrow:
            return "->";
        case Type::comma:
            return ",";
        case Type::assign:
            return "=";
        case Type::environment_:
            return "environment";
        case Type::module_:
            return "module";
        case Type::import_:
            return "import";
        case Type::body_:
            return "body";
        case Type::eol:
            return "end of line";
        }
        return "unknown";
    }

    static bool isWordChar(char c)
    {
        return !std::isspace(static_cast<unsigned char>(c)) && c != ',' && c != '=' && c != '"';
    }

    static std::optional<char> handleEscapedChar(char c)
    {
        switch (c)
        {
        case 'n':
            return '\n';
        case 't':
            return '\t';
        case '\\':
            return '\\';
        case '"':
            return '"';
        default:
            return std::nullopt;
        }
    }

    std::optional<std::vector<Token>> tokenize(std::string_view line, uint64_t lineNumber, Logger &log)
    {
        std::vector<Token> tokens;
        size_t i = 0;
        while (i < line.size())
        {
            char c = line[i];
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                i++;
                continue;
            }
            switch (c)
            {
            case ',':
                tokens.push_back({Token::Type::comma, {}, lineNumber});
                i++;
                continue;
            case '=':
                tokens.push_back({Token::Type::assign, {}, lineNumber});
                i++;
                continue;
            case '"':
            {
                std::string str;
                for (i++;; i++)
                {
                    if (i >= line.size())
                    {
                        log << Logger::Error << "Unterminated string in manifest line " << lineNumber << '\n';
                        return std::nullopt;
                    }
                    if (line[i] == '"')
                        break;
                    if (line[i] == '\\')
                    {
                        auto escaped = i + 1 < line.size() ? handleEscapedChar(line[i + 1]) : std::nullopt;
                        if (!escaped)
                        {
                            log << Logger::Error << "Invalid escape sequence in manifest line " << lineNumber << '\n';
                            return std::nullopt;
                        }
                        str += *escaped;
                        i++;
                        continue;
                    }
                    str += line[i];
                }
                i++;
                tokens.push_back({Token::Type::string_literal, std::move(str), lineNumber});
                continue;
            }
            default:
                break;
            }

            size_t begin = i;
            while (i < line.size() && isWordChar(line[i]))
                i++;
            auto word = line.substr(begin, i - begin);
            if (word == "->")
            {
                tokens.push_back({Token::Type::arrow, {}, lineNumber});
                continue;
            }
            if (tokens.empty())
                if (auto it = directives.find(word); it != directives.end())
                {
                    tokens.push_back({it->second, {}, lineNumber});
                    continue;
                }
            int64_t number;
            if (auto [end, ec] = std::from_chars(word.data(), word.data() + word.size(), number); ec == std::errc{} && end == word.data() + word.size())
                tokens.push_back({Token::Type::int_literal, number, lineNumber});
            else
                tokens.push_back({Token::Type::word, std::string{word}, lineNumber});
        }
        tokens.push_back({Token::Type::eol, {}, lineNumber});
        return tokens;
    }
}
