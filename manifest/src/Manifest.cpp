#include <Manifest.hpp>
#include <ManifestLexer.hpp>
#include <Errors.hpp>
#include <fmt/core.h>

namespace esmc
{
    const Manifest::Module *Manifest::find(std::string_view path) const
    {
        for (auto &module : modules)
            if (module.path == path)
                return &module;
        return nullptr;
    }

    namespace
    {
        // Cursor over the tokens of one line
        struct LineParser
        {
            const std::vector<Token> &tokens;
            const std::string &name;
            size_t pos = 0;

            const Token &peek() const { return tokens[pos]; }
            bool at(Token::Type type) const { return tokens[pos].type == type; }

            [[noreturn]] void fail(const std::string &message) const
            {
                throw ConfigError(fmt::format("{}:{}: {}", name, peek().line, message));
            }

            // Word, string or number, all taken as text
            std::string text(const char *what)
            {
                auto &token = peek();
                switch (token.type)
                {
                case Token::Type::word:
                case Token::Type::string_literal:
                    pos++;
                    return token.text();
                case Token::Type::int_literal:
                    pos++;
                    return std::to_string(std::get<int64_t>(token.value));
                default:
                    fail(fmt::format("expected {}, got {}", what, token.toString()));
                }
            }

            void expect(Token::Type type, const char *what)
            {
                if (!at(type))
                    fail(fmt::format("expected {}, got {}", what, peek().toString()));
                pos++;
            }

            // key=value, or a bare flag when no '=' follows
            std::pair<std::string, std::optional<Token>> option()
            {
                auto key = text("option");
                if (!at(Token::Type::assign))
                    return {std::move(key), std::nullopt};
                pos++;
                auto &value = peek();
                if (value.type != Token::Type::word && value.type != Token::Type::string_literal && value.type != Token::Type::int_literal)
                    fail(fmt::format("expected value for {}, got {}", key, value.toString()));
                pos++;
                return {std::move(key), value};
            }
        };

        std::string optionText(const Token &token)
        {
            if (token.type == Token::Type::int_literal)
                return std::to_string(std::get<int64_t>(token.value));
            return token.text();
        }

        void parseEnvironment(LineParser &p, Manifest &manifest)
        {
            manifest.environment.name = p.text("environment name");
            while (!p.at(Token::Type::eol))
            {
                auto [key, value] = p.option();
                if (key != "externals" || !value)
                    p.fail("unknown environment option " + key);
                auto text = optionText(*value);
                if (text != "on" && text != "off")
                    p.fail("externals must be on or off, got " + text);
                manifest.environment.supportsCommonJsExternals = text == "on";
            }
        }

        void parseModule(LineParser &p, Manifest &manifest)
        {
            Manifest::Module module;
            module.line = p.peek().line;
            module.path = p.text("module path");
            if (manifest.find(module.path))
                p.fail("duplicate module " + module.path);
            while (!p.at(Token::Type::eol))
            {
                auto [key, value] = p.option();
                if (key == "id" && value)
                {
                    if (value->type == Token::Type::int_literal)
                    {
                        auto n = std::get<int64_t>(value->value);
                        if (n < 0 || n > UINT32_MAX)
                            p.fail(fmt::format("module id {} out of range", n));
                        module.id = static_cast<uint32_t>(n);
                    }
                    else
                        module.id = value->text();
                }
                else if (value)
                    p.fail("unknown module option " + key);
                else if (key == "tla")
                    module.topLevelAwait = true;
                else if (key == "import-externals")
                    module.importExternals = true;
                else if (key == "script")
                    module.script = true;
                else if (key == "asset")
                    module.asset = true;
                else
                    p.fail("unknown module flag " + key);
            }
            manifest.modules.push_back(std::move(module));
        }

        Manifest::Target parseTarget(LineParser &p)
        {
            auto kind = p.text("import target");
            if (kind == "module")
                return {Manifest::Target::Kind::Module, p.text("module path")};
            if (kind == "external")
                return {Manifest::Target::Kind::External, p.text("external request")};
            if (kind == "ignore")
                return {Manifest::Target::Kind::Ignore};
            if (kind == "unresolvable")
                return {Manifest::Target::Kind::Unresolvable};
            p.fail("unknown import target " + kind);
        }

        void parseImport(LineParser &p, Manifest &manifest)
        {
            if (manifest.modules.empty())
                p.fail("import outside of a module");
            Manifest::Import import;
            import.line = p.peek().line;
            import.specifier = p.text("import specifier");
            p.expect(Token::Type::arrow, "->");
            import.targets.push_back(parseTarget(p));
            while (p.at(Token::Type::comma))
            {
                p.pos++;
                import.targets.push_back(parseTarget(p));
            }
            while (!p.at(Token::Type::eol))
            {
                auto [key, value] = p.option();
                if (!value)
                    p.fail("expected value for import option " + key);
                auto text = optionText(*value);
                if (key == "chunking-type")
                    import.annotations.set(std::string{ImportAnnotations::chunkingTypeKey}, std::move(text));
                else if (key == "transition")
                    import.annotations.set(std::string{ImportAnnotations::transitionKey}, std::move(text));
                else if (key == "part")
                    import.part = std::move(text);
                else
                    p.fail("unknown import option " + key);
            }
            manifest.modules.back().imports.push_back(std::move(import));
        }
    }

    Manifest parseManifest(std::string_view source, std::string name, Logger &log)
    {
        Manifest manifest;
        manifest.name = std::move(name);
        uint64_t lineNumber = 0;
        while (!source.empty())
        {
            auto newline = source.find('\n');
            auto line = source.substr(0, newline);
            source.remove_prefix(newline == std::string_view::npos ? source.size() : newline + 1);
            lineNumber++;

            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string_view::npos || line[first] == '#')
                continue;
            line.remove_prefix(first);

            // Body text is kept verbatim, it is not tokenized
            if (line.starts_with("body ") || line.starts_with("body\t"))
            {
                if (manifest.modules.empty())
                    throw ConfigError(fmt::format("{}:{}: body outside of a module", manifest.name, lineNumber));
                auto text = line.substr(5);
                while (!text.empty() && (text.back() == '\r' || text.back() == ' '))
                    text.remove_suffix(1);
                manifest.modules.back().body.emplace_back(text);
                continue;
            }

            auto tokens = tokenize(line, lineNumber, log);
            if (!tokens)
                throw ConfigError(fmt::format("{}:{}: failed to tokenize line", manifest.name, lineNumber));
            LineParser p{*tokens, manifest.name};
            auto directive = p.peek().type;
            p.pos++;
            switch (directive)
            {
            case Token::Type::environment_:
                parseEnvironment(p, manifest);
                break;
            case Token::Type::module_:
                parseModule(p, manifest);
                break;
            case Token::Type::import_:
                parseImport(p, manifest);
                break;
            default:
                p.pos--;
                p.fail("expected environment, module, import or body, got " + p.peek().toString());
            }
            p.expect(Token::Type::eol, "end of line");
        }
        log.print(Logger::Info, "Loaded {} modules from {}", manifest.modules.size(), manifest.name);
        return manifest;
    }
}
