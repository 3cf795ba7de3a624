#pragma once
#include <variant>
#include <string>
#include <vector>

namespace esmc
{
    // Just enough of an ECMAScript syntax tree to express the statements this code base synthesizes.
    // Anything that came from the original program and is never inspected is kept as opaque text.
    struct Node
    {
        enum class Type
        {
            Unassigned,

            // Statements
            ExprStmt,   // children[0]: expression
            VarDecl,    // value: "var"|"let"|"const", children: Declarator...
            Declarator, // children[0]: binding (Ident or ArrayPattern), children[1]: initializer if present
            Block,
            Throw,
            Verbatim,   // value: source text of a statement, printed as is
            ModuleDecl, // value: source text of an import/export declaration. Only valid in module bodies

            // Expressions
            Ident,
            LiteralS,
            LiteralN,
            Array,
            ArrayPattern,
            Call,        // children[0]: callee, rest: arguments
            New,         // children[0]: callee, rest: arguments
            Member,      // value: property name, children[0]: object
            Assign,      // children[0]: target, children[1]: value
            Conditional, // test, consequent, alternate
            Await,
            Paren,
            Arrow, // Parameterless, children[0]: body
        };
        Type type = Type::Unassigned;
        std::variant<std::monostate, std::string, double> value = {};
        std::vector<Node> children{};

        // Structural, spans are not tracked so two synthesized statements compare equal when they print equal
        bool operator==(const Node &other) const = default;

        const std::string &text() const { return std::get<std::string>(value); }

        static Node ident(std::string name);
        static Node string(std::string value);
        static Node number(double value);
        static Node exprStmt(Node expr);
        static Node varDecl(std::string kind, Node binding, Node init);
        static Node call(Node callee, std::vector<Node> args);
        static Node construct(Node callee, std::vector<Node> args);
        static Node member(Node object, std::string property);
        static Node assign(Node target, Node value);
        static Node conditional(Node test, Node consequent, Node alternate);
        static Node await(Node expr);
        static Node paren(Node expr);
        static Node arrow(Node body);
        static Node block(std::vector<Node> statements);
        static Node throw_(Node expr);
        static Node array(std::vector<Node> elements);
        static Node arrayPattern(std::vector<Node> elements);
        static Node verbatim(std::string source);
        static Node moduleDecl(std::string source);
    };

    struct Program
    {
        // Module bodies may contain import/export declarations, script bodies only statements
        enum class Kind
        {
            Module,
            Script,
        };
        Kind kind = Kind::Module;
        std::vector<Node> body{};

        bool operator==(const Program &other) const = default;
    };
}
