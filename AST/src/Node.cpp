#include <Node.hpp>
#include <utility>

namespace esmc
{
    Node Node::ident(std::string name)
    {
        return Node{Type::Ident, std::move(name)};
    }

    Node Node::string(std::string value)
    {
        return Node{Type::LiteralS, std::move(value)};
    }

    Node Node::number(double value)
    {
        return Node{Type::LiteralN, value};
    }

    Node Node::exprStmt(Node expr)
    {
        return Node{Type::ExprStmt, {}, {std::move(expr)}};
    }

    Node Node::varDecl(std::string kind, Node binding, Node init)
    {
        Node declarator{Type::Declarator, {}, {std::move(binding), std::move(init)}};
        return Node{Type::VarDecl, std::move(kind), {std::move(declarator)}};
    }

    Node Node::call(Node callee, std::vector<Node> args)
    {
        Node n{Type::Call, {}, {std::move(callee)}};
        for (auto &arg : args)
            n.children.push_back(std::move(arg));
        return n;
    }

    Node Node::construct(Node callee, std::vector<Node> args)
    {
        auto n = call(std::move(callee), std::move(args));
        n.type = Type::New;
        return n;
    }

    Node Node::member(Node object, std::string property)
    {
        return Node{Type::Member, std::move(property), {std::move(object)}};
    }

    Node Node::assign(Node target, Node value)
    {
        return Node{Type::Assign, {}, {std::move(target), std::move(value)}};
    }

    Node Node::conditional(Node test, Node consequent, Node alternate)
    {
        return Node{Type::Conditional, {}, {std::move(test), std::move(consequent), std::move(alternate)}};
    }

    Node Node::await(Node expr)
    {
        return Node{Type::Await, {}, {std::move(expr)}};
    }

    Node Node::paren(Node expr)
    {
        return Node{Type::Paren, {}, {std::move(expr)}};
    }

    Node Node::arrow(Node body)
    {
        return Node{Type::Arrow, {}, {std::move(body)}};
    }

    Node Node::block(std::vector<Node> statements)
    {
        return Node{Type::Block, {}, std::move(statements)};
    }

    Node Node::throw_(Node expr)
    {
        return Node{Type::Throw, {}, {std::move(expr)}};
    }

    Node Node::array(std::vector<Node> elements)
    {
        return Node{Type::Array, {}, std::move(elements)};
    }

    Node Node::arrayPattern(std::vector<Node> elements)
    {
        return Node{Type::ArrayPattern, {}, std::move(elements)};
    }

    Node Node::verbatim(std::string source)
    {
        return Node{Type::Verbatim, std::move(source)};
    }

    Node Node::moduleDecl(std::string source)
    {
        return Node{Type::ModuleDecl, std::move(source)};
    }
}
