#include <CodeGeneration.hpp>

namespace esmc
{
    void applyCodeGeneration(Program &program, const std::vector<CodeGeneration> &generations)
    {
        for (auto &generation : generations)
            for (auto &visitor : generation.visitors)
                visitor(program);
    }

    Node throwModuleNotFoundExpr(const std::string &request)
    {
        auto error = Node::ident("e");
        auto body = Node::block({
            Node::varDecl("const", error, Node::construct(Node::ident("Error"), {Node::string("Cannot find module '" + request + "'")})),
            Node::exprStmt(Node::assign(Node::member(error, "code"), Node::string("MODULE_NOT_FOUND"))),
            Node::throw_(error),
        });
        return Node::call(Node::paren(Node::arrow(std::move(body))), {});
    }
}
