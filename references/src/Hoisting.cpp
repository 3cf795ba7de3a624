#include <Hoisting.hpp>
#include <MagicIdentifier.hpp>
#include <algorithm>

namespace esmc
{
    Node hoistingMarker()
    {
        return Node::exprStmt(Node::string(hoistingLocation()));
    }

    bool isHoistingMarker(const Node &item)
    {
        if (item.type != Node::Type::ExprStmt || item.children.size() != 1)
            return false;
        auto &expr = item.children[0];
        return expr.type == Node::Type::LiteralS && expr.text() == hoistingLocation();
    }

    void insertHoistedStmt(Program &program, Node stmt)
    {
        auto &body = program.body;
        auto marker = std::find_if(body.begin(), body.end(), isHoistingMarker);
        switch (program.kind)
        {
        case Program::Kind::Module:
            if (marker == body.end())
            {
                body.insert(body.begin(), {std::move(stmt), hoistingMarker()});
                return;
            }
            // Only statements can match, import/export declarations never do
            if (std::none_of(body.begin(), marker, [&stmt](const Node &item)
                             { return item.type != Node::Type::ModuleDecl && item == stmt; }))
                body.insert(marker, std::move(stmt));
            return;
        case Program::Kind::Script:
            if (marker == body.end())
            {
                body.insert(body.begin(), hoistingMarker());
                body.insert(body.begin(), std::move(stmt));
                return;
            }
            body.insert(marker, std::move(stmt));
            return;
        }
    }
}
