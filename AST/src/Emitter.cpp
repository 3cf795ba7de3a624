#include <Emitter.hpp>
#include <fmt/core.h>
#include <cmath>
#include <stdexcept>

namespace esmc
{
    std::string quoteString(const std::string &str)
    {
        std::string result;
        result.reserve(str.size() + 2);
        result += '"';
        for (char c : str)
            switch (c)
            {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    result += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else
                    result += c;
            }
        result += '"';
        return result;
    }

    static std::string emitNumber(double value)
    {
        if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9007199254740992.0)
            return fmt::format("{}", static_cast<long long>(value));
        return fmt::format("{}", value);
    }

    static std::string emitList(const std::vector<Node> &nodes, size_t first)
    {
        std::string result;
        for (size_t i = first; i < nodes.size(); i++)
        {
            if (i != first)
                result += ", ";
            result += emit(nodes[i]);
        }
        return result;
    }

    std::string emit(const Node &node)
    {
        switch (node.type)
        {
        case Node::Type::ExprStmt:
            return emit(node.children.at(0)) + ';';
        case Node::Type::VarDecl:
        {
            std::string result = node.text() + ' ';
            for (size_t i = 0; i < node.children.size(); i++)
            {
                if (i)
                    result += ", ";
                result += emit(node.children[i]);
            }
            return result + ';';
        }
        case Node::Type::Declarator:
            if (node.children.size() < 2)
                return emit(node.children.at(0));
            return emit(node.children[0]) + " = " + emit(node.children[1]);
        case Node::Type::Block:
        {
            if (node.children.empty())
                return "{}";
            std::string result = "{ ";
            for (auto &stmt : node.children)
                result += emit(stmt) + ' ';
            return result + '}';
        }
        case Node::Type::Throw:
            return "throw " + emit(node.children.at(0)) + ';';
        case Node::Type::Verbatim:
        case Node::Type::ModuleDecl:
        case Node::Type::Ident:
            return node.text();
        case Node::Type::LiteralS:
            return quoteString(node.text());
        case Node::Type::LiteralN:
            return emitNumber(std::get<double>(node.value));
        case Node::Type::Array:
        case Node::Type::ArrayPattern:
            return '[' + emitList(node.children, 0) + ']';
        case Node::Type::Call:
            return emit(node.children.at(0)) + '(' + emitList(node.children, 1) + ')';
        case Node::Type::New:
            return "new " + emit(node.children.at(0)) + '(' + emitList(node.children, 1) + ')';
        case Node::Type::Member:
            return emit(node.children.at(0)) + '.' + node.text();
        case Node::Type::Assign:
            return emit(node.children.at(0)) + " = " + emit(node.children.at(1));
        case Node::Type::Conditional:
            return emit(node.children.at(0)) + " ? " + emit(node.children.at(1)) + " : " + emit(node.children.at(2));
        case Node::Type::Await:
            return "await " + emit(node.children.at(0));
        case Node::Type::Paren:
            return '(' + emit(node.children.at(0)) + ')';
        case Node::Type::Arrow:
            return "() => " + emit(node.children.at(0));
        case Node::Type::Unassigned:
            break;
        }
        throw std::runtime_error("Cannot emit unassigned node");
    }

    std::string emit(const Program &program)
    {
        std::string result;
        for (auto &item : program.body)
        {
            if (program.kind == Program::Kind::Script && item.type == Node::Type::ModuleDecl)
                throw std::runtime_error("Module declaration in script body: " + item.text());
            result += emit(item);
            result += '\n';
        }
        return result;
    }
}
