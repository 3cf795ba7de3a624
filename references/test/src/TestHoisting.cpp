#include <catch2/catch_test_macros.hpp>
#include <Hoisting.hpp>
#include <Emitter.hpp>

using namespace esmc;

static Node statement(const std::string &name)
{
    return Node::varDecl("var", Node::ident(name), Node::number(1));
}

SCENARIO("Hoisting into module bodies")
{
    GIVEN("An empty module body")
    {
        Program program{Program::Kind::Module};
        auto s = statement("s");
        insertHoistedStmt(program, s);

        THEN("The statement and the marker are inserted, in that order")
        {
            REQUIRE(program.body.size() == 2);
            REQUIRE(program.body[0] == s);
            REQUIRE(isHoistingMarker(program.body[1]));
            REQUIRE(emit(program.body[1]) == "\"__TURBOPACK__ecmascript__hoisting__location__\";");
        }

        WHEN("The same statement is hoisted again")
        {
            insertHoistedStmt(program, s);
            THEN("Nothing changes")
            {
                REQUIRE(program.body.size() == 2);
            }
        }

        WHEN("A different statement is hoisted")
        {
            auto t = statement("t");
            insertHoistedStmt(program, t);
            insertHoistedStmt(program, s);
            THEN("It goes right before the marker")
            {
                REQUIRE(program.body.size() == 3);
                REQUIRE(program.body[0] == s);
                REQUIRE(program.body[1] == t);
                REQUIRE(isHoistingMarker(program.body[2]));
            }
        }
    }

    GIVEN("A module body with imports and code but no marker")
    {
        Program program{Program::Kind::Module, {Node::moduleDecl("import a from \"./a\";"), Node::verbatim("a();")}};
        insertHoistedStmt(program, statement("s"));

        THEN("Hoisted code is placed above everything else")
        {
            REQUIRE(emit(program) == "var s = 1;\n"
                                     "\"__TURBOPACK__ecmascript__hoisting__location__\";\n"
                                     "import a from \"./a\";\n"
                                     "a();\n");
        }
    }

    GIVEN("A statement that only appears after the marker")
    {
        auto s = statement("s");
        Program program{Program::Kind::Module, {hoistingMarker(), s}};
        insertHoistedStmt(program, s);

        THEN("It is still hoisted")
        {
            REQUIRE(program.body.size() == 3);
            REQUIRE(program.body[0] == s);
            REQUIRE(isHoistingMarker(program.body[1]));
        }
    }
}

SCENARIO("Hoisting into script bodies")
{
    GIVEN("An empty script body")
    {
        Program program{Program::Kind::Script};
        auto s = statement("s");
        insertHoistedStmt(program, s);

        THEN("The statement comes before the marker")
        {
            REQUIRE(program.body.size() == 2);
            REQUIRE(program.body[0] == s);
            REQUIRE(isHoistingMarker(program.body[1]));
        }

        WHEN("The same statement is hoisted again")
        {
            insertHoistedStmt(program, s);
            THEN("Scripts do not deduplicate")
            {
                REQUIRE(program.body.size() == 3);
                REQUIRE(program.body[0] == s);
                REQUIRE(program.body[1] == s);
                REQUIRE(isHoistingMarker(program.body[2]));
            }
        }
    }
}

SCENARIO("Recognizing the marker")
{
    THEN("Only an expression statement holding exactly the marker string matches")
    {
        REQUIRE(isHoistingMarker(hoistingMarker()));
        REQUIRE_FALSE(isHoistingMarker(Node::exprStmt(Node::string("use strict"))));
        REQUIRE_FALSE(isHoistingMarker(Node::verbatim("\"__TURBOPACK__ecmascript__hoisting__location__\";")));
        REQUIRE_FALSE(isHoistingMarker(Node::exprStmt(Node::ident("__TURBOPACK__ecmascript__hoisting__location__"))));
    }
}
