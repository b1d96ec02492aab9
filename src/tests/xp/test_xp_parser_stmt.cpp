//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_parser_stmt.cpp
// Purpose: Statement, declaration and class parsing over complete programs.
// Key invariants: A well-formed program parses with zero diagnostics and every
//                 construct appears under its own node label.
// Ownership/Lifetime: Each test owns its parser fixture.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/xp/XpTestUtil.hpp"

#include <string>

using namespace xpresso::frontends::xp;
using xpresso::tests::xp::Parsed;
using xpresso::tests::xp::shape;

namespace
{

constexpr const char *kBankProgram = R"XP(
public class Bank :> Base :>> Printable, Auditable {
    private int count = 0;
    static str name, owner;
    <Account> primary;
    int[] ids = {1, 2, 3};

    public static void main(str[] args) {
        int total = 0;
        int sum = ALIAS total;
        Date d = [2024|09|20];
        Frac f = [22|7];
        Complex z = $(1.5,-2);
        char c = 'x';
        str who = STRICT Input::get("Name: ");
        Output::print("Hello ", who);
        if (total > 0) { total -= 1; } else if (total < 0) total = 0; else { }
        switch (total) {
            case 1: total = 2; break;
            case -1: { break; }
            default: total = 3;
        }
        while (total < 10) exit when (total == 5) { total++; }
        do { total--; } while (total > 0);
        for (int i = 0; i < 3; i++) { exit when (i == 2); }
        do for (int n : ids) { sum += n; }
        do for (item in ids) { }
        inspect { total = d.year(); }
        bool early = d.before(today());
        accounts.filter_by(a -> a.balance > 100);
        accounts.modify(a -> { a.balance = 0; });
        accounts.validate(a -> a.balance >= 0);
        accounts.export_as("csv", "out.csv");
        f.toMixed();
        inline_query {
            from accounts;
            filter_by(a -> a.balance > 100);
            order_by(balance, desc);
            limit(10);
            select(a -> a.name);
        }
        total = total > 5 ? 1 : -1;
    }

    void audit(int limit) where type Comparable {
        int x = limit;
    }
}
)XP";

} // namespace

TEST(XpParserStmt, FullProgramParsesCleanly)
{
    Parsed p(kBankProgram);
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    for (const auto &d : p.sink.all())
        ADD_FAILURE() << d.loc.line << ':' << d.loc.column << ": " << d.message;

    EXPECT_EQ(program->label(), "Program");
    EXPECT_EQ(program->countLabel("ClassDecl"), 1u);
    EXPECT_EQ(program->countLabel("MainMethod"), 1u);
    EXPECT_EQ(program->countLabel("Method"), 1u);
    EXPECT_EQ(program->countLabel("Field"), 4u);
    EXPECT_EQ(program->countLabel("InheritanceList"), 1u);
    EXPECT_EQ(program->countLabel("InterfaceList"), 1u);
    EXPECT_EQ(program->countLabel("TypeConstraint"), 1u);
    EXPECT_EQ(program->countLabel("AliasDecl"), 1u);
    EXPECT_EQ(program->countLabel("IfStmt"), 2u);
    EXPECT_EQ(program->countLabel("SwitchStmt"), 1u);
    EXPECT_EQ(program->countLabel("CaseClause"), 2u);
    EXPECT_EQ(program->countLabel("DefaultClause"), 1u);
    EXPECT_EQ(program->countLabel("WhileStmt"), 1u);
    EXPECT_EQ(program->countLabel("ExitWhenClause"), 1u);
    EXPECT_EQ(program->countLabel("ExitWhenStmt"), 1u);
    EXPECT_EQ(program->countLabel("DoWhileStmt"), 1u);
    EXPECT_EQ(program->countLabel("ForStmt"), 1u);
    EXPECT_EQ(program->countLabel("ForEachStmt"), 2u);
    EXPECT_EQ(program->countLabel("InspectStmt"), 1u);
    EXPECT_EQ(program->countLabel("QueryBlock"), 1u);
    EXPECT_EQ(program->countLabel("PrintStmt"), 1u);
    EXPECT_EQ(program->countLabel("InputExpr"), 1u);
    EXPECT_EQ(program->countLabel("LambdaExpr"), 5u);
    EXPECT_EQ(program->countLabel("DateOpCall"), 2u);
    EXPECT_EQ(program->countLabel("TodayCall"), 1u);
    EXPECT_EQ(program->countLabel("ExportCall"), 1u);
    EXPECT_EQ(program->countLabel("ToMixedCall"), 1u);
    EXPECT_EQ(program->countLabel("FilterCall"), 1u);
    EXPECT_EQ(program->countLabel("ModifyCall"), 1u);
    EXPECT_EQ(program->countLabel("ValidateCall"), 1u);
    EXPECT_EQ(program->countLabel("TernaryExpr"), 1u);
    EXPECT_EQ(program->countLabel("ArrayLiteral"), 1u);
    EXPECT_EQ(program->countLabel("DateLiteral"), 1u);
    EXPECT_EQ(program->countLabel("FractionLiteral"), 1u);
}

TEST(XpParserStmt, DeclarationWithSeveralDeclarators)
{
    Parsed p("int a = 1, b, c = a + 2;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    const ParseTreeNode *decl = program->findChild("Declaration");
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->countLabel("Declarator"), 3u);
    EXPECT_EQ(p.symbols.declarationCount(), 3u);
    ASSERT_TRUE(p.symbols.lookup("c"));
    EXPECT_EQ(p.symbols.lookup("c")->type, "int");
}

TEST(XpParserStmt, ObjectAndArrayTypes)
{
    Parsed p("<Account> acct; str[][] grid;");
    p.program();
    EXPECT_FALSE(p.sink.hasErrors());
    ASSERT_TRUE(p.symbols.lookup("acct"));
    EXPECT_EQ(p.symbols.lookup("acct")->type, "<Account>");
    ASSERT_TRUE(p.symbols.lookup("grid"));
    EXPECT_EQ(p.symbols.lookup("grid")->type, "str[][]");
}

TEST(XpParserStmt, UserTypeDeclaration)
{
    Parsed p("Account acct = other;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    EXPECT_EQ(program->countLabel("Declaration"), 1u);
}

TEST(XpParserStmt, AliasDeclaration)
{
    Parsed p("int total = 0; int sum = ALIAS total;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    const ParseTreeNode *alias = program->findChild("AliasDecl");
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(shape(*alias), "((int) sum = ALIAS total ;)");
    ASSERT_TRUE(p.symbols.lookup("sum"));
}

TEST(XpParserStmt, SwitchFallAndEmptyStatement)
{
    Parsed p("switch-fall (x) { case 1: ; default: }");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    EXPECT_EQ(program->countLabel("SwitchStmt"), 1u);
    EXPECT_EQ(program->countLabel("EmptyStmt"), 1u);
}

TEST(XpParserStmt, ExpressionStatementShape)
{
    Parsed p("x = 2 + 3;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(shape(*program), "(((x = (2 + 3)) ;))");
}

TEST(XpParserStmt, MissingSemicolonIsReported)
{
    Parsed p("x = 1 y = 2;");
    p.program();
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::MissingToken);

    Parsed atEnd("x = 1");
    atEnd.program();
    ASSERT_EQ(atEnd.sink.all().size(), 1u);
    EXPECT_EQ(atEnd.sink.all().front().kind, ErrorKind::UnexpectedEndOfInput);
}

TEST(XpParserStmt, InvalidModifierOnField)
{
    Parsed p("class A { native int x; abstract void f() { } }");
    p.program();
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::InvalidSyntax);
    EXPECT_NE(p.sink.all().front().message.find("native"), std::string::npos);
}

TEST(XpParserStmt, NestedClass)
{
    Parsed p("class Outer { final class Inner { int v; } int w; }");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    EXPECT_EQ(program->countLabel("ClassDecl"), 2u);
    EXPECT_EQ(program->countLabel("Field"), 2u);
}

TEST(XpParserStmt, MainWithoutVoid)
{
    Parsed p("class App { main(args) { Output::print(); } }");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_FALSE(p.sink.hasErrors());
    EXPECT_EQ(program->countLabel("MainMethod"), 1u);
    EXPECT_EQ(program->countLabel("PrintStmt"), 1u);
}
