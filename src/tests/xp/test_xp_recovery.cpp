//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_recovery.cpp
// Purpose: Panic-mode recovery keeps parsing after a syntax error.
// Key invariants: One malformed construct yields one diagnostic, and the
//                 constructs after it still appear in the tree.
// Ownership/Lifetime: Each test owns its parser fixture.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/xp/XpTestUtil.hpp"

#include <string>

using namespace xpresso::frontends::xp;
using xpresso::tests::xp::Parsed;

TEST(XpRecovery, MalformedFieldDoesNotHideNextMethod)
{
    Parsed p(R"XP(
public class Account {
    private int balance = ;
    public void deposit(int amount) { balance += amount; }
}
)XP");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(program->countLabel("Method"), 1u);
    EXPECT_EQ(program->countLabel("ClassDecl"), 1u);
}

TEST(XpRecovery, MissingSemicolonResumesAtNextDeclaration)
{
    Parsed p(R"XP(
class A {
    main(args) {
        int a = 1
        int b = 2;
    }
}
)XP");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::MissingToken);
    EXPECT_EQ(p.sink.all().front().loc.line, 5u);
    EXPECT_EQ(program->countLabel("Declaration"), 1u);
}

TEST(XpRecovery, UnexpectedEndOfInputIsReportedOnce)
{
    Parsed p("class A { void f() {");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.count(ErrorKind::UnexpectedEndOfInput), 1u);
    EXPECT_EQ(p.sink.all().size(), 1u);
}

TEST(XpRecovery, StrayClosingBrace)
{
    Parsed p("} int x = 1;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.count(ErrorKind::UnexpectedToken), 1u);
    EXPECT_EQ(program->countLabel("Declaration"), 1u);
}

TEST(XpRecovery, LexicalErrorsDoNotCascade)
{
    Parsed p("x = 12abc;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::InvalidIdentifier);
    EXPECT_EQ(program->countLabel("ExpressionStmt"), 1u);
}

TEST(XpRecovery, BrokenLambdaIsReportedOnce)
{
    Parsed p("list.filter_by(a -> );\nint y = 1;");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.countPhase(ErrorPhase::Syntax), 1u);
    EXPECT_EQ(program->countLabel("Declaration"), 1u);
}

TEST(XpRecovery, SeveralErrorsInOneFile)
{
    Parsed p(R"XP(
class A {
    int x = ;
    void f() {
        y = ;
        int z = 3;
    }
}
)XP");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.all().size(), 2u);
    EXPECT_EQ(program->countLabel("Method"), 1u);
    EXPECT_EQ(program->countLabel("Declaration"), 1u);
}

TEST(XpRecovery, BadSwitchMemberIsSkipped)
{
    Parsed p("switch (x) { junk case 1: break; }");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(program->countLabel("CaseClause"), 1u);
}

TEST(XpRecovery, VoidMethodAfterBrokenFieldIsKept)
{
    Parsed p("class A {\n int x = 5\n void f() { }\n int g() { }\n}");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::MissingToken);
    EXPECT_EQ(p.sink.all().front().loc.line, 3u);
    EXPECT_EQ(program->countLabel("Method"), 2u);
    EXPECT_EQ(program->countLabel("ClassDecl"), 1u);
}

TEST(XpRecovery, DeeplyNestedBlocksStopAtTheLimit)
{
    Parsed p(std::string(200000, '{'));
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.count(ErrorKind::NestingTooDeep), 1u);
    EXPECT_EQ(p.sink.count(ErrorKind::UnexpectedEndOfInput), 1u);
}

TEST(XpRecovery, StatementNestingLimitIsConfigurable)
{
    ParserOptions options{};
    options.maxStatementDepth = 4;

    Parsed within("if (a) if (a) if (a) x = 1;", options);
    within.program();
    EXPECT_FALSE(within.sink.hasErrors());

    Parsed over("if (a) if (a) if (a) if (a) if (a) x = 1;", options);
    NodePtr program = over.program();
    ASSERT_TRUE(program);
    ASSERT_EQ(over.sink.all().size(), 1u);
    EXPECT_EQ(over.sink.all().front().kind, ErrorKind::NestingTooDeep);
    EXPECT_EQ(over.sink.all().front().loc.column, 29u);
}

TEST(XpRecovery, ClassNestingCountsTowardTheLimit)
{
    ParserOptions options{};
    options.maxStatementDepth = 2;
    Parsed p("class A { class B { class C { } } }", options);
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.count(ErrorKind::NestingTooDeep), 1u);
    EXPECT_EQ(program->countLabel("ClassDecl"), 2u);
}
