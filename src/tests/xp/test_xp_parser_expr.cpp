//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_parser_expr.cpp
// Purpose: Expression precedence, associativity and nesting limits.
// Key invariants: Trees group operands by precedence level; right-associative
//                 levels nest to the right.
// Ownership/Lifetime: Each test owns its parser fixture.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/xp/XpTestUtil.hpp"

#include <chrono>
#include <string>

using namespace xpresso::frontends::xp;
using xpresso::tests::xp::Parsed;
using xpresso::tests::xp::shape;

namespace
{

std::string exprShape(const std::string &src)
{
    Parsed p(src);
    NodePtr expr = p.expression();
    if (!expr)
        return "<null>";
    if (p.sink.hasErrors())
        return "<errors>";
    return shape(*expr);
}

} // namespace

TEST(XpParserExpr, MultiplicationBindsTighterThanAddition)
{
    EXPECT_EQ(exprShape("2 + 3 * 4"), "(2 + (3 * 4))");
    EXPECT_EQ(exprShape("2 * 3 + 4"), "((2 * 3) + 4)");
}

TEST(XpParserExpr, LeftAssociativeLevels)
{
    EXPECT_EQ(exprShape("a + b - c"), "((a + b) - c)");
    EXPECT_EQ(exprShape("a.b.c"), "((a . b) . c)");
}

TEST(XpParserExpr, RightAssociativeLevels)
{
    EXPECT_EQ(exprShape("a = b = 5"), "(a = (b = 5))");
    EXPECT_EQ(exprShape("2 ^ 3 ^ 2"), "(2 ^ (3 ^ 2))");
    EXPECT_EQ(exprShape("a ? b : c ? d : e"), "(a ? b : (c ? d : e))");
}

TEST(XpParserExpr, LevelOrdering)
{
    EXPECT_EQ(exprShape("a || b && c"), "(a || (b && c))");
    EXPECT_EQ(exprShape("a == b < c"), "(a == (b < c))");
    EXPECT_EQ(exprShape("a << 2 + 1"), "(a << (2 + 1))");
    EXPECT_EQ(exprShape("a & b | c"), "((a & b) | c)");
    EXPECT_EQ(exprShape("x += y * 2"), "(x += (y * 2))");
    EXPECT_EQ(exprShape("c ? 1 : 2"), "(c ? 1 : 2)");
}

TEST(XpParserExpr, PrefixAndPostfix)
{
    EXPECT_EQ(exprShape("x = -b"), "(x = (- b))");
    EXPECT_EQ(exprShape("!a && b"), "((! a) && b)");
    EXPECT_EQ(exprShape("x++"), "(x ++)");
    EXPECT_EQ(exprShape("- - x"), "(- (- x))");
}

TEST(XpParserExpr, SignAfterCallIsSubtraction)
{
    EXPECT_EQ(exprShape("f(x) - 1"), "((f ( x )) - 1)");
    EXPECT_EQ(exprShape("(a) - b"), "((( a )) - b)");
}

TEST(XpParserExpr, GroupingOverridesPrecedence)
{
    EXPECT_EQ(exprShape("(1 + 2) * 3"), "((( (1 + 2) )) * 3)");
}

TEST(XpParserExpr, CallsAndIndexing)
{
    EXPECT_EQ(exprShape("f(1, 2)"), "(f ( 1 , 2 ))");
    EXPECT_EQ(exprShape("a[0]"), "(a [ 0 ])");
    EXPECT_EQ(exprShape("obj.run()"), "((obj . run) ( ))");
}

TEST(XpParserExpr, Lambdas)
{
    Parsed p("a -> a + 1");
    NodePtr expr = p.expression();
    ASSERT_TRUE(expr);
    EXPECT_FALSE(p.sink.hasErrors());
    EXPECT_EQ(expr->label(), "LambdaExpr");
    EXPECT_EQ(shape(*expr), "(a -> (a + 1))");
}

TEST(XpParserExpr, BracketLiterals)
{
    Parsed date("[2024|09|20]");
    NodePtr d = date.expression();
    ASSERT_TRUE(d);
    EXPECT_EQ(d->label(), "DateLiteral");

    Parsed frac("[1|3]");
    NodePtr f = frac.expression();
    ASSERT_TRUE(f);
    EXPECT_EQ(f->label(), "FractionLiteral");
}

TEST(XpParserExpr, MissingOperandIsReported)
{
    Parsed p("1 + ;");
    EXPECT_FALSE(p.expression());
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::UnexpectedToken);
}

TEST(XpParserExpr, NestingLimitReportsOnce)
{
    const std::string deep = std::string(300, '(') + "1" + std::string(300, ')');
    Parsed p("x = " + deep + ";");
    NodePtr program = p.program();
    ASSERT_TRUE(program);
    EXPECT_EQ(p.sink.count(ErrorKind::NestingTooDeep), 1u);

    const std::string shallow = std::string(100, '(') + "1" + std::string(100, ')');
    Parsed ok("x = " + shallow + ";");
    ok.program();
    EXPECT_FALSE(ok.sink.hasErrors());
}

TEST(XpParserExpr, NestingLimitIsConfigurable)
{
    ParserOptions options{};
    options.maxExpressionDepth = 8;
    Parsed p("x = ((((((((((1))))))))));", options);
    p.program();
    EXPECT_EQ(p.sink.count(ErrorKind::NestingTooDeep), 1u);
}

TEST(XpParserExpr, NestedBrokenLambdasReportOnceInLinearTime)
{
    std::string src = "y = ";
    for (int i = 0; i < 40; ++i)
        src += "a -> ";
    src += ";";

    const auto start = std::chrono::steady_clock::now();
    Parsed p(src);
    NodePtr program = p.program();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(program);
    ASSERT_EQ(p.sink.all().size(), 1u);
    EXPECT_EQ(p.sink.all().front().kind, ErrorKind::UnexpectedToken);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 2);
}
