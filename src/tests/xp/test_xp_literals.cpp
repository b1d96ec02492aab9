//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_literals.cpp
// Purpose: Number, date, fraction and complex literal scanning.
// Key invariants: A malformed literal yields one Unknown token and exactly one
//                 diagnostic of the literal's kind.
// Ownership/Lifetime: Each test owns its lexer and sink.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/xp/XpTestUtil.hpp"

#include <string>

using namespace xpresso::frontends::xp;
using xpresso::tests::xp::Lexed;

TEST(XpLiterals, Numbers)
{
    Lexed run("42 3.14 0");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[0].is(TokenKind::IntLiteral, "42"));
    EXPECT_TRUE(toks[1].is(TokenKind::FloatLiteral, "3.14"));
    EXPECT_TRUE(toks[2].is(TokenKind::IntLiteral, "0"));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLiterals, TrailingPeriodIsInvalidNumber)
{
    Lexed run("x = 1.;");
    EXPECT_EQ(run.sink.count(ErrorKind::InvalidNumberFormat), 1u);
    bool sawUnknown = false;
    for (const auto &tok : run.significant())
        sawUnknown = sawUnknown || tok.is(TokenKind::Unknown, "1.");
    EXPECT_TRUE(sawUnknown);
}

TEST(XpLiterals, RangeIsNotAFloat)
{
    Lexed run("1..5");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[0].is(TokenKind::IntLiteral, "1"));
    EXPECT_TRUE(toks[1].is(TokenKind::LoopOp, ".."));
    EXPECT_TRUE(toks[2].is(TokenKind::IntLiteral, "5"));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLiterals, ValidDateInsideBrackets)
{
    Lexed run("[2024|09|20]");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[0].is(TokenKind::Delimiter, "["));
    EXPECT_TRUE(toks[1].is(TokenKind::DateLiteral, "2024|09|20"));
    EXPECT_TRUE(toks[2].is(TokenKind::Delimiter, "]"));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLiterals, InvalidDatesAreReportedOnce)
{
    const char *bad[] = {"[2024|13|20]", "[2024|00|20]", "[2024|09|32]", "[24|09|20]", "[2024|9|20]"};
    for (const char *src : bad)
    {
        Lexed run(src);
        EXPECT_EQ(run.sink.count(ErrorKind::InvalidDateFormat), 1u) << src;
        EXPECT_EQ(run.sink.all().size(), 1u) << src;
        auto toks = run.significant();
        ASSERT_EQ(toks.size(), 3u) << src;
        EXPECT_EQ(toks[1].kind, TokenKind::Unknown) << src;
    }
}

TEST(XpLiterals, DateDiagnosticUnderlinesTheLiteral)
{
    Lexed run("d = [2024|13|20];");
    ASSERT_EQ(run.sink.all().size(), 1u);
    const auto &d = run.sink.all().front();
    EXPECT_EQ(d.loc.column, 6u);
    EXPECT_EQ(d.length, 10u);
    EXPECT_NE(d.message.find("month"), std::string::npos);
}

TEST(XpLiterals, ExtraSeparatorIsReportedAtThatCharacter)
{
    Lexed run("[2024|09|20|01]");
    ASSERT_EQ(run.sink.count(ErrorKind::InvalidDateFormat), 1u);
    EXPECT_EQ(run.sink.all().size(), 1u);
    EXPECT_EQ(run.sink.all().front().loc.column, 12u);
    EXPECT_EQ(run.reconstruct(), "[2024|09|20|01]");
}

TEST(XpLiterals, Fractions)
{
    Lexed ok("[1|3] [22|7]");
    auto toks = ok.significant();
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_TRUE(toks[1].is(TokenKind::FractionLiteral, "1|3"));
    EXPECT_TRUE(toks[4].is(TokenKind::FractionLiteral, "22|7"));
    EXPECT_FALSE(ok.sink.hasErrors());

    for (const char *src : {"[5|0]", "[|3]", "[5|]"})
    {
        Lexed bad(src);
        EXPECT_EQ(bad.sink.count(ErrorKind::InvalidFractionFormat), 1u) << src;
        EXPECT_EQ(bad.sink.all().size(), 1u) << src;
    }
}

TEST(XpLiterals, ComplexNumbers)
{
    Lexed ok("$(1.5,-2)");
    auto toks = ok.significant();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_TRUE(toks[0].is(TokenKind::ComplexLiteral, "$(1.5,-2)"));
    EXPECT_FALSE(ok.sink.hasErrors());

    Lexed missingImag("$(1,)");
    EXPECT_EQ(missingImag.sink.count(ErrorKind::InvalidComplexLiteral), 1u);

    Lexed open("$(1,2");
    ASSERT_EQ(open.sink.count(ErrorKind::InvalidComplexLiteral), 1u);
    EXPECT_EQ(open.sink.all().front().suggestion, "Add closing parenthesis");

    Lexed bare("$x");
    EXPECT_EQ(bare.sink.count(ErrorKind::InvalidComplexLiteral), 1u);
}
