//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_lexer.cpp
// Purpose: Word classification, comments, strings and recovery of the
//          X-presso lexer.
// Key invariants: Concatenating every token's text reproduces the input, and
//                 the stream ends in exactly one Eof token.
// Ownership/Lifetime: Each test owns its lexer and sink.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/xp/XpTestUtil.hpp"

#include <string>
#include <vector>

using namespace xpresso::frontends::xp;
using xpresso::tests::xp::Lexed;

namespace
{

std::vector<TokenKind> kinds(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> out;
    for (const auto &tok : tokens)
        out.push_back(tok.kind);
    return out;
}

} // namespace

TEST(XpLexer, ReconstructsInputExactly)
{
    const std::vector<std::string> inputs = {
        "public class A {\n    int x = 1; // note\n}\n",
        "a ....b <<<c >>>>d",
        "\"unterminated\nnext",
        "/* open",
        "[2024|13|20] $(1,) \xC3\xA9 @ \\ 12abc my-var",
        "",
        "\t\r\n",
    };
    for (const auto &src : inputs)
    {
        Lexed run(src);
        EXPECT_EQ(run.reconstruct(), src);
        ASSERT_FALSE(run.tokens.empty());
        EXPECT_EQ(run.tokens.back().kind, TokenKind::Eof);
        std::size_t eofs = 0;
        for (const auto &tok : run.tokens)
            eofs += tok.kind == TokenKind::Eof ? 1 : 0;
        EXPECT_EQ(eofs, 1u) << src;
    }
}

TEST(XpLexer, NextKeepsReturningEof)
{
    Lexed run("x");
    EXPECT_EQ(run.lexer.next().kind, TokenKind::Eof);
    EXPECT_EQ(run.lexer.next().kind, TokenKind::Eof);
}

TEST(XpLexer, ClassifiesWords)
{
    Lexed run("class if x true null Input str today void from");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 10u);
    EXPECT_EQ(kinds(toks),
              (std::vector<TokenKind>{TokenKind::ReservedWord,
                                      TokenKind::Keyword,
                                      TokenKind::Identifier,
                                      TokenKind::BoolLiteral,
                                      TokenKind::NullLiteral,
                                      TokenKind::Keyword,
                                      TokenKind::ReservedWord,
                                      TokenKind::ReservedWord,
                                      TokenKind::Identifier,
                                      TokenKind::Identifier}));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLexer, MultiWordKeywordsAreSingleTokens)
{
    Lexed run("switch-fall exit when where  type exit now");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_TRUE(toks[0].is(TokenKind::Keyword, "switch-fall"));
    EXPECT_TRUE(toks[1].is(TokenKind::Keyword, "exit when"));
    EXPECT_TRUE(toks[2].is(TokenKind::Keyword, "where  type"));
    EXPECT_TRUE(toks[3].is(TokenKind::Keyword, "exit"));
    EXPECT_TRUE(toks[4].is(TokenKind::Identifier, "now"));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLexer, TracksLineAndColumn)
{
    Lexed run("a\n  b");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].loc.line, 1u);
    EXPECT_EQ(toks[0].loc.column, 1u);
    EXPECT_EQ(toks[1].loc.line, 2u);
    EXPECT_EQ(toks[1].loc.column, 3u);
}

TEST(XpLexer, HyphenatedIdentifierIsRejected)
{
    Lexed run("my-var = 1;");
    auto toks = run.significant();
    ASSERT_FALSE(toks.empty());
    EXPECT_TRUE(toks[0].is(TokenKind::Unknown, "my-var"));
    EXPECT_EQ(run.sink.count(ErrorKind::InvalidIdentifier), 1u);
}

TEST(XpLexer, DigitLeadingIdentifierIsRejected)
{
    Lexed run("12abc");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_TRUE(toks[0].is(TokenKind::Unknown, "12abc"));
    EXPECT_EQ(run.sink.count(ErrorKind::InvalidIdentifier), 1u);
}

TEST(XpLexer, CommentsAreTrivia)
{
    Lexed run("// line\n/* block */x");
    ASSERT_GE(run.tokens.size(), 4u);
    EXPECT_EQ(run.tokens[0].kind, TokenKind::Comment);
    EXPECT_EQ(run.tokens[0].text, "// line");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].text, "x");
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLexer, UnterminatedCommentIsReported)
{
    Lexed run("x /* open");
    EXPECT_EQ(run.sink.count(ErrorKind::UnterminatedComment), 1u);
    bool sawComment = false;
    for (const auto &tok : run.tokens)
        sawComment = sawComment || tok.is(TokenKind::Comment, "/* open");
    EXPECT_TRUE(sawComment);
}

TEST(XpLexer, StringSplitsIntoSegmentsAndEscapes)
{
    Lexed run("\"a\\nb\"");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_TRUE(toks[0].is(TokenKind::StringDelimiter, "\""));
    EXPECT_TRUE(toks[1].is(TokenKind::StringLiteral, "a"));
    EXPECT_TRUE(toks[2].is(TokenKind::EscapeChar, "\\n"));
    EXPECT_TRUE(toks[3].is(TokenKind::StringLiteral, "b"));
    EXPECT_TRUE(toks[4].is(TokenKind::StringDelimiter, "\""));
    EXPECT_FALSE(run.sink.hasErrors());
}

TEST(XpLexer, InvalidEscapeKeepsScanning)
{
    Lexed run("\"a\\qb\"");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_TRUE(toks[2].is(TokenKind::Unknown, "\\q"));
    EXPECT_TRUE(toks[4].is(TokenKind::StringDelimiter, "\""));
    EXPECT_EQ(run.sink.count(ErrorKind::InvalidEscapeSequence), 1u);
}

TEST(XpLexer, CharacterLiteral)
{
    Lexed run("'x'");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].kind, TokenKind::StringDelimiter);
    EXPECT_TRUE(toks[1].is(TokenKind::CharLiteral, "x"));
    EXPECT_EQ(toks[2].kind, TokenKind::StringDelimiter);
}

TEST(XpLexer, EscapedCharacterLiteral)
{
    Lexed newline("'\\n'");
    auto toks = newline.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[1].is(TokenKind::CharLiteral, "\\n"));
    EXPECT_EQ(toks[2].kind, TokenKind::StringDelimiter);
    EXPECT_FALSE(newline.sink.hasErrors());

    Lexed quote("'\\''");
    toks = quote.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[1].is(TokenKind::CharLiteral, "\\'"));
    EXPECT_EQ(quote.reconstruct(), "'\\''");

    Lexed bad("'\\q'");
    EXPECT_EQ(bad.sink.count(ErrorKind::InvalidEscapeSequence), 1u);
}

TEST(XpLexer, UnterminatedStringStopsAtNewline)
{
    Lexed run("\"abc\nx");
    ASSERT_EQ(run.sink.count(ErrorKind::UnterminatedString), 1u);
    const auto &d = run.sink.all().front();
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 1u);
    auto toks = run.significant();
    ASSERT_FALSE(toks.empty());
    EXPECT_TRUE(toks.back().is(TokenKind::Identifier, "x"));
}

TEST(XpLexer, MismatchedAndUnmatchedClosers)
{
    Lexed wrong("(]");
    EXPECT_EQ(wrong.sink.count(ErrorKind::MismatchedDelimiters), 1u);

    Lexed stray(")");
    EXPECT_EQ(stray.sink.count(ErrorKind::MismatchedDelimiters), 1u);
    auto toks = stray.significant();
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_TRUE(toks[0].is(TokenKind::Delimiter, ")"));

    Lexed fine("{ ( [ ] ) }");
    EXPECT_FALSE(fine.sink.hasErrors());
}

TEST(XpLexer, InvalidCharacterBecomesOneUnknownToken)
{
    Lexed run("a \xC3\xA9 b");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[1].is(TokenKind::Unknown, "\xC3\xA9"));
    EXPECT_EQ(run.sink.count(ErrorKind::InvalidCharacter), 1u);
    EXPECT_EQ(run.sink.all().size(), 1u);
}

TEST(XpLexer, PunctuationTokens)
{
    Lexed run("a, b; c ? d @");
    auto toks = run.significant();
    ASSERT_EQ(toks.size(), 8u);
    EXPECT_TRUE(toks[1].is(TokenKind::PunctDelimiter, ","));
    EXPECT_TRUE(toks[3].is(TokenKind::PunctDelimiter, ";"));
    EXPECT_TRUE(toks[5].is(TokenKind::PunctDelimiter, "?"));
    EXPECT_TRUE(toks[7].is(TokenKind::PunctDelimiter, "@"));
}
