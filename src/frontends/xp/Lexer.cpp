//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Lexer core: dispatch, token emission, words, comments, brackets.
///
/// @details Literal scanners live in Lexer_Literals.cpp and operator scanners
/// in Lexer_Operators.cpp.
///
/// ## Word Lookup
///
/// Keywords, reserved words, `true`/`false` and `null` share one sorted table
/// (kWordTable) searched by binary lookup. Three keywords span more than one
/// word: `switch-fall` (joined by a hyphen) and `exit when` / `where type`
/// (joined by horizontal whitespace, which is part of the lexeme).
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"
#include "frontends/common/KeywordTable.hpp"

#include <array>
#include <cstdio>
#include <utility>

namespace xpresso::frontends::xp
{

using common::char_utils::isBracket;
using common::char_utils::isHorizontalWhitespace;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isDigit;
using common::char_utils::isOperatorChar;
using common::char_utils::isPunctuation;
using common::char_utils::isWhitespace;
using common::keyword_table::KeywordEntry;

namespace
{

constexpr auto kWordTable = std::to_array<KeywordEntry<TokenKind>>({
    {"ALIAS", TokenKind::ReservedWord},
    {"Complex", TokenKind::ReservedWord},
    {"Date", TokenKind::ReservedWord},
    {"Frac", TokenKind::ReservedWord},
    {"Input", TokenKind::Keyword},
    {"Output", TokenKind::Keyword},
    {"STRICT", TokenKind::ReservedWord},
    {"abstract", TokenKind::ReservedWord},
    {"after", TokenKind::ReservedWord},
    {"before", TokenKind::ReservedWord},
    {"bool", TokenKind::ReservedWord},
    {"break", TokenKind::Keyword},
    {"byte", TokenKind::ReservedWord},
    {"case", TokenKind::Keyword},
    {"char", TokenKind::ReservedWord},
    {"class", TokenKind::ReservedWord},
    {"day", TokenKind::Keyword},
    {"default", TokenKind::Keyword},
    {"do", TokenKind::Keyword},
    {"double", TokenKind::ReservedWord},
    {"else", TokenKind::Keyword},
    {"exclude", TokenKind::ReservedWord},
    {"exit", TokenKind::Keyword},
    {"export_as", TokenKind::ReservedWord},
    {"false", TokenKind::BoolLiteral},
    {"filter_by", TokenKind::ReservedWord},
    {"final", TokenKind::ReservedWord},
    {"float", TokenKind::ReservedWord},
    {"for", TokenKind::Keyword},
    {"get", TokenKind::Keyword},
    {"if", TokenKind::Keyword},
    {"in", TokenKind::Keyword},
    {"inline_query", TokenKind::ReservedWord},
    {"inspect", TokenKind::ReservedWord},
    {"int", TokenKind::ReservedWord},
    {"long", TokenKind::ReservedWord},
    {"main", TokenKind::ReservedWord},
    {"modify", TokenKind::ReservedWord},
    {"month", TokenKind::Keyword},
    {"native", TokenKind::ReservedWord},
    {"null", TokenKind::NullLiteral},
    {"print", TokenKind::Keyword},
    {"private", TokenKind::ReservedWord},
    {"protected", TokenKind::ReservedWord},
    {"public", TokenKind::ReservedWord},
    {"short", TokenKind::ReservedWord},
    {"static", TokenKind::ReservedWord},
    {"str", TokenKind::ReservedWord},
    {"strictfp", TokenKind::ReservedWord},
    {"switch", TokenKind::Keyword},
    {"toMixed", TokenKind::ReservedWord},
    {"today", TokenKind::ReservedWord},
    {"transient", TokenKind::ReservedWord},
    {"true", TokenKind::BoolLiteral},
    {"validate", TokenKind::ReservedWord},
    {"volatile", TokenKind::ReservedWord},
    {"while", TokenKind::Keyword},
    {"year", TokenKind::Keyword},
});

static_assert(common::keyword_table::isKeywordTableSorted(kWordTable),
              "kWordTable must stay sorted for binary lookup");

/// @brief Printable form of a single character for messages.
std::string describeChar(char c)
{
    auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7F)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", u);
        return buf;
    }
    return std::string(1, c);
}

char closerFor(char open)
{
    switch (open)
    {
        case '(':
            return ')';
        case '[':
            return ']';
        default:
            return '}';
    }
}

} // namespace

Lexer::Lexer(std::string source, uint32_t fileId, DiagnosticSink &diag, LexerOptions options)
    : LexerCursor<Lexer>(fileId), source_(std::move(source)), diag_(diag), options_(options)
{
}

//===----------------------------------------------------------------------===//
// Public interface
//===----------------------------------------------------------------------===//

Token Lexer::next()
{
    if (pending_.empty() && !eof())
        scan();

    Token tok;
    if (!pending_.empty())
    {
        tok = std::move(pending_.front());
        pending_.pop_front();
    }
    else
    {
        tok.kind = TokenKind::Eof;
        tok.loc = here();
    }

    if (log_ && !(tok.kind == TokenKind::Eof && eofLogged_))
    {
        log_->push_back(tok);
        eofLogged_ = tok.kind == TokenKind::Eof;
    }
    return tok;
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(next());
        if (tokens.back().kind == TokenKind::Eof)
            break;
    }
    return tokens;
}

//===----------------------------------------------------------------------===//
// Token emission
//===----------------------------------------------------------------------===//

SourceLoc Lexer::locOf(const Mark &m) const
{
    return SourceLoc{fileId_, m.line, m.column};
}

SourceLoc Lexer::here() const
{
    return SourceLoc{fileId_, line_, column_};
}

void Lexer::push(TokenKind kind, const Mark &start)
{
    Token tok;
    tok.kind = kind;
    tok.text = std::string(since(start));
    tok.loc = locOf(start);

    if (!tok.isTrivia())
    {
        haveLast_ = true;
        lastKind_ = tok.kind;
        lastText_ = tok.text;
    }
    pending_.push_back(std::move(tok));
}

void Lexer::pushError(const Mark &start,
                      ErrorKind kind,
                      std::string message,
                      std::string suggestion,
                      std::optional<SourceLoc> at)
{
    auto length = static_cast<uint32_t>(position() - start.pos);
    SourceLoc loc = locOf(start);
    if (at)
    {
        loc = *at;
        length = 1;
    }
    push(TokenKind::Unknown, start);
    diag_.report(kind, std::move(message), loc, std::move(suggestion), length);
}

bool Lexer::wordAt(std::size_t offset, std::string_view word) const
{
    for (std::size_t i = 0; i < word.size(); ++i)
    {
        if (peek(offset + i) != word[i])
            return false;
    }
    return !isIdentifierContinue(peek(offset + word.size()));
}

bool Lexer::lastIs(TokenKind kind, std::string_view text) const
{
    return haveLast_ && lastKind_ == kind && lastText_ == text;
}

//===----------------------------------------------------------------------===//
// Dispatch
//===----------------------------------------------------------------------===//

void Lexer::scan()
{
    const char c = peek();

    if (isWhitespace(c))
    {
        lexWhitespace();
        return;
    }
    if (c == '$')
    {
        lexComplex();
        return;
    }
    if (isIdentifierStart(c))
    {
        lexWord();
        return;
    }
    if (isDigit(c))
    {
        lexNumber();
        return;
    }

    switch (c)
    {
        case '"':
        case '\'':
            lexString(c);
            return;
        case '/':
            lexSlash();
            return;
        case '.':
            lexPeriods();
            return;
        case ':':
            lexColon();
            return;
        case '<':
        case '>':
            lexAngle();
            return;
        case '?':
            lexOperator();
            return;
        case '|':
            // `[|3]`: a literal whose first part is missing.
            if (lastIs(TokenKind::Delimiter, "[") && isDigit(peek(1)))
            {
                lexDateOrFraction(mark());
                return;
            }
            break;
        default:
            break;
    }

    if (isOperatorChar(c))
    {
        lexOperator();
        return;
    }
    if (isBracket(c))
    {
        lexBracket();
        return;
    }
    if (isPunctuation(c))
    {
        Mark start = mark();
        get();
        push(TokenKind::PunctDelimiter, start);
        return;
    }

    lexInvalidCharacter();
}

//===----------------------------------------------------------------------===//
// Whitespace, words and comments
//===----------------------------------------------------------------------===//

void Lexer::lexWhitespace()
{
    Mark start = mark();
    common::lexer_base::consumeWhile(*this, isWhitespace);
    push(TokenKind::Whitespace, start);
}

void Lexer::lexWord()
{
    Mark start = mark();
    common::lexer_base::consumeWhile(*this, isIdentifierContinue);
    std::string word(since(start));

    if (word == "switch" && peek() == '-' && wordAt(1, "fall"))
    {
        for (int i = 0; i < 5; ++i)
            get();
        push(TokenKind::Keyword, start);
        return;
    }

    if (word == "exit" || word == "where")
    {
        std::string_view follow = word == "exit" ? "when" : "type";
        std::size_t gap = 0;
        while (gap < options_.maxKeywordGap && isHorizontalWhitespace(peek(gap)))
            ++gap;
        if (gap > 0 && wordAt(gap, follow))
        {
            for (std::size_t i = 0; i < gap + follow.size(); ++i)
                get();
            push(TokenKind::Keyword, start);
            return;
        }
    }

    if (peek() == '-' && isIdentifierStart(peek(1)))
    {
        while (peek() == '-' && isIdentifierStart(peek(1)))
        {
            get();
            common::lexer_base::consumeWhile(*this, isIdentifierContinue);
        }
        std::string text(since(start));
        pushError(start,
                  ErrorKind::InvalidIdentifier,
                  "invalid identifier '" + text + "': '-' is not allowed in identifiers",
                  "Use '_' instead of '-' in identifiers");
        return;
    }

    auto kind = common::keyword_table::lookupKeywordBinary(kWordTable, word);
    push(kind.value_or(TokenKind::Identifier), start);
}

void Lexer::lexSlash()
{
    Mark start = mark();

    if (peek(1) == '/')
    {
        common::lexer_base::skipToEndOfLine(*this);
        push(TokenKind::Comment, start);
        return;
    }

    if (peek(1) == '*')
    {
        get();
        get();
        bool closed = false;
        while (!eof())
        {
            if (peek() == '*' && peek(1) == '/')
            {
                get();
                get();
                closed = true;
                break;
            }
            get();
        }
        push(TokenKind::Comment, start);
        if (!closed)
            diag_.report(ErrorKind::UnterminatedComment,
                         "unterminated block comment",
                         locOf(start),
                         {},
                         2);
        return;
    }

    lexOperator();
}

//===----------------------------------------------------------------------===//
// Brackets and stray characters
//===----------------------------------------------------------------------===//

void Lexer::lexBracket()
{
    Mark start = mark();
    const char c = get();
    push(TokenKind::Delimiter, start);

    if (c == '(' || c == '[' || c == '{')
    {
        brackets_.push_back(c);
        return;
    }

    if (!brackets_.empty() && closerFor(brackets_.back()) == c)
    {
        brackets_.pop_back();
        return;
    }

    // Unclosed openers at end of input are left to the parser, which reports
    // the missing closer with grammar context.
    if (brackets_.empty())
    {
        diag_.report(ErrorKind::MismatchedDelimiters,
                     std::string("unmatched closing '") + c + "'",
                     locOf(start),
                     "Remove the extra delimiter or add its opening partner",
                     1);
        return;
    }

    const char open = brackets_.back();
    diag_.report(ErrorKind::MismatchedDelimiters,
                 std::string("mismatched delimiters: '") + open + "' closed by '" + c + "'",
                 locOf(start),
                 std::string("Use '") + closerFor(open) + "' to close '" + open + "'",
                 1);

    // Drop openers up to the one this closer matches, if any.
    for (std::size_t i = brackets_.size(); i-- > 0;)
    {
        if (closerFor(brackets_[i]) == c)
        {
            brackets_.resize(i);
            return;
        }
    }
}

void Lexer::lexInvalidCharacter()
{
    Mark start = mark();
    auto lead = static_cast<unsigned char>(get());
    if (lead >= 0xC0)
    {
        while (!eof() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80)
            get();
    }

    std::string shown = lead < 0x80 ? describeChar(static_cast<char>(lead)) : std::string(since(start));
    if (lead == '\\')
    {
        pushError(start,
                  ErrorKind::InvalidCharacter,
                  "invalid character '\\' outside a string literal",
                  "Escape sequences are only valid inside quotes");
        return;
    }
    pushError(start, ErrorKind::InvalidCharacter, "invalid character '" + shown + "'");
}

} // namespace xpresso::frontends::xp
