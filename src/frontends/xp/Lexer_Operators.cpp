//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer_Operators.cpp
/// @brief Operator, period, colon and angle-bracket scanning.
///
/// Operators are matched longest-first. Runs of `.`, `<` and `>` are capped
/// at their longest valid operator (`...`, `<<`, `>>>`); anything longer is
/// an InvalidOperator error placed at the first extra character.
///
/// `<` followed by a letter or a quote may open an object type name such as
/// `<Account>` or `<"Account">`. That form is tried speculatively and the
/// cursor is rewound when it does not close with `>`.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"

#include <string>

namespace xpresso::frontends::xp
{

using common::char_utils::isIdentifierContinue;
using common::char_utils::isLetter;
using common::char_utils::isNewline;

bool Lexer::isUnaryContext() const
{
    if (!haveLast_)
        return true;
    return lastKind_ == TokenKind::Delimiter || lastKind_ == TokenKind::PunctDelimiter ||
           isOperatorKind(lastKind_);
}

//===----------------------------------------------------------------------===//
// Periods and colons
//===----------------------------------------------------------------------===//

void Lexer::lexPeriods()
{
    Mark start = mark();
    std::size_t run = 0;
    while (run < 4 && peek(run) == '.')
        ++run;

    if (run == 4)
    {
        get();
        get();
        get();
        pushError(start,
                  ErrorKind::InvalidOperator,
                  "invalid operator: more than three consecutive '.'",
                  "Use '.', '..' or '...'",
                  here());
        return;
    }

    for (std::size_t i = 0; i < run; ++i)
        get();
    push(run == 1 ? TokenKind::MethodOp : TokenKind::LoopOp, start);
}

void Lexer::lexColon()
{
    Mark start = mark();
    get();

    if (peek() == '>')
    {
        get();
        if (peek() == '>')
            get();
        push(TokenKind::InheritOp, start);
        return;
    }
    if (peek() == ':')
    {
        get();
        push(TokenKind::MethodOp, start);
        return;
    }
    push(TokenKind::PunctDelimiter, start);
}

//===----------------------------------------------------------------------===//
// Angle brackets
//===----------------------------------------------------------------------===//

bool Lexer::tryObjectDelimiter()
{
    const char first = peek(1);

    if (isLetter(first))
    {
        std::size_t n = 0;
        while (n <= options_.maxTypeNameLength && isIdentifierContinue(peek(1 + n)))
            ++n;
        if (n > options_.maxTypeNameLength || peek(1 + n) != '>')
            return false;

        Mark open = mark();
        get();
        push(TokenKind::ObjectDelimiter, open);
        Mark name = mark();
        for (std::size_t i = 0; i < n; ++i)
            get();
        push(TokenKind::StringLiteral, name);
        Mark close = mark();
        get();
        push(TokenKind::ObjectDelimiter, close);
        return true;
    }

    // Quoted form: <"Name"> with a plain body on one line.
    std::size_t n = 0;
    while (n <= options_.maxTypeNameLength && !eofAt(2 + n))
    {
        const char c = peek(2 + n);
        if (c == first || c == '\\' || isNewline(c))
            break;
        ++n;
    }
    if (n == 0 || n > options_.maxTypeNameLength || peek(2 + n) != first || peek(3 + n) != '>')
        return false;

    Mark open = mark();
    get();
    push(TokenKind::ObjectDelimiter, open);
    lexString(first);
    Mark close = mark();
    get();
    push(TokenKind::ObjectDelimiter, close);
    return true;
}

void Lexer::lexAngle()
{
    const char c = peek();
    if (c == '<' && (isLetter(peek(1)) || peek(1) == '"' || peek(1) == '\'') && tryObjectDelimiter())
        return;

    Mark start = mark();
    const std::size_t longest = c == '<' ? 2 : 3;
    std::size_t run = 0;
    while (run <= longest && peek(run) == c)
        ++run;

    if (run > longest)
    {
        for (std::size_t i = 0; i < longest; ++i)
            get();
        std::string text(since(start));
        pushError(start,
                  ErrorKind::InvalidOperator,
                  "invalid operator: '" + text + c + "' is not an operator",
                  "Longest shift operators are '<<', '>>' and '>>>'",
                  here());
        return;
    }

    if (run >= 2)
    {
        for (std::size_t i = 0; i < run; ++i)
            get();
        push(TokenKind::BitwiseOp, start);
        return;
    }

    get();
    if (peek() == '=')
        get();
    push(TokenKind::RelationalOp, start);
}

//===----------------------------------------------------------------------===//
// Remaining operators
//===----------------------------------------------------------------------===//

void Lexer::lexOperator()
{
    Mark start = mark();
    const char c = peek();
    const char n = peek(1);

    auto two = [&](TokenKind kind)
    {
        get();
        get();
        push(kind, start);
    };

    if (c == '-' && n == '>')
        return two(TokenKind::MethodOp);
    if ((c == '+' || c == '-') && n == c)
        return two(TokenKind::UnaryOp);
    if (c == '*' && n == '*')
        return two(TokenKind::UnaryOp);
    if ((c == '=' || c == '!') && n == '=')
        return two(TokenKind::RelationalOp);
    if ((c == '&' || c == '|') && n == c)
        return two(TokenKind::LogicalOp);
    if (n == '=' && (c == '+' || c == '-' || c == '*' || c == '/' || c == '%' || c == '?'))
        return two(TokenKind::AssignOp);

    get();
    switch (c)
    {
        case '+':
        case '-':
            // Decided before push() updates the last significant token.
            push(isUnaryContext() ? TokenKind::UnaryOp : TokenKind::ArithmeticOp, start);
            return;
        case '*':
        case '/':
        case '%':
        case '^':
            push(TokenKind::ArithmeticOp, start);
            return;
        case '=':
            push(TokenKind::AssignOp, start);
            return;
        case '!':
            push(TokenKind::LogicalOp, start);
            return;
        case '?':
            push(TokenKind::PunctDelimiter, start);
            return;
        default:
            push(TokenKind::BitwiseOp, start);
            return;
    }
}

} // namespace xpresso::frontends::xp
