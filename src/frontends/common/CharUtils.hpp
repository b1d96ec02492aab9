//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: Character classification used by the lexer.
//
// All predicates are ASCII-only on purpose: bytes >= 0x80 are never letters,
// digits or whitespace, so non-ASCII input outside strings and comments is
// reported as an invalid character instead of being misclassified by the
// current C locale.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace xpresso::frontends::common::char_utils
{

[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool isHorizontalWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] constexpr bool isNewline(char c) noexcept
{
    return c == '\r' || c == '\n';
}

/// Brackets that always form a one-character Delimiter token.
[[nodiscard]] constexpr bool isBracket(char c) noexcept
{
    return c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}';
}

/// Punctuation that forms a one-character PunctDelimiter token.
[[nodiscard]] constexpr bool isPunctuation(char c) noexcept
{
    return c == ',' || c == ';' || c == '?' || c == '@';
}

/// Characters that may begin an operator.
[[nodiscard]] constexpr bool isOperatorChar(char c) noexcept
{
    switch (c)
    {
        case '+':
        case '-':
        case '*':
        case '/':
        case '%':
        case '^':
        case '=':
        case '!':
        case '<':
        case '>':
        case '&':
        case '|':
        case '~':
        case '.':
        case ':':
            return true;
        default:
            return false;
    }
}

} // namespace xpresso::frontends::common::char_utils
