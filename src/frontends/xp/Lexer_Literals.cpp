//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer_Literals.cpp
/// @brief Numeric, date, fraction, string and complex literal scanning.
///
/// ## Dates and fractions
///
/// Both use `|` as separator: `2024|09|20` is a date (4-digit year, 2-digit
/// month 01-12, 2-digit day 01-31), `22|7` a fraction (non-zero
/// denominator). A literal begins at a digit followed by `|digit`, or at a
/// digit followed by `|]`, or at a `|` right after `[`. The scan stops at the
/// third separator, which is reported as the offending character.
///
/// ## Strings
///
/// A quoted string yields its opening delimiter, body segments (STR_LIT)
/// interleaved with recognized escapes (ESCAPE_CHAR) and the closing
/// delimiter. A single-quoted body holding exactly one plain character is a
/// CHAR_LIT.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"

#include <string>
#include <vector>

namespace xpresso::frontends::xp
{

using common::char_utils::isDigit;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isNewline;

namespace
{

std::vector<std::string_view> splitParts(std::string_view text, char sep)
{
    std::vector<std::string_view> parts;
    std::size_t begin = 0;
    while (true)
    {
        std::size_t at = text.find(sep, begin);
        if (at == std::string_view::npos)
        {
            parts.push_back(text.substr(begin));
            return parts;
        }
        parts.push_back(text.substr(begin, at - begin));
        begin = at + 1;
    }
}

int twoDigitValue(std::string_view digits)
{
    return (digits[0] - '0') * 10 + (digits[1] - '0');
}

/// @brief Reason a date body is invalid, or empty when it is well formed.
std::string checkDate(std::string_view text)
{
    auto parts = splitParts(text, '|');
    if (parts[0].empty() || parts[1].empty() || parts[2].empty())
        return "missing year, month or day";
    if (parts[0].size() != 4)
        return "year must have 4 digits";
    if (parts[1].size() != 2 || parts[2].size() != 2)
        return "month and day must have 2 digits";
    int month = twoDigitValue(parts[1]);
    if (month < 1 || month > 12)
        return "month must be between 01 and 12";
    int day = twoDigitValue(parts[2]);
    if (day < 1 || day > 31)
        return "day must be between 01 and 31";
    return {};
}

std::string checkFraction(std::string_view text)
{
    auto parts = splitParts(text, '|');
    if (parts[0].empty())
        return "missing numerator";
    if (parts[1].empty())
        return "missing denominator";
    if (parts[1].find_first_not_of('0') == std::string_view::npos)
        return "denominator must not be zero";
    return {};
}

/// @brief True for `-?digits(.digits)?`.
bool isSignedNumber(std::string_view part)
{
    std::size_t i = 0;
    if (i < part.size() && part[i] == '-')
        ++i;
    std::size_t intDigits = 0;
    while (i < part.size() && isDigit(part[i]))
    {
        ++i;
        ++intDigits;
    }
    if (intDigits == 0)
        return false;
    if (i == part.size())
        return true;
    if (part[i] != '.')
        return false;
    ++i;
    std::size_t fracDigits = 0;
    while (i < part.size() && isDigit(part[i]))
    {
        ++i;
        ++fracDigits;
    }
    return fracDigits > 0 && i == part.size();
}

bool isEscapeLetter(char c, char quote)
{
    switch (c)
    {
        case 'n':
        case 't':
        case 'r':
        case '"':
        case '\\':
            return true;
        case '\'':
            return quote == '\'';
        default:
            return false;
    }
}

} // namespace

//===----------------------------------------------------------------------===//
// Numbers
//===----------------------------------------------------------------------===//

void Lexer::lexNumber()
{
    Mark start = mark();
    common::lexer_base::consumeWhile(*this, isDigit);

    if (isIdentifierStart(peek()))
    {
        common::lexer_base::consumeWhile(*this, isIdentifierContinue);
        std::string text(since(start));
        pushError(start,
                  ErrorKind::InvalidIdentifier,
                  "invalid identifier '" + text + "': identifiers cannot start with a digit");
        return;
    }

    if (peek() == '|' &&
        (isDigit(peek(1)) || (peek(1) == ']' && lastIs(TokenKind::Delimiter, "["))))
    {
        lexDateOrFraction(start);
        return;
    }

    if (peek() == '.')
    {
        if (isDigit(peek(1)))
        {
            get();
            common::lexer_base::consumeWhile(*this, isDigit);
            push(TokenKind::FloatLiteral, start);
            return;
        }
        // `1..5` is a range; leave the periods to the operator scanner.
        if (peek(1) != '.')
        {
            get();
            std::string text(since(start));
            pushError(start,
                      ErrorKind::InvalidNumberFormat,
                      "invalid number '" + text + "': expected digits after '.'",
                      "Write " + text + "0 or drop the trailing '.'");
            return;
        }
    }

    push(TokenKind::IntLiteral, start);
}

void Lexer::lexDateOrFraction(const Mark &start)
{
    int separators = 0;
    bool overflow = false;

    while (position() - start.pos < options_.maxLiteralLength)
    {
        const char c = peek();
        if (isDigit(c))
        {
            get();
            continue;
        }
        if (c == '|')
        {
            if (separators == 2)
            {
                overflow = true;
                break;
            }
            ++separators;
            get();
            continue;
        }
        break;
    }

    std::string text(since(start));
    const bool isDate = separators == 2;
    const ErrorKind kind = isDate ? ErrorKind::InvalidDateFormat : ErrorKind::InvalidFractionFormat;
    const char *what = isDate ? "date" : "fraction";

    if (overflow)
    {
        pushError(start,
                  ErrorKind::InvalidDateFormat,
                  "invalid date literal '" + text + "': too many '|' separators",
                  {},
                  here());
        return;
    }

    if (position() - start.pos >= options_.maxLiteralLength &&
        (isDigit(peek()) || peek() == '|'))
    {
        pushError(start,
                  kind,
                  std::string("invalid ") + what + " literal: longer than " +
                      std::to_string(options_.maxLiteralLength) + " characters",
                  {},
                  here());
        return;
    }

    std::string problem = isDate ? checkDate(text) : checkFraction(text);
    if (!problem.empty())
    {
        pushError(start, kind, std::string("invalid ") + what + " literal '" + text + "': " + problem);
        return;
    }

    push(isDate ? TokenKind::DateLiteral : TokenKind::FractionLiteral, start);
}

//===----------------------------------------------------------------------===//
// Strings and characters
//===----------------------------------------------------------------------===//

void Lexer::lexString(char quote)
{
    Mark open = mark();
    get();
    push(TokenKind::StringDelimiter, open);

    // A char body is one character or one recognized escape.
    std::size_t charWidth = 0;
    if (quote == '\'' && peek() == '\\' && isEscapeLetter(peek(1), quote) && peek(2) == '\'')
        charWidth = 2;
    else if (quote == '\'' && peek() != '\\' && peek() != '\'' && !isNewline(peek()) && !eof() &&
             peek(1) == '\'')
        charWidth = 1;

    if (charWidth > 0)
    {
        Mark body = mark();
        for (std::size_t i = 0; i < charWidth; ++i)
            get();
        push(TokenKind::CharLiteral, body);
        Mark close = mark();
        get();
        push(TokenKind::StringDelimiter, close);
        return;
    }

    Mark segment = mark();
    auto flush = [&]()
    {
        if (position() > segment.pos)
            push(TokenKind::StringLiteral, segment);
    };

    while (true)
    {
        const char c = peek();
        if (eof() || isNewline(c))
        {
            flush();
            diag_.report(ErrorKind::UnterminatedString,
                         "unterminated string literal",
                         locOf(open),
                         std::string("Add a closing ") + quote + " before the end of the line",
                         1);
            return;
        }

        if (c == quote)
        {
            flush();
            Mark close = mark();
            get();
            push(TokenKind::StringDelimiter, close);
            return;
        }

        if (c == '\\')
        {
            flush();
            Mark esc = mark();
            get();
            const char e = peek();
            if (isEscapeLetter(e, quote))
            {
                get();
                push(TokenKind::EscapeChar, esc);
            }
            else
            {
                if (!eof() && !isNewline(e))
                    get();
                std::string text(since(esc));
                pushError(esc,
                          ErrorKind::InvalidEscapeSequence,
                          "invalid escape sequence '" + text + "'");
            }
            segment = mark();
            continue;
        }

        get();
    }
}

//===----------------------------------------------------------------------===//
// Complex numbers
//===----------------------------------------------------------------------===//

void Lexer::lexComplex()
{
    Mark start = mark();
    get();

    if (peek() != '(')
    {
        pushError(start,
                  ErrorKind::InvalidComplexLiteral,
                  "invalid complex literal: expected '(' after '$'");
        return;
    }
    get();

    std::size_t body = 0;
    while (body < options_.maxLiteralLength)
    {
        const char c = peek();
        if (isDigit(c) || c == '-' || c == '.' || c == ',')
        {
            get();
            ++body;
            continue;
        }
        break;
    }

    const char c = peek();
    if (c == ')' && body < options_.maxLiteralLength)
    {
        get();
        std::string text(since(start));
        std::string_view inner = std::string_view(text).substr(2, text.size() - 3);
        auto parts = splitParts(inner, ',');
        if (parts.size() == 2 && isSignedNumber(parts[0]) && isSignedNumber(parts[1]))
        {
            push(TokenKind::ComplexLiteral, start);
            return;
        }
        pushError(start,
                  ErrorKind::InvalidComplexLiteral,
                  "invalid complex literal '" + text + "': expected $(real,imag)");
        return;
    }

    if (eof() || isNewline(c))
    {
        pushError(start,
                  ErrorKind::InvalidComplexLiteral,
                  "unterminated complex literal",
                  "Add closing parenthesis");
        return;
    }

    if (body >= options_.maxLiteralLength)
    {
        pushError(start,
                  ErrorKind::InvalidComplexLiteral,
                  "invalid complex literal: longer than " +
                      std::to_string(options_.maxLiteralLength) + " characters",
                  {},
                  here());
        return;
    }

    pushError(start,
              ErrorKind::InvalidComplexLiteral,
              std::string("invalid character '") + c + "' in complex literal",
              {},
              here());
}

} // namespace xpresso::frontends::xp
