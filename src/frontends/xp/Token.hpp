//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the X-presso lexer.
///
/// The kind set is closed and deliberately coarse: operators are grouped by
/// role (arithmetic, relational, ...) and the exact operator is read from the
/// lexeme. The parser therefore matches on `(kind, text)` pairs, for example
/// `tok.is(TokenKind::AssignOp, "+=")`.
///
/// ## Lexeme fidelity
///
/// `text` is always the exact substring the token was scanned from. Quotes
/// of a string are separate StringDelimiter tokens and the brackets of an
/// object type `<Name>` are separate ObjectDelimiter tokens, so concatenating
/// every lexeme, trivia included, reproduces the source byte for byte. The
/// single Eof token at the end of every stream has an empty lexeme.
///
/// @invariant Each token has a valid TokenKind and SourceLoc.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>
#include <string_view>

namespace xpresso::frontends::xp
{

using SourceLoc = xpresso::support::SourceLoc;

/// @brief Enumeration of all token kinds produced by the X-presso lexer.
enum class TokenKind
{
    // Words
    Identifier,   ///< User name: `count`, `Account`
    Keyword,      ///< Statement keyword: `if`, `while`, `exit when`
    ReservedWord, ///< Type or modifier word: `int`, `public`, `class`

    // Literals
    BoolLiteral,     ///< `true`, `false`
    IntLiteral,      ///< `42`
    FloatLiteral,    ///< `3.14`
    StringLiteral,   ///< Body segment of a string, or an object type name
    CharLiteral,     ///< Body of a one-character single-quoted literal
    NullLiteral,     ///< `null`
    DateLiteral,     ///< `2024|09|20`
    FractionLiteral, ///< `22|7`
    ComplexLiteral,  ///< `$(1.5,-2)`

    // Operators
    ArithmeticOp, ///< `+ - * / % ^` (binary position)
    AssignOp,     ///< `= += -= *= /= %= ?=`
    RelationalOp, ///< `== != < > <= >=`
    LogicalOp,    ///< `&& || !`
    BitwiseOp,    ///< `& | ~ << >> >>>`
    UnaryOp,      ///< `++ -- **` and `+`/`-` in unary position
    MethodOp,     ///< `. :: ->`
    LoopOp,       ///< `.. ...`
    InheritOp,    ///< `:> :>>`

    // Delimiters
    Delimiter,       ///< `( ) [ ] { }`
    PunctDelimiter,  ///< `, ; ? @ :`
    StringDelimiter, ///< `"` or `'`
    ObjectDelimiter, ///< `<` or `>` around an object type name

    // Trivia and specials
    Comment,    ///< `// ...` or `/* ... */`
    Whitespace, ///< Run of whitespace characters
    EscapeChar, ///< Recognized escape inside a string: `\n`
    Eof,        ///< End of input
    Unknown,    ///< Text that failed to scan; always paired with a diagnostic
};

/// @brief A lexical token.
struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string text; ///< Exact lexeme.
    SourceLoc loc{};

    [[nodiscard]] bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Match both kind and exact lexeme.
    [[nodiscard]] bool is(TokenKind k, std::string_view lexeme) const
    {
        return kind == k && text == lexeme;
    }

    template <typename... Kinds>
    [[nodiscard]] bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief Whitespace or comment.
    [[nodiscard]] bool isTrivia() const;

    /// @brief Any of the operator kinds.
    [[nodiscard]] bool isOperator() const;

    /// @brief Any single-token literal kind.
    [[nodiscard]] bool isLiteral() const;
};

/// @brief Stable upper-case name of @p kind, e.g. "INT_LIT".
[[nodiscard]] const char *tokenKindToString(TokenKind kind);

/// @brief True for the kinds that count as "any operator" for the unary rule.
[[nodiscard]] bool isOperatorKind(TokenKind kind);

} // namespace xpresso::frontends::xp
