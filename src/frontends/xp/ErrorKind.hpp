//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/xp/ErrorKind.hpp
// Purpose: Diagnostic vocabulary of the X-presso front end.
// Key invariants: Codes are stable and unique; the thousands digit encodes
//                 the phase (0 fatal, 1 lexical, 2 syntax, 3 scope). Do not
//                 reorder enumerators without updating the descriptor table.
// Ownership/Lifetime: All returned string_views point to static storage.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace xpresso::frontends::xp
{

/// @brief Phase that produced a diagnostic.
enum class ErrorPhase
{
    Fatal,
    Lexical,
    Syntax,
    Scope
};

/// @brief Every diagnostic the front end can report.
enum class ErrorKind
{
    // Fatal
    IoFailure, ///< Source could not be read or report could not be written.

    // Lexical
    InvalidCharacter,      ///< Character that starts no token.
    UnterminatedString,    ///< Newline or end of input inside quotes.
    UnterminatedComment,   ///< `/*` without `*/`.
    InvalidEscapeSequence, ///< Backslash followed by an unknown escape.
    InvalidIdentifier,     ///< Hyphenated name or name starting with a digit.
    InvalidNumberFormat,   ///< Number ending in a bare period.
    InvalidDateFormat,     ///< Date literal failing range or shape checks.
    InvalidFractionFormat, ///< Fraction with missing part or zero denominator.
    InvalidComplexLiteral, ///< `$(...)` not of the form `$(real,imag)`.
    MismatchedDelimiters,  ///< Closing bracket with no matching opener.
    InvalidOperator,       ///< Operator run longer than any valid operator.

    // Syntax
    UnexpectedToken,      ///< Token that cannot start or continue a construct.
    MissingToken,         ///< Required brace, paren, semicolon or colon absent.
    UnexpectedEndOfInput, ///< Input ended inside a construct.
    InvalidSyntax,        ///< Construct that cannot be recovered locally.
    NestingTooDeep,       ///< Expression or statement nesting over the limit.

    // Scope
    DuplicateDeclaration, ///< Name declared twice in one scope.
};

/// @brief Static metadata for one ErrorKind.
struct ErrorKindInfo
{
    std::string_view id;   ///< Enumerator-like name, e.g. "INVALID_DATE_FORMAT".
    std::string_view code; ///< Stable code, e.g. "X1007".
    ErrorPhase phase;
    std::string_view suggestion; ///< Default suggestion when the caller gives none.
};

[[nodiscard]] const ErrorKindInfo &getInfo(ErrorKind kind);

[[nodiscard]] std::string_view errorKindId(ErrorKind kind);

[[nodiscard]] std::string_view errorKindCode(ErrorKind kind);

[[nodiscard]] ErrorPhase errorPhase(ErrorKind kind);

[[nodiscard]] std::string_view errorPhaseName(ErrorPhase phase);

} // namespace xpresso::frontends::xp
