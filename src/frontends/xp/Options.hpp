//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Configuration for the X-presso lexer, parser and front end.
///
/// All options are plain aggregates with defaults. The command-line tool fills
/// a FrontendOptions from its arguments; library callers may construct them
/// directly.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace xpresso::frontends::xp
{

/// @brief Limits applied by the lexer's bounded scans.
struct LexerOptions
{
    /// @brief Longest object type name accepted between `<` and `>`.
    std::size_t maxTypeNameLength{64};

    /// @brief Longest date, fraction or complex literal body scanned.
    std::size_t maxLiteralLength{64};

    /// @brief Widest horizontal gap inside `exit when` and `where type`.
    std::size_t maxKeywordGap{16};
};

struct ParserOptions
{
    /// @brief Deepest expression nesting accepted before NestingTooDeep.
    unsigned maxExpressionDepth{256};

    /// @brief Deepest statement and class nesting accepted before
    ///        NestingTooDeep.
    unsigned maxStatementDepth{256};
};

struct FrontendOptions
{
    LexerOptions lexer{};

    ParserOptions parser{};

    /// @brief Keep the full token stream (trivia included) in the result.
    bool collectTokens{false};

    /// @brief Check the grammar table before parsing.
    bool validateGrammar{true};
};

} // namespace xpresso::frontends::xp
