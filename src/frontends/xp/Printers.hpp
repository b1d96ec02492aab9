//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Printers.hpp
/// @brief Text, JSON and Graphviz renderings of tokens, parse trees and
///        diagnostics.
///
/// @details Example text dump of `x = 2 + 3;`:
/// @code
///   Program (1:1)
///     ExpressionStmt (1:1)
///       AssignExpr (1:1)
///         'x' (1:1)
///         '=' (1:3)
///         BinaryExpr (1:5)
///           '2' (1:5)
///           '+' (1:7)
///           '3' (1:9)
///       ';' (1:10)
/// @endcode
///
/// @invariant Printing never mutates what it prints.
/// @invariant Output is deterministic for reproducible test results.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/DiagnosticSink.hpp"
#include "frontends/xp/ParseTree.hpp"
#include "frontends/xp/Token.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xpresso::frontends::xp
{

/// @brief Escape @p text for use inside a JSON string literal.
[[nodiscard]] std::string jsonEscape(std::string_view text);

/// @brief Indented tree dump, two spaces per level.
void printTree(const ParseTreeNode &node, std::ostream &os);

/// @brief Tree as nested `{"label","terminal","line","column","children"}` objects.
void printTreeJson(const ParseTreeNode &node, std::ostream &os);

/// @brief Graphviz digraph with one vertex per node and parent->child edges.
void printTreeDot(const ParseTreeNode &node, std::ostream &os);

/// @brief One `line:col KIND 'lexeme'` line per token.
/// @param includeTrivia Keep Whitespace, Comment and Eof tokens.
void printTokens(const std::vector<Token> &tokens, std::ostream &os, bool includeTrivia);

/// @brief JSON array of `{"type","lexeme","line","column"}` objects.
void printTokensJson(const std::vector<Token> &tokens, std::ostream &os, bool includeTrivia);

/// @brief JSON array of `{"type","code","message","line","column","suggestion"}`
///        objects; `suggestion` is omitted when empty.
void printDiagnosticsJson(const std::vector<Diagnostic> &diags, std::ostream &os);

} // namespace xpresso::frontends::xp
