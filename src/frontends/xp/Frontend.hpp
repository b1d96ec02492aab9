//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.hpp
/// @brief X-presso front-end driver: lexing and parsing of one source.
///
/// @details Wires Lexer, GrammarTable, Parser and SymbolTable together. The
/// caller supplies the DiagnosticSink so it can render or count diagnostics
/// across several runs.
///
/// ```cpp
/// support::SourceManager sm;
/// support::DiagnosticEngine engine;
/// DiagnosticSink sink(engine);
/// const GrammarTable grammar = GrammarTable::standard();
/// FrontendResult result = parseFile("bank.xp", FrontendOptions{}, grammar, sm, sink);
/// if (!result.ioError)
///     printTree(*result.tree, std::cout);
/// sink.printAll(std::cerr, &sm);
/// ```
///
/// @invariant result.tree is non-null unless result.ioError is set.
/// @invariant Malformed input never aborts the run; only I/O failure does.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/DiagnosticSink.hpp"
#include "frontends/xp/GrammarTable.hpp"
#include "frontends/xp/Options.hpp"
#include "frontends/xp/ParseTree.hpp"
#include "frontends/xp/Token.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpresso::frontends::xp
{

struct FrontendInput
{
    /// @brief X-presso source text.
    std::string_view source;

    /// @brief Path used for diagnostics; defaults to "<input>".
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

struct FrontendResult
{
    /// @brief Root `Program` node.
    NodePtr tree;

    /// @brief Full token stream, trivia included; filled when
    ///        FrontendOptions::collectTokens is set.
    std::vector<Token> tokens;

    /// @brief Diagnostics reported during this run, in report order.
    std::vector<Diagnostic> diagnostics;

    uint32_t fileId{0};

    /// @brief Declarations entered into the symbol table.
    std::size_t declarationCount{0};

    /// @brief Set when the source could not be read or the grammar failed
    ///        validation; no parse was attempted.
    std::optional<support::Diagnostic> ioError;

    /// @brief True when the run completed without any diagnostic.
    [[nodiscard]] bool succeeded() const;

    [[nodiscard]] std::size_t count(ErrorKind kind) const;
};

/// @brief Lex and parse @p input against @p grammar.
/// @details The grammar is built once by the caller, usually with
///          GrammarTable::standard(), and may be shared across runs.
FrontendResult parseSource(const FrontendInput &input,
                           const FrontendOptions &options,
                           const GrammarTable &grammar,
                           support::SourceManager &sm,
                           DiagnosticSink &sink);

/// @brief Load @p path and parse it; load failures set result.ioError.
FrontendResult parseFile(const std::string &path,
                         const FrontendOptions &options,
                         const GrammarTable &grammar,
                         support::SourceManager &sm,
                         DiagnosticSink &sink);

} // namespace xpresso::frontends::xp
