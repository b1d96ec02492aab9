//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/xp/DiagnosticSink.hpp
// Purpose: Accumulates lexical, syntax and scope diagnostics of one run and
//          renders them with source snippets.
// Key invariants: Reporting never throws and never stops the caller; every
//                 report is mirrored into the shared DiagnosticEngine.
// Ownership/Lifetime: Borrows the DiagnosticEngine; copies source text per
//                     registered file id.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/ErrorKind.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace xpresso::support
{
class SourceManager;
}

namespace xpresso::frontends::xp
{

/// @brief One front-end diagnostic.
struct Diagnostic
{
    ErrorKind kind;
    std::string message;
    support::SourceLoc loc;
    std::string suggestion; ///< Empty when no fix is known.
    uint32_t length = 0;    ///< Characters to underline; 0 means one caret.
};

/// @brief Collects diagnostics from the lexer and the parser.
class DiagnosticSink
{
  public:
    explicit DiagnosticSink(support::DiagnosticEngine &engine);

    /// @brief Record a diagnostic.
    /// @param suggestion Fix-it text; the kind's default is used when empty.
    /// @param length Number of source characters the diagnostic covers.
    void report(ErrorKind kind,
                std::string message,
                support::SourceLoc loc,
                std::string suggestion = {},
                uint32_t length = 0);

    /// @brief True when anything has been reported.
    [[nodiscard]] bool hasErrors() const
    {
        return !entries_.empty();
    }

    /// @brief All diagnostics in report order.
    [[nodiscard]] const std::vector<Diagnostic> &all() const
    {
        return entries_;
    }

    [[nodiscard]] std::size_t count(ErrorKind kind) const;

    [[nodiscard]] std::size_t countPhase(ErrorPhase phase) const;

    /// @brief Register source text so printAll() can show the offending line.
    void addSource(uint32_t fileId, std::string source);

    /// @brief Print every diagnostic with its source line, caret and suggestion.
    void printAll(std::ostream &os, const support::SourceManager *sm = nullptr) const;

    /// @brief Print a per-kind count table in order of first occurrence.
    void printStatistics(std::ostream &os) const;

    [[nodiscard]] support::DiagnosticEngine &engine()
    {
        return engine_;
    }

  private:
    /// @brief Line @p line of the registered source for @p fileId, or "".
    std::string getLine(uint32_t fileId, uint32_t line) const;

    support::DiagnosticEngine &engine_;
    std::vector<Diagnostic> entries_;
    std::unordered_map<uint32_t, std::string> sources_;
};

} // namespace xpresso::frontends::xp
