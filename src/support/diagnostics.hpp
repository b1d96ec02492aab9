//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the phase-neutral diagnostic record and the engine that
//          collects them for a run.
// Key invariants: errorCount()/warningCount() always equal the number of
//                 stored diagnostics of that severity.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace xpresso::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;      ///< Message severity
    std::string message;    ///< Human-readable text
    SourceLoc loc;          ///< Optional source location
    std::string code{};     ///< Stable code such as "X1004"; may be empty
    std::string suggestion{}; ///< How to fix it; may be empty
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param sm Optional source manager used to resolve file paths.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    [[nodiscard]] std::size_t errorCount() const;

    /// @brief Number of warnings reported.
    [[nodiscard]] std::size_t warningCount() const;

    /// @brief All diagnostics in report order.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    std::size_t errors_ = 0;
    std::size_t warnings_ = 0;
};
} // namespace xpresso::support
