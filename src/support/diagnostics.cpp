//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the diagnostic engine shared by the front end and tools.
/// @details The engine is deliberately dumb: it stores records in arrival
///          order and keeps per-severity counters. Front-end specific
///          classification (error kinds, phases) lives in the sink layered on
///          top of it.

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace xpresso::support
{
/// @brief Append @p d and bump the counter matching its severity.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Print every stored diagnostic through printDiag().
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

std::size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

std::size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace xpresso::support
