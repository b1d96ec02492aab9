//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the out-of-line half of Expected<void> together with the helpers
// that build and print diagnostics. Tools and the front end share printDiag so
// a loader failure and a parse error read the same way on the terminal.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace xpresso::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Success is the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code), {}};
}

/// @brief Render @p diag in the usual compiler style.
/// @details The location prefix is emitted only for the parts that are known:
///          a path needs a SourceManager and a registered file, while line and
///          column are printed even for unregistered buffers.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wroteLocation = false;
    if (sm && diag.loc.hasFile())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            wroteLocation = true;
        }
    }
    if (diag.loc.isValid())
    {
        if (wroteLocation)
            os << ':';
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        wroteLocation = true;
    }
    if (wroteLocation)
        os << ": ";

    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
    if (!diag.suggestion.empty())
        os << "  suggestion: " << diag.suggestion << '\n';
}
} // namespace xpresso::support
