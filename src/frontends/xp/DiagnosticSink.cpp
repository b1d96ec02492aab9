//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the X-presso diagnostic sink. Diagnostics are kept in the order
// they were reported; lexer diagnostics for a region therefore precede the
// parser diagnostics for the same region because the parser pulls tokens
// lazily.
//
//===----------------------------------------------------------------------===//

#include "frontends/xp/DiagnosticSink.hpp"

#include "support/source_manager.hpp"

#include <algorithm>
#include <iomanip>

namespace xpresso::frontends::xp
{

DiagnosticSink::DiagnosticSink(support::DiagnosticEngine &engine) : engine_(engine) {}

void DiagnosticSink::report(ErrorKind kind,
                            std::string message,
                            support::SourceLoc loc,
                            std::string suggestion,
                            uint32_t length)
{
    if (suggestion.empty())
        suggestion = std::string(getInfo(kind).suggestion);

    engine_.report(support::Diagnostic{support::Severity::Error,
                                       message,
                                       loc,
                                       std::string(errorKindCode(kind)),
                                       suggestion});
    entries_.push_back(Diagnostic{kind, std::move(message), loc, std::move(suggestion), length});
}

std::size_t DiagnosticSink::count(ErrorKind kind) const
{
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(), [kind](const Diagnostic &d) { return d.kind == kind; }));
}

std::size_t DiagnosticSink::countPhase(ErrorPhase phase) const
{
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [phase](const Diagnostic &d) {
        return errorPhase(d.kind) == phase;
    }));
}

void DiagnosticSink::addSource(uint32_t fileId, std::string source)
{
    sources_[fileId] = std::move(source);
}

std::string DiagnosticSink::getLine(uint32_t fileId, uint32_t line) const
{
    auto it = sources_.find(fileId);
    if (it == sources_.end() || line == 0)
        return {};

    const std::string &src = it->second;
    std::size_t start = 0;
    for (uint32_t current = 1; current < line; ++current)
    {
        start = src.find('\n', start);
        if (start == std::string::npos)
            return {};
        ++start;
    }
    std::size_t end = src.find('\n', start);
    std::string text = src.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!text.empty() && text.back() == '\r')
        text.pop_back();
    return text;
}

/// @brief Print diagnostics in the form
///        `path:line:col: error[CODE]: message`, the source line, a caret
///        underline and an indented suggestion.
void DiagnosticSink::printAll(std::ostream &os, const support::SourceManager *sm) const
{
    for (const auto &d : entries_)
    {
        bool wroteLocation = false;
        if (sm && d.loc.hasFile())
        {
            auto path = sm->getPath(d.loc.file_id);
            if (!path.empty())
            {
                os << path;
                wroteLocation = true;
            }
        }
        if (d.loc.isValid())
        {
            if (wroteLocation)
                os << ':';
            os << d.loc.line << ':' << d.loc.column;
            wroteLocation = true;
        }
        if (wroteLocation)
            os << ": ";
        os << "error[" << errorKindCode(d.kind) << "]: " << d.message << '\n';

        std::string line = getLine(d.loc.file_id, d.loc.line);
        if (!line.empty() && d.loc.column != 0)
        {
            os << "    " << line << '\n';
            uint32_t caretLen = d.length == 0 ? 1 : d.length;
            std::size_t indent = d.loc.column - 1;
            if (indent < line.size())
                caretLen = static_cast<uint32_t>(std::min<std::size_t>(caretLen, line.size() - indent));
            os << "    " << std::string(indent, ' ') << std::string(caretLen, '^') << '\n';
        }
        if (!d.suggestion.empty())
            os << "  suggestion: " << d.suggestion << '\n';
    }
}

void DiagnosticSink::printStatistics(std::ostream &os) const
{
    std::vector<std::pair<ErrorKind, std::size_t>> counts;
    for (const auto &d : entries_)
    {
        auto it = std::find_if(counts.begin(), counts.end(), [&](const auto &p) { return p.first == d.kind; });
        if (it == counts.end())
            counts.emplace_back(d.kind, 1);
        else
            ++it->second;
    }

    os << "Error Statistics:\n";
    for (const auto &[kind, n] : counts)
        os << "  " << std::left << std::setw(26) << errorKindId(kind) << " : " << n << '\n';
    os << "  " << std::left << std::setw(26) << "TOTAL" << " : " << entries_.size() << '\n';
}

} // namespace xpresso::frontends::xp
