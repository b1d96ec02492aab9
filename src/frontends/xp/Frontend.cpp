//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.cpp
/// @brief Implements parseSource() and parseFile().
///
/// @details One run registers the source with the sink so printAll() can
/// quote lines, lexes and parses it, then copies the diagnostics the run
/// added into the result. The grammar is validated first when requested; a
/// table that fails validation aborts the run the same way an I/O failure
/// does, since parsing against it would be meaningless.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Frontend.hpp"
#include "frontends/xp/Lexer.hpp"
#include "frontends/xp/Parser.hpp"
#include "frontends/xp/SymbolTable.hpp"
#include "support/source_loader.hpp"

#include <algorithm>
#include <utility>

namespace xpresso::frontends::xp
{

bool FrontendResult::succeeded() const
{
    return !ioError && tree && diagnostics.empty();
}

std::size_t FrontendResult::count(ErrorKind kind) const
{
    return static_cast<std::size_t>(std::count_if(
        diagnostics.begin(), diagnostics.end(), [kind](const Diagnostic &d) { return d.kind == kind; }));
}

FrontendResult parseSource(const FrontendInput &input,
                           const FrontendOptions &options,
                           const GrammarTable &grammar,
                           support::SourceManager &sm,
                           DiagnosticSink &sink)
{
    FrontendResult result{};

    if (options.validateGrammar)
    {
        if (auto valid = grammar.validate(); !valid)
        {
            result.ioError = valid.error();
            return result;
        }
    }

    result.fileId = input.fileId ? *input.fileId : sm.addFile(std::string(input.path));
    sink.addSource(result.fileId, std::string(input.source));

    const std::size_t firstDiag = sink.all().size();

    Lexer lexer(std::string(input.source), result.fileId, sink, options.lexer);
    if (options.collectTokens)
        lexer.setTokenLog(&result.tokens);

    SymbolTable symbols;
    Parser parser(lexer, grammar, sink, symbols, options.parser);
    result.tree = parser.parseProgram();
    result.declarationCount = symbols.declarationCount();

    const auto &all = sink.all();
    result.diagnostics.assign(all.begin() + static_cast<std::ptrdiff_t>(firstDiag), all.end());
    return result;
}

FrontendResult parseFile(const std::string &path,
                         const FrontendOptions &options,
                         const GrammarTable &grammar,
                         support::SourceManager &sm,
                         DiagnosticSink &sink)
{
    auto loaded = support::loadSourceBuffer(path, sm);
    if (!loaded)
    {
        FrontendResult result{};
        result.ioError = loaded.error();
        return result;
    }

    FrontendInput input{};
    input.source = loaded.value().buffer;
    input.path = path;
    input.fileId = loaded.value().fileId;
    return parseSource(input, options, grammar, sm, sink);
}

} // namespace xpresso::frontends::xp
