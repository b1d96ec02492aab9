//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/xpresso/cli.cpp
// Purpose: Argument parsing and report rendering for the `xpresso` tool.
// Key invariants: Diagnostics in the input never change the exit status.
// Ownership/Lifetime: The report file stream is scoped to runXpresso().
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "tools/xpresso/cli.hpp"

#include "frontends/xp/Frontend.hpp"
#include "frontends/xp/GrammarTable.hpp"
#include "frontends/xp/Printers.hpp"
#include "support/source_manager.hpp"

#include <fstream>
#include <string_view>

namespace xpresso::tools
{

using xpresso::support::Expected;
using xpresso::support::makeError;

namespace xp = xpresso::frontends::xp;

namespace
{

Expected<XpressoConfig> usageError(std::string message)
{
    return makeError({}, std::move(message));
}

/// @brief Split `--name=value`; @p value is empty when no '=' is present.
bool splitOption(std::string_view arg, std::string_view name, std::string_view &value)
{
    if (arg.substr(0, name.size()) != name)
        return false;
    if (arg.size() == name.size())
    {
        value = {};
        return true;
    }
    if (arg[name.size()] != '=')
        return false;
    value = arg.substr(name.size() + 1);
    return true;
}

void renderTree(const xp::ParseTreeNode &tree, TreeFormat format, std::ostream &os)
{
    switch (format)
    {
        case TreeFormat::None:
            break;
        case TreeFormat::Text:
            xp::printTree(tree, os);
            break;
        case TreeFormat::Json:
            xp::printTreeJson(tree, os);
            break;
        case TreeFormat::Dot:
            xp::printTreeDot(tree, os);
            break;
    }
}

void writeTextReport(const XpressoConfig &config,
                     TreeFormat tree,
                     const xp::FrontendResult &result,
                     const xp::DiagnosticSink &sink,
                     const xpresso::support::SourceManager &sm,
                     std::ostream &os,
                     std::ostream &err)
{
    if (config.dumpTokens)
    {
        os << "Tokens:\n";
        xp::printTokens(result.tokens, os, config.verbose);
        os << '\n';
    }

    if (tree != TreeFormat::None && result.tree)
    {
        if (tree == TreeFormat::Text)
            os << "Parse Tree:\n";
        renderTree(*result.tree, tree, os);
        os << '\n';
    }

    sink.printAll(err, &sm);

    if (result.diagnostics.empty())
        os << config.sourcePath << ": no errors found\n";
    else
        os << config.sourcePath << ": " << result.diagnostics.size() << " error(s)\n";

    if (config.verbose)
    {
        sink.printStatistics(os);
        os << "Declarations: " << result.declarationCount << '\n';
    }
}

void writeJsonReport(const XpressoConfig &config,
                     TreeFormat tree,
                     const xp::FrontendResult &result,
                     std::ostream &os)
{
    os << "{\n\"file\": \"" << xp::jsonEscape(config.sourcePath) << "\",\n";
    os << "\"success\": " << (result.succeeded() ? "true" : "false") << ",\n";
    if (config.dumpTokens)
    {
        os << "\"tokens\": ";
        xp::printTokensJson(result.tokens, os, config.verbose);
        os << ",\n";
    }
    // Text and DOT trees cannot be embedded in JSON; any tree request
    // renders as JSON here.
    if (tree != TreeFormat::None && result.tree)
    {
        os << "\"tree\":\n";
        xp::printTreeJson(*result.tree, os);
        os << ",\n";
    }
    if (config.verbose)
        os << "\"declarations\": " << result.declarationCount << ",\n";
    os << "\"diagnostics\": ";
    xp::printDiagnosticsJson(result.diagnostics, os);
    os << "}\n";
}

} // namespace

//===----------------------------------------------------------------------===//
// Argument parsing
//===----------------------------------------------------------------------===//

Expected<XpressoConfig> parseArgs(int argc, const char *const *argv)
{
    XpressoConfig config{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        std::string_view value;

        if (arg == "-h" || arg == "--help")
        {
            config.action = CliAction::Help;
            return config;
        }
        if (arg == "--version")
        {
            config.action = CliAction::Version;
            return config;
        }
        if (arg == "--verbose" || arg == "-v")
        {
            config.verbose = true;
        }
        else if (arg == "--tokens")
        {
            config.dumpTokens = true;
        }
        else if (splitOption(arg, "--output", value))
        {
            if (value == "text")
                config.output = OutputFormat::Text;
            else if (value == "json")
                config.output = OutputFormat::Json;
            else
                return usageError("invalid --output value '" + std::string(value) +
                                  "' (expected text or json)");
        }
        else if (splitOption(arg, "--tree", value))
        {
            if (value == "none")
                config.tree = TreeFormat::None;
            else if (value == "text")
                config.tree = TreeFormat::Text;
            else if (value == "json")
                config.tree = TreeFormat::Json;
            else if (value == "dot")
                config.tree = TreeFormat::Dot;
            else
                return usageError("invalid --tree value '" + std::string(value) +
                                  "' (expected none, text, json or dot)");
            config.treeGiven = true;
        }
        else if (arg == "-o" || arg == "--out")
        {
            if (i + 1 >= argc)
                return usageError(std::string(arg) + " requires an output path");
            config.outputPath = argv[++i];
        }
        else if (splitOption(arg, "--out", value) && !value.empty())
        {
            config.outputPath = std::string(value);
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return usageError("unknown option: " + std::string(arg));
        }
        else
        {
            if (!config.sourcePath.empty())
                return usageError("multiple source files not supported");
            config.sourcePath = std::string(arg);
        }
    }

    if (config.sourcePath.empty())
        return usageError("no input file specified");
    return config;
}

//===----------------------------------------------------------------------===//
// Report
//===----------------------------------------------------------------------===//

int runXpresso(const XpressoConfig &config, std::ostream &out, std::ostream &err)
{
    std::ofstream file;
    if (!config.outputPath.empty())
    {
        file.open(config.outputPath);
        if (!file)
        {
            err << "error[X0001]: failed to open output file: " << config.outputPath << '\n';
            return 1;
        }
    }
    std::ostream &os = config.outputPath.empty() ? out : file;

    // One grammar per run, passed by reference into the front end.
    const xp::GrammarTable grammar = xp::GrammarTable::standard();

    xp::FrontendOptions options{};
    options.collectTokens = config.dumpTokens;

    xpresso::support::SourceManager sm;
    xpresso::support::DiagnosticEngine engine;
    xp::DiagnosticSink sink(engine);

    xp::FrontendResult result = xp::parseFile(config.sourcePath, options, grammar, sm, sink);
    if (result.ioError)
    {
        xpresso::support::printDiag(*result.ioError, err, &sm);
        return 1;
    }

    TreeFormat tree = config.tree;
    if (!config.treeGiven && config.verbose)
        tree = TreeFormat::Text;

    if (config.output == OutputFormat::Json)
        writeJsonReport(config, tree, result, os);
    else
        writeTextReport(config, tree, result, sink, sm, os, err);

    os.flush();
    if (!os)
    {
        err << "error[X0001]: failed to write report";
        if (!config.outputPath.empty())
            err << " to " << config.outputPath;
        err << '\n';
        return 1;
    }
    return 0;
}

} // namespace xpresso::tools
