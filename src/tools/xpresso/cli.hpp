//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/xpresso/cli.hpp
// Purpose: Command-line configuration and report driver for `xpresso`.
// Key invariants: parseArgs() never exits the process; runXpresso() returns
//                 1 only for I/O failure, 0 after any completed run.
// Ownership/Lifetime: Config is a plain value owned by the caller.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <ostream>
#include <string>

namespace xpresso::tools
{

enum class OutputFormat
{
    Text,
    Json,
};

enum class TreeFormat
{
    None,
    Text,
    Json,
    Dot,
};

/// @brief What the invocation asked for.
enum class CliAction
{
    Run,
    Help,
    Version,
};

/// @brief Configuration parsed from `xpresso` command-line arguments.
struct XpressoConfig
{
    CliAction action{CliAction::Run};
    std::string sourcePath;
    std::string outputPath; ///< Empty writes the report to stdout.
    bool verbose = false;
    bool dumpTokens = false;
    OutputFormat output{OutputFormat::Text};
    TreeFormat tree{TreeFormat::None};
    bool treeGiven = false; ///< --tree was passed explicitly.
};

/// @brief Parse `xpresso` arguments; argv[0] is skipped.
/// @return The configuration, or a diagnostic describing the misuse.
xpresso::support::Expected<XpressoConfig> parseArgs(int argc, const char *const *argv);

/// @brief Parse the configured file and write the report.
/// @param out Report stream used when no output path is configured.
/// @param err Stream receiving text diagnostics and tool errors.
/// @return Process exit status.
int runXpresso(const XpressoConfig &config, std::ostream &out, std::ostream &err);

void printUsage(std::ostream &os);

void printVersion(std::ostream &os);

} // namespace xpresso::tools
