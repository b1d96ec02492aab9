//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the xpresso command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `xpresso` CLI tool.
/// @details Parses arguments, then either prints help/version text or runs
///          the front end over one file and renders the report.

#include "tools/xpresso/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    using namespace xpresso::tools;

    if (argc < 2)
    {
        printUsage(std::cerr);
        return 1;
    }

    auto config = parseArgs(argc, argv);
    if (!config)
    {
        xpresso::support::printDiag(config.error(), std::cerr);
        std::cerr << "\n";
        printUsage(std::cerr);
        return 1;
    }

    switch (config.value().action)
    {
        case CliAction::Help:
            printUsage(std::cout);
            return 0;
        case CliAction::Version:
            printVersion(std::cout);
            return 0;
        case CliAction::Run:
            break;
    }
    return runXpresso(config.value(), std::cout, std::cerr);
}
