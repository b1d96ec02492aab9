//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "tools/xpresso/cli.hpp"
#include "xpresso/version.hpp"

namespace xpresso::tools
{

void printVersion(std::ostream &os)
{
    os << "xpresso v" << XPRESSO_VERSION_STR << "\n";
    os << "X-presso Front End (lexer and parser)\n";
}

void printUsage(std::ostream &os)
{
    os << "xpresso v" << XPRESSO_VERSION_STR << " - X-presso Front End\n"
       << "\n"
       << "Usage: xpresso [options] <file>\n"
       << "\n"
       << "Options:\n"
       << "  --verbose                 Include trivia tokens, parse tree and statistics\n"
       << "  --output=text|json        Report format (default: text)\n"
       << "  --tree=none|text|json|dot Parse tree export (default: none, text with --verbose)\n"
       << "  --tokens                  Dump the token stream\n"
       << "  -o, --out FILE            Write the report to FILE\n"
       << "  -h, --help                Show this help message\n"
       << "  --version                 Show version information\n"
       << "\n"
       << "Exit status is 0 after a completed run, even when the input has errors,\n"
       << "and 1 when a file cannot be read or written or the usage is invalid.\n"
       << "\n"
       << "Examples:\n"
       << "  xpresso bank.xp                     Report diagnostics\n"
       << "  xpresso --tokens --verbose bank.xp  Dump every token\n"
       << "  xpresso --tree=dot -o tree.dot bank.xp\n"
       << "\n";
}

} // namespace xpresso::tools
