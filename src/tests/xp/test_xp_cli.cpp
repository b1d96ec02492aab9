//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/test_xp_cli.cpp
// Purpose: Command-line parsing and report rendering of the `xpresso` tool.
// Key invariants: Diagnostics in the input never change the exit status;
//                 unreadable input does.
// Ownership/Lifetime: Temporary files are removed by the test that made them.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tools/xpresso/cli.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace xpresso::tools;

namespace
{

xpresso::support::Expected<XpressoConfig> parse(std::vector<const char *> args)
{
    args.insert(args.begin(), "xpresso");
    return parseArgs(static_cast<int>(args.size()), args.data());
}

std::filesystem::path writeTemp(const std::string &name, const std::string &contents)
{
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
}

} // namespace

TEST(XpCli, DefaultsWithOneFile)
{
    auto config = parse({"bank.xp"});
    ASSERT_TRUE(static_cast<bool>(config));
    EXPECT_EQ(config.value().action, CliAction::Run);
    EXPECT_EQ(config.value().sourcePath, "bank.xp");
    EXPECT_EQ(config.value().output, OutputFormat::Text);
    EXPECT_EQ(config.value().tree, TreeFormat::None);
    EXPECT_FALSE(config.value().verbose);
    EXPECT_FALSE(config.value().dumpTokens);
    EXPECT_TRUE(config.value().outputPath.empty());
}

TEST(XpCli, AllOptions)
{
    auto config = parse({"-v", "--tokens", "--output=json", "--tree=dot", "-o", "out.json", "bank.xp"});
    ASSERT_TRUE(static_cast<bool>(config));
    EXPECT_TRUE(config.value().verbose);
    EXPECT_TRUE(config.value().dumpTokens);
    EXPECT_EQ(config.value().output, OutputFormat::Json);
    EXPECT_EQ(config.value().tree, TreeFormat::Dot);
    EXPECT_TRUE(config.value().treeGiven);
    EXPECT_EQ(config.value().outputPath, "out.json");

    auto eq = parse({"--out=report.txt", "bank.xp"});
    ASSERT_TRUE(static_cast<bool>(eq));
    EXPECT_EQ(eq.value().outputPath, "report.txt");
}

TEST(XpCli, HelpAndVersionShortCircuit)
{
    // Options are read in order; an unknown one before -h is still an error.
    auto unknownFirst = parse({"--bogus", "-h"});
    EXPECT_FALSE(static_cast<bool>(unknownFirst));

    auto helpFirst = parse({"-h", "--bogus"});
    ASSERT_TRUE(static_cast<bool>(helpFirst));
    EXPECT_EQ(helpFirst.value().action, CliAction::Help);

    auto version = parse({"--version"});
    ASSERT_TRUE(static_cast<bool>(version));
    EXPECT_EQ(version.value().action, CliAction::Version);
}

TEST(XpCli, UsageErrors)
{
    auto none = parse({});
    ASSERT_FALSE(static_cast<bool>(none));
    EXPECT_NE(none.error().message.find("no input file"), std::string::npos);

    auto two = parse({"a.xp", "b.xp"});
    ASSERT_FALSE(static_cast<bool>(two));
    EXPECT_NE(two.error().message.find("multiple source files"), std::string::npos);

    auto unknown = parse({"--frobnicate", "a.xp"});
    ASSERT_FALSE(static_cast<bool>(unknown));
    EXPECT_NE(unknown.error().message.find("unknown option: --frobnicate"), std::string::npos);

    auto badTree = parse({"--tree=svg", "a.xp"});
    ASSERT_FALSE(static_cast<bool>(badTree));
    EXPECT_NE(badTree.error().message.find("svg"), std::string::npos);

    auto badOutput = parse({"--output=xml", "a.xp"});
    EXPECT_FALSE(static_cast<bool>(badOutput));

    auto noPath = parse({"a.xp", "-o"});
    ASSERT_FALSE(static_cast<bool>(noPath));
    EXPECT_NE(noPath.error().message.find("requires an output path"), std::string::npos);
}

TEST(XpCli, TextReportForCleanFile)
{
    auto path = writeTemp("xpresso_cli_ok.xp", "class A { int x = 1; }\n");
    XpressoConfig config{};
    config.sourcePath = path.string();
    config.tree = TreeFormat::Text;
    config.treeGiven = true;

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runXpresso(config, out, err), 0);
    EXPECT_NE(out.str().find("Parse Tree:\nProgram (1:1)"), std::string::npos);
    EXPECT_NE(out.str().find(path.string() + ": no errors found"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
    std::filesystem::remove(path);
}

TEST(XpCli, ErrorsDoNotChangeExitStatus)
{
    auto path = writeTemp("xpresso_cli_bad.xp", "x = ;\ny = [2024|13|01];\n");
    XpressoConfig config{};
    config.sourcePath = path.string();
    config.verbose = true;

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runXpresso(config, out, err), 0);
    EXPECT_NE(out.str().find(": 2 error(s)"), std::string::npos);
    EXPECT_NE(out.str().find("Error Statistics:"), std::string::npos);
    EXPECT_NE(out.str().find("Declarations: 0"), std::string::npos);
    EXPECT_NE(err.str().find("error[X2001]"), std::string::npos);
    EXPECT_NE(err.str().find("error[X1007]"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(XpCli, JsonReport)
{
    auto path = writeTemp("xpresso_cli_json.xp", "x = 1;\n");
    XpressoConfig config{};
    config.sourcePath = path.string();
    config.output = OutputFormat::Json;
    config.dumpTokens = true;
    config.tree = TreeFormat::Json;

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runXpresso(config, out, err), 0);
    const std::string report = out.str();
    EXPECT_EQ(report.rfind("{\n\"file\": ", 0), 0u);
    EXPECT_NE(report.find("\"success\": true"), std::string::npos);
    EXPECT_NE(report.find("\"tokens\": ["), std::string::npos);
    EXPECT_NE(report.find("\"tree\":\n{\"label\": \"Program\""), std::string::npos);
    EXPECT_NE(report.find("\"diagnostics\": []"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(XpCli, MissingInputFails)
{
    XpressoConfig config{};
    config.sourcePath = "/nonexistent/dir/nothing.xp";
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runXpresso(config, out, err), 1);
    EXPECT_NE(err.str().find("X0001"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST(XpCli, ReportCanGoToAFile)
{
    auto source = writeTemp("xpresso_cli_src.xp", "int a;\n");
    auto report = std::filesystem::temp_directory_path() / "xpresso_cli_report.txt";
    XpressoConfig config{};
    config.sourcePath = source.string();
    config.outputPath = report.string();

    std::ostringstream out;
    std::ostringstream err;
    ASSERT_EQ(runXpresso(config, out, err), 0);
    EXPECT_TRUE(out.str().empty());

    std::ifstream in(report);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("no errors found"), std::string::npos);
    std::filesystem::remove(source);
    std::filesystem::remove(report);
}

TEST(XpCli, UsageMentionsOptions)
{
    std::ostringstream os;
    printUsage(os);
    EXPECT_NE(os.str().find("--tree"), std::string::npos);
    EXPECT_NE(os.str().find("--output"), std::string::npos);

    std::ostringstream version;
    printVersion(version);
    EXPECT_NE(version.str().find("xpresso"), std::string::npos);
}
