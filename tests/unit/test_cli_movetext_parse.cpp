// File: tests/unit/test_cli_movetext_parse.cpp
// Purpose: Run the movetext-parse CLI in-process and check output, diagnostics and exit codes.
// Key invariants: 0 = all parsed, 1 = usage or I/O error, 2 = some input rejected.
// Ownership/Lifetime: Tests own their temporary files and stream capture buffers.
// Links: src/tools/movetext-parse/driver.cpp

#include <gtest/gtest.h>

#include "support/source_manager.hpp"
#include "tools/movetext-parse/driver.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace movetext;
using namespace movetext::tools::textparse;

namespace
{
struct CliResult
{
    int rc;
    std::string out;
    std::string err;
};

CliResult run(std::initializer_list<std::string> args)
{
    std::vector<std::string> storage{"movetext-parse"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &s : storage)
        argv.push_back(s.data());

    support::SourceManager sm;
    std::ostringstream out;
    std::ostringstream err;
    const int rc = runCLI(static_cast<int>(argv.size()), argv.data(), out, err, sm);
    return {rc, out.str(), err.str()};
}

std::filesystem::path writeTemp(const std::string &name, const std::string &contents)
{
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << contents;
    return path;
}
} // namespace

TEST(CliMovetextParse, VersionBanner)
{
    auto r = run({"--version"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "movetext-parse v0.1.0\n");
}

TEST(CliMovetextParse, InlineTypeTag)
{
    auto r = run({"--type-tag", "vector< 0x0001::M::S <u8 ,bool> >"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "vector<0x1::M::S<u8, bool>>\n");
    EXPECT_TRUE(r.err.empty());
}

TEST(CliMovetextParse, ListModesPrintOneItemPerLine)
{
    auto args = run({"--args", "1u8, true, x\"AB\""});
    EXPECT_EQ(args.rc, kExitOk);
    EXPECT_EQ(args.out, "1u8\ntrue\nx\"ab\"\n");

    auto names = run({"--names", "a, b,"});
    EXPECT_EQ(names.out, "a\nb\n");

    auto tags = run({"--type-tags", "u8, signer"});
    EXPECT_EQ(tags.out, "u8\nsigner\n");
}

TEST(CliMovetextParse, TokenDump)
{
    auto r = run({"--tokens", "vector<0x1>"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "1:1 'vector'\n1:7 '<'\n1:8 address 0x1\n1:11 '>'\n");
}

TEST(CliMovetextParse, InlineFailurePrintsBareDiagnostic)
{
    auto r = run({"--struct-tag", "u8"});
    EXPECT_EQ(r.rc, kExitParseFailure);
    EXPECT_TRUE(r.out.empty());
    EXPECT_EQ(r.err, "error: invalid struct tag: u8\n");
}

TEST(CliMovetextParse, TraceEchoesInput)
{
    auto r = run({"--trace", "--arg", "255u8"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "> 255u8\n255u8\n");
}

TEST(CliMovetextParse, FileModeParsesEachLine)
{
    const auto path = writeTemp("movetext_cli_lines.txt", "u8\n\n  \nvector<u8\r\n0x1::M::S\n");
    auto r = run({"--type-tag", "--file", path.string()});
    EXPECT_EQ(r.rc, kExitParseFailure);
    EXPECT_EQ(r.out, "u8\n0x1::M::S\n");
    const std::string expectedErr = path.lexically_normal().generic_string() +
                                    ":4:10: error: expected token '>', got end of input\n";
    EXPECT_EQ(r.err, expectedErr);
    std::filesystem::remove(path);
}

TEST(CliMovetextParse, FileModeAllValid)
{
    const auto path = writeTemp("movetext_cli_ok.txt", "1u8\n2u64\n");
    auto r = run({"--arg", "--file", path.string()});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "1u8\n2u64\n");
    std::filesystem::remove(path);
}

TEST(CliMovetextParse, MissingFileIsUsageError)
{
    auto r = run({"--arg", "--file", "/definitely/not/present.txt"});
    EXPECT_EQ(r.rc, kExitUsage);
    EXPECT_NE(r.err.find("/definitely/not/present.txt"), std::string::npos);
}

TEST(CliMovetextParse, UsageErrors)
{
    EXPECT_EQ(run({}).rc, kExitUsage);
    EXPECT_EQ(run({"u8"}).rc, kExitUsage);
    EXPECT_EQ(run({"--type-tag"}).rc, kExitUsage);
    EXPECT_EQ(run({"--type-tag", "--arg", "u8"}).rc, kExitUsage);
    EXPECT_EQ(run({"--type-tag", "u8", "u64"}).rc, kExitUsage);
    EXPECT_EQ(run({"--type-tag", "--file"}).rc, kExitUsage);
    EXPECT_EQ(run({"--bogus", "u8"}).rc, kExitUsage);

    auto r = run({"--type-tag", "u8", "--file", "x.txt"});
    EXPECT_EQ(r.rc, kExitUsage);
    EXPECT_NE(r.err.find("Usage: movetext-parse"), std::string::npos);
}

TEST(CliMovetextParse, ParseCommandLineFillsOptions)
{
    char a0[] = "--trace";
    char a1[] = "--names";
    char a2[] = "x, y";
    char *argv[] = {a0, a1, a2};
    auto opts = parseCommandLine(tools::ArgvView{3, argv});
    ASSERT_TRUE(opts);
    EXPECT_TRUE(opts.value().trace);
    EXPECT_EQ(opts.value().mode, support::ParseMode::Names);
    EXPECT_EQ(opts.value().text, "x, y");
    EXPECT_TRUE(opts.value().file.empty());
}

TEST(CliMovetextParse, NegativeLiteralIsTextNotOption)
{
    auto r = run({"--arg", "-3"});
    EXPECT_EQ(r.rc, kExitParseFailure);
    EXPECT_EQ(r.err, "error: unrecognized token\n");
}

TEST(CliMovetextParse, EveryRejectedLineIsReportedInOrder)
{
    const auto path = writeTemp("movetext_cli_multi.txt", "256u8\ntrue\n0x\n");
    auto r = run({"--arg", "--file", path.string()});
    EXPECT_EQ(r.rc, kExitParseFailure);
    EXPECT_EQ(r.out, "true\n");
    const std::string file = path.lexically_normal().generic_string();
    EXPECT_EQ(r.err,
              file + ":1:1: error: number too large to fit in target type\n" + file +
                  ":3:1: error: unrecognized token\n");
    std::filesystem::remove(path);
}
