#include "cli.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "pcinventory");
    std::vector<char *> argv;
    for (auto &a : args) argv.push_back(&a[0]);
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ParseCli, PipelineIsTheDefaultMode) {
    Options opt = parse({"--scans", "s.csv", "--roster", "r.csv"});
    EXPECT_TRUE(opt.error.empty()) << opt.error;
    EXPECT_EQ(opt.mode, Mode::Pipeline);
    EXPECT_EQ(opt.scans, "s.csv");
    EXPECT_EQ(opt.roster, "r.csv");
    EXPECT_EQ(opt.outputDir, ".");
    EXPECT_EQ(opt.delimiter, ',');
    EXPECT_EQ(opt.keyPolicy, inventory::KeyPolicy::Raw);
    EXPECT_EQ(output_extension(opt), ".csv");
}

TEST(ParseCli, LatestMode) {
    Options opt = parse({"--mode", "latest", "--scans", "s.tsv", "--delimiter", "tab",
                         "-o", "out", "--fold-keys", "--xlsx", "report.xlsx"});
    EXPECT_TRUE(opt.error.empty()) << opt.error;
    EXPECT_EQ(opt.mode, Mode::Latest);
    EXPECT_EQ(opt.delimiter, '\t');
    EXPECT_EQ(opt.outputDir, "out");
    EXPECT_EQ(opt.xlsx, "report.xlsx");
    EXPECT_EQ(opt.keyPolicy, inventory::KeyPolicy::Normalized);
    EXPECT_EQ(output_extension(opt), ".tsv");
}

TEST(ParseCli, ReconcileModeNeedsReferenceAndRoster) {
    EXPECT_FALSE(parse({"--mode", "reconcile", "--roster", "r.csv"}).error.empty());
    Options opt = parse({"--mode", "reconcile", "--reference", "l.csv", "--roster", "r.csv"});
    EXPECT_TRUE(opt.error.empty()) << opt.error;
    EXPECT_EQ(opt.mode, Mode::Reconcile);
}

TEST(ParseCli, MissingInputsAreErrors) {
    EXPECT_FALSE(parse({}).error.empty());
    EXPECT_FALSE(parse({"--mode", "latest"}).error.empty());
    EXPECT_FALSE(parse({"--scans", "s.csv"}).error.empty());
}

TEST(ParseCli, BadValuesAreErrors) {
    EXPECT_FALSE(parse({"--mode", "merge", "--scans", "s.csv"}).error.empty());
    EXPECT_FALSE(parse({"--delimiter", "ab", "--scans", "s.csv", "--roster", "r.csv"}).error.empty());
    EXPECT_FALSE(parse({"--scans", "s.csv", "--roster", "r.csv", "--bogus"}).error.empty());
    EXPECT_FALSE(parse({"--scans", "s.csv", "--roster"}).error.empty());
}

TEST(ParseCli, HelpAndVersionSkipValidation) {
    Options help = parse({"--help"});
    EXPECT_TRUE(help.help);
    EXPECT_TRUE(help.error.empty());
    Options ver = parse({"--version"});
    EXPECT_TRUE(ver.version);
    EXPECT_TRUE(ver.error.empty());
}

TEST(ParseDelimiter, NamedAndSingleCharacter) {
    char d = 0;
    EXPECT_TRUE(parse_delimiter("semicolon", d));
    EXPECT_EQ(d, ';');
    EXPECT_TRUE(parse_delimiter("|", d));
    EXPECT_EQ(d, '|');
    EXPECT_FALSE(parse_delimiter("\"", d));
    EXPECT_FALSE(parse_delimiter("", d));
}
