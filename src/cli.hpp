#pragma once
#include "selector.hpp"

#include <string>
#include <vector>

enum class Mode { Latest, Reconcile, Pipeline };

struct Options {
    Mode mode = Mode::Pipeline;
    std::string scans;        // raw scan report (latest, pipeline)
    std::string reference;    // already deduplicated table (reconcile)
    std::string roster;       // names to look up (reconcile, pipeline)
    std::string outputDir = ".";
    std::string xlsx;         // optional workbook with every result sheet
    char delimiter = ',';
    inventory::KeyPolicy keyPolicy = inventory::KeyPolicy::Raw;
    bool help = false;
    bool version = false;
    std::string error;        // set when the command line is unusable
};

inline bool parse_mode(const std::string &s, Mode &out) {
    if (s == "latest") out = Mode::Latest;
    else if (s == "reconcile") out = Mode::Reconcile;
    else if (s == "pipeline") out = Mode::Pipeline;
    else return false;
    return true;
}

inline bool parse_delimiter(const std::string &s, char &out) {
    if (s == "comma" || s == ",") out = ',';
    else if (s == "tab" || s == "\\t" || s == "\t") out = '\t';
    else if (s == "semicolon" || s == ";") out = ';';
    else if (s.size() == 1 && s[0] != '"' && s[0] != '\n' && s[0] != '\r') out = s[0];
    else return false;
    return true;
}

// Output file names inside Options::outputDir.
inline std::string output_extension(const Options &opt) {
    return opt.delimiter == '\t' ? ".tsv" : ".csv";
}

inline Options parse_cli(int argc, char **argv) {
    Options opt;
    auto value = [&](int &i, const std::string &flag) -> std::string {
        if (i + 1 < argc) return argv[++i];
        if (opt.error.empty()) opt.error = "missing value for " + flag;
        return {};
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            opt.help = true;
        } else if (a == "--version") {
            opt.version = true;
        } else if (a == "--mode") {
            std::string v = value(i, a);
            if (!v.empty() && !parse_mode(v, opt.mode))
                opt.error = "invalid --mode '" + v + "' (latest, reconcile or pipeline)";
        } else if (a == "--scans") {
            opt.scans = value(i, a);
        } else if (a == "--reference") {
            opt.reference = value(i, a);
        } else if (a == "--roster") {
            opt.roster = value(i, a);
        } else if (a == "-o" || a == "--output-dir") {
            opt.outputDir = value(i, a);
        } else if (a == "--xlsx") {
            opt.xlsx = value(i, a);
        } else if (a == "--delimiter") {
            std::string v = value(i, a);
            if (!v.empty() && !parse_delimiter(v, opt.delimiter))
                opt.error = "invalid --delimiter '" + v + "'";
        } else if (a == "--fold-keys") {
            opt.keyPolicy = inventory::KeyPolicy::Normalized;
        } else if (opt.error.empty()) {
            opt.error = "unknown argument: " + a;
        }
    }
    if (!opt.error.empty() || opt.help || opt.version) return opt;

    switch (opt.mode) {
    case Mode::Latest:
        if (opt.scans.empty()) opt.error = "--mode latest needs --scans <path>";
        break;
    case Mode::Reconcile:
        if (opt.reference.empty() || opt.roster.empty())
            opt.error = "--mode reconcile needs --reference <path> and --roster <path>";
        break;
    case Mode::Pipeline:
        if (opt.scans.empty() || opt.roster.empty())
            opt.error = "--mode pipeline needs --scans <path> and --roster <path>";
        break;
    }
    if (opt.error.empty() && opt.outputDir.empty()) opt.error = "--output-dir must not be empty";
    return opt;
}
