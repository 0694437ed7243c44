#include "cli.hpp"
#include "excel_writer.hpp"
#include "models.hpp"
#include "reconciler.hpp"
#include "record_io.hpp"
#include "selector.hpp"

#include <fmt/format.h>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static const char *kVersion = "1.2.0";

static void print_usage(std::FILE *out) {
    fmt::print(out,
        "Usage:\n"
        "  pcinventory --mode latest    --scans <scans.csv> [-o <dir>]\n"
        "  pcinventory --mode reconcile --reference <latest.csv> --roster <roster.csv> [-o <dir>]\n"
        "  pcinventory [--mode pipeline] --scans <scans.csv> --roster <roster.csv> [-o <dir>]\n"
        "\n"
        "Options:\n"
        "  --delimiter comma|tab|<c>  Field separator for every input and output (default comma).\n"
        "  --fold-keys                Treat names differing only in case/whitespace as one workstation\n"
        "                             when picking the latest record.\n"
        "  --xlsx <path>              Also write every result sheet into one workbook.\n"
        "  -o, --output-dir <dir>     Where Latest_Records/Matched/Not_Found are written (default .).\n"
        "  -h, --help                 Print this help.\n"
        "  --version                  Print version.\n");
}

static std::string out_path(const Options &opt, const std::string &stem) {
    return (fs::path(opt.outputDir) / (stem + output_extension(opt))).string();
}

static int run(const Options &opt) {
    // 1) Selection: raw scan rows -> one record per workstation
    std::optional<Selection> sel;
    if (opt.mode != Mode::Reconcile) {
        const auto scans = table::read_scans(opt.scans, opt.delimiter);
        sel = inventory::select_latest(scans, opt.keyPolicy);
        fmt::print("Read {} scan row(s) from {} -> {} workstation(s)\n",
                   scans.size(), opt.scans, sel->records.size());
        if (sel->skippedBlankNames)
            fmt::print(stderr, "warning: skipped {} row(s) with a blank workstation name\n",
                       sel->skippedBlankNames);
    }

    // 2) Reconciliation against the roster
    std::optional<Reconciliation> rec;
    if (opt.mode != Mode::Latest) {
        std::vector<CanonicalRecord> loaded;
        if (opt.mode == Mode::Reconcile) loaded = table::read_reference(opt.reference, opt.delimiter);
        const std::vector<CanonicalRecord> &reference = sel ? sel->records : loaded;

        const auto roster = table::read_roster(opt.roster, opt.delimiter);
        rec = inventory::reconcile(reference, roster);
        fmt::print("Reconciled {} roster name(s) from {}: {} matched, {} not found\n",
                   roster.size(), opt.roster, rec->matched.size(), rec->unmatched.size());
        if (rec->ambiguousKeys)
            fmt::print(stderr,
                       "warning: {} reference row(s) share a normalized name with an earlier row; "
                       "the first one is used\n", rec->ambiguousKeys);
    }

    // 3) Outputs, only once everything above succeeded
    if (sel) {
        const std::string p = out_path(opt, "Latest_Records");
        table::write_canonical(p, sel->records, opt.delimiter);
        fmt::print("Wrote {}\n", p);
    }
    if (rec) {
        const std::string matched = out_path(opt, "Matched");
        const std::string missing = out_path(opt, "Not_Found");
        table::write_canonical(matched, rec->matched, opt.delimiter);
        table::write_roster(missing, rec->unmatched, opt.delimiter);
        fmt::print("Wrote {}\nWrote {}\n", matched, missing);
    }
    if (!opt.xlsx.empty()) {
        excel::write_workbook(opt.xlsx, {sel, rec});
        fmt::print("Wrote {}\n", opt.xlsx);
    }
    return 0;
}

int main(int argc, char** argv) {
    Options opt = parse_cli(argc, argv);

    if (!opt.error.empty()) {
        fmt::print(stderr, "error: {}\n\n", opt.error);
        print_usage(stderr);
        return 2;
    }
    if (opt.help) {
        print_usage(stdout);
        return 0;
    }
    if (opt.version) {
        fmt::print("pcinventory v{}\n", kVersion);
        return 0;
    }

    try {
        return run(opt);
    } catch (const inventory::MalformedTimestampError &e) {
        fmt::print(stderr, "error: {}\nNo output was written; fix the scan report and run again.\n", e.what());
        return 1;
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
