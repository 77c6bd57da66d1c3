// Unit coverage for the legacy `MM:SS-MM:SS-description` line format and its conversion.
#include <filesystem>
#include <iostream>
#include <string>

#include "logging.hpp"
#include "looper.hpp"
#include "test_utils.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using namespace looper;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[legacy_timestamps_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string data_file(const std::string &name) {
    return (std::filesystem::path(TESTDATA_DIR) / name).string();
}

bool test_parse_line() {
    auto r = parse_legacy_line("01:05-02:10-Intro scene");
    bool ok = check(r.status.ok, "intro line parses");
    ok &= check(r.value.start.ms() == 65000 && r.value.end.ms() == 130000, "intro bounds");
    ok &= check(r.value.description == "Intro scene", "intro description");

    r = parse_legacy_line("00:00-00:30-Verse - take 2 - slow\n");
    ok &= check(r.status.ok && r.value.description == "Verse - take 2 - slow",
                "only the first two dashes delimit");
    ok &= check(r.value.start.is_zero() && r.value.end.ms() == 30000, "zero start allowed");

    r = parse_legacy_line("90:00-95:30-");
    ok &= check(r.status.ok && r.value.start.ms() == 5400000 && r.value.description.empty(),
                "minutes beyond an hour and empty description");

    ok &= check(parse_legacy_line("01:05-Intro").status.kind == ErrorKind::FormatError,
                "single dash rejected");
    ok &= check(parse_legacy_line("1m05-02:10-Intro").status.kind == ErrorKind::FormatError,
                "non-numeric minutes rejected");
    ok &= check(parse_legacy_line("01:05-0210-Intro").status.kind == ErrorKind::FormatError,
                "missing colon rejected");
    return ok;
}

bool test_select_from_file() {
    auto r = load_legacy_file(data_file("legacy.txt"), 1);
    bool ok = check(r.status.ok && r.value.start.ms() == 65000, "first line selected");
    r = load_legacy_file(data_file("legacy.txt"), 4);
    ok &= check(r.status.ok && r.value.description == "Padded description",
                "fourth line selected, description trimmed");
    ok &= check(load_legacy_file(data_file("legacy.txt"), 0).status.kind == ErrorKind::IndexError,
                "number below 1 rejected");
    ok &= check(load_legacy_file(data_file("legacy.txt"), 5).status.kind == ErrorKind::IndexError,
                "number past the end rejected");
    ok &= check(load_legacy_file(data_file("nope.txt"), 1).status.kind == ErrorKind::IOError,
                "missing file is an IOError");
    return ok;
}

bool test_list_and_convert() {
    auto list = load_legacy_list(data_file("legacy.txt"));
    bool ok = check(list.status.ok && list.intervals.size() == 3, "blank lines skipped");

    auto bad = load_legacy_list(data_file("legacy_bad.txt"));
    ok &= check(!bad.status.ok && bad.intervals.empty(), "one bad line fails the whole list");

    test_utils::ScratchDir dir("convert");
    const std::string out = dir.file("legacy.tmsp");
    ok &= check(convert_legacy_file(data_file("legacy.txt"), out).ok, "convert succeeds");
    auto converted = load_interval_source(out);
    ok &= check(converted.status.ok && converted.intervals.size() == 3, "converted file loads");
    if (converted.intervals.size() == 3) {
        ok &= check(converted.intervals.at(0).display_at(Column::End) == "0:02:10.000",
                    "converted end uses canonical text");
    }

    const std::string untouched = dir.file("untouched.tmsp");
    ok &= check(!convert_legacy_file(data_file("legacy_bad.txt"), untouched).ok &&
                    !std::filesystem::exists(untouched),
                "invalid source writes nothing");

    ok &= check(is_legacy_timestamp_path("a/b/LOOPS.TXT") && !is_legacy_timestamp_path("x.tmsp"),
                "legacy detection by extension");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_parse_line();
    ok &= test_select_from_file();
    ok &= test_list_and_convert();
    if (ok) {
        std::cout << "legacy_timestamps_unit OK\n";
    }
    return ok ? 0 : 1;
}
