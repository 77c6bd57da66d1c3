// Unit coverage for LooperConfig: defaults, partial documents, validation and round trip.
#include <filesystem>
#include <iostream>
#include <string>

#include "config.hpp"
#include "logging.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using namespace looper;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[config_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_defaults() {
    const LooperConfig c;
    bool ok = check(c.tick_period_ms == 100, "tick period default");
    ok &= check(c.volume_max == 40, "volume ceiling default");
    ok &= check(c.rate_min == 0.2 && c.rate_max == 2.0, "rate bounds default");
    ok &= check(!c.save_on_sort, "sort does not save by default");
    auto empty = parse_config("{}");
    ok &= check(empty.status.ok && empty.config.progress_resolution == 10000,
                "empty document keeps defaults");
    return ok;
}

bool test_file() {
    auto res = load_config((std::filesystem::path(TESTDATA_DIR) / "config.json").string());
    bool ok = check(res.status.ok, "fixture loads");
    ok &= check(res.config.tick_period_ms == 50 && res.config.volume_max == 80 &&
                    res.config.default_volume == 30 && res.config.save_on_sort,
                "fixture values applied");
    ok &= check(res.config.rate_step == 0.1, "missing keys keep defaults");

    auto missing = load_config("/nonexistent/looper.json");
    ok &= check(!missing.status.ok && missing.status.kind == ErrorKind::IOError,
                "missing file is an IOError");
    return ok;
}

bool test_validation() {
    bool ok = check(parse_config(R"({"tick_period_ms": 0})").status.kind == ErrorKind::FormatError,
                    "zero tick period rejected");
    ok &= check(parse_config(R"({"rate_min": 3.0})").status.kind == ErrorKind::FormatError,
                "rate_min above rate_max rejected");
    ok &= check(parse_config(R"({"volume_max": 0})").status.kind == ErrorKind::FormatError,
                "zero volume ceiling rejected");
    ok &= check(parse_config(R"({"default_volume": 50})").status.kind == ErrorKind::FormatError,
                "default volume above ceiling rejected");
    ok &= check(parse_config(R"({"volume_max": "loud"})").status.kind == ErrorKind::FormatError,
                "mistyped value rejected");
    ok &= check(parse_config("[1, 2]").status.kind == ErrorKind::FormatError,
                "non-object rejected");
    auto bad = parse_config(R"({"tick_period_ms": 0, "volume_max": 90})");
    ok &= check(bad.config.volume_max == 40, "rejected document yields defaults");
    return ok;
}

bool test_round_trip() {
    LooperConfig c;
    c.tick_period_ms = 250;
    c.save_on_sort = true;
    c.rate_max = 1.5;
    auto back = parse_config(config_to_json(c));
    return check(back.status.ok && back.config.tick_period_ms == 250 && back.config.save_on_sort &&
                     back.config.rate_max == 1.5,
                 "config survives JSON round trip");
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_defaults();
    ok &= test_file();
    ok &= test_validation();
    ok &= test_round_trip();
    if (ok) {
        std::cout << "config_unit OK\n";
    }
    return ok ? 0 : 1;
}
