// Unit coverage for small helpers: log verbosity gating, error names, companion media lookup
// and the version string.
#include <iostream>
#include <sstream>
#include <string>

#include "logging.hpp"
#include "looper.hpp"
#include "test_utils.hpp"

using namespace looper;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Helper to capture stderr while a function runs.
template <typename Fn>
std::string capture_stderr(Fn &&fn) {
    std::ostringstream oss;
    auto *old_buf = std::cerr.rdbuf(oss.rdbuf());
    fn();
    std::cerr.rdbuf(old_buf);
    return oss.str();
}

bool test_log_gating() {
    set_log_verbosity(LogVerbosity::Warn);
    auto text = capture_stderr([]() {
        LP_LOG("warn", "tempo drift " << 3);
        LP_LOG("info", "hidden info");
        LP_LOG("loop", "hidden debug");
    });
    bool ok = check(text.find("[Looper][warn] tempo drift 3") != std::string::npos,
                    "warn passes at Warn verbosity");
    ok &= check(text.find("hidden") == std::string::npos, "info/debug suppressed at Warn");

    set_log_verbosity(LogVerbosity::Debug);
    text = capture_stderr([]() { LP_LOG("loop", "restart at 1000ms"); });
    ok &= check(text.find("[Looper][loop] restart at 1000ms") != std::string::npos,
                "topic tags log at Debug");

    text = capture_stderr([]() { LP_LOG("error", "boom"); });
    ok &= check(text.find("helper_unit.cpp:") != std::string::npos,
                "error lines carry the source location");

    ok &= check(parse_log_verbosity("debug") == LogVerbosity::Debug &&
                    parse_log_verbosity("warning") == LogVerbosity::Warn &&
                    parse_log_verbosity("bogus") == LogVerbosity::Error,
                "level names");
    set_log_verbosity(LogVerbosity::Error);
    return ok;
}

bool test_error_names() {
    bool ok = check(std::string(error_kind_name(ErrorKind::FormatError)) == "FormatError",
                    "FormatError name");
    ok &= check(std::string(error_kind_name(ErrorKind::NotReadyError)) == "NotReadyError",
                "NotReadyError name");
    ok &= check(std::string(loop_state_name(LoopState::RestartPending)) == "RestartPending",
                "loop state name");
    return ok;
}

bool test_companion_media() {
    test_utils::ScratchDir dir("companion");
    const std::string stamps = dir.file("talk.tmsp");
    bool ok = check(test_utils::write_text(stamps, "[]"), "write timestamps");
    ok &= check(!find_companion_media(stamps), "no companion yet");

    test_utils::write_text(dir.file("other.mp4"), "x");
    test_utils::write_text(dir.file("talk.mkv"), "x");
    test_utils::write_text(dir.file("talk.avi"), "x");
    auto found = find_companion_media(stamps);
    ok &= check(found && std::filesystem::path(*found).filename() == "talk.avi",
                "first same-stem file in name order");
    return ok;
}

bool test_version() {
    const std::string v = version_string();
    return check(!v.empty() && v[0] == 'v', "version string starts with v");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_log_gating();
    ok &= test_error_names();
    ok &= test_companion_media();
    ok &= test_version();
    if (ok) {
        std::cout << "helper_unit OK\n";
    }
    return ok ? 0 : 1;
}
