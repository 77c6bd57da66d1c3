//
//  logging.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace looper {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI level name to a verbosity. Unknown names fall back to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

}  // namespace looper

inline constexpr looper::LogVerbosity lp_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return looper::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return looper::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return looper::LogVerbosity::Info;
    }
    // Everything else (store/loop/io/config/etc.) treated as debug-level.
    return looper::LogVerbosity::Debug;
}

inline bool lp_should_log(const char* level) {
    const auto current = looper::get_log_verbosity();
    const auto sev = lp_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void lp_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    if (std::string_view(level ? level : "") == "error") {
        std::cerr << "[Looper][" << level << "][" << file << ":" << line << " " << func << "] "
                  << msg << std::endl;
    } else {
        std::cerr << "[Looper][" << level << "] " << msg << std::endl;
    }
}

#define LP_LOG(level, message)                                              \
    do {                                                                    \
        if (lp_should_log(level)) {                                         \
            std::ostringstream _lp_log_ss;                                  \
            _lp_log_ss << message;                                          \
            lp_log_impl(level, _lp_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
