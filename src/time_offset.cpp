//
//  time_offset.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "time_offset.hpp"

#include <cstdio>
#include <optional>

#include "logging.hpp"

namespace looper {

namespace {

// Hours beyond this many digits would overflow the millisecond count.
constexpr size_t kMaxHourDigits = 9;
constexpr size_t kMaxFieldDigits = 6;

std::string_view trim(std::string_view s) {
    const char *ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<uint64_t> parse_digits(std::string_view s, size_t max_digits) {
    if (s.empty() || s.size() > max_digits) {
        return std::nullopt;
    }
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    return v;
}

TimeParseResult invalid(std::string_view text, const char *reason) {
    LP_LOG("time", "rejecting '" << text << "': " << reason);
    return TimeParseResult{Status::failure(ErrorKind::FormatError,
                                           "Time invalid: " + std::string(text)),
                           TimeOffset{}};
}

}  // namespace

std::string TimeOffset::to_string() const {
    if (is_zero()) {
        return "";
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%llu:%02u:%02u.%03u",
                  static_cast<unsigned long long>(hours()), minutes(), seconds(), millis());
    return buf;
}

std::string format_time_offset(TimeOffset offset) { return offset.to_string(); }

TimeParseResult parse_time_offset(std::string_view text) {
    const std::string_view s = trim(text);
    if (s.empty()) {
        return TimeParseResult{Status::success(), TimeOffset{}};
    }

    // H:MM:SS.mmm -> split on the first two colons, then on the first dot.
    const auto c1 = s.find(':');
    if (c1 == std::string_view::npos) {
        return invalid(text, "missing hour separator");
    }
    const auto c2 = s.find(':', c1 + 1);
    if (c2 == std::string_view::npos) {
        return invalid(text, "missing minute separator");
    }
    const auto dot = s.find('.', c2 + 1);
    if (dot == std::string_view::npos) {
        return invalid(text, "missing millisecond separator");
    }

    const auto hours = parse_digits(s.substr(0, c1), kMaxHourDigits);
    const auto minutes = parse_digits(s.substr(c1 + 1, c2 - c1 - 1), kMaxFieldDigits);
    const auto seconds = parse_digits(s.substr(c2 + 1, dot - c2 - 1), kMaxFieldDigits);
    const auto millis = parse_digits(s.substr(dot + 1), kMaxFieldDigits);
    if (!hours || !minutes || !seconds || !millis) {
        return invalid(text, "non-numeric component");
    }
    if (*minutes >= 60) {
        return invalid(text, "minutes out of range");
    }
    if (*seconds >= 60) {
        return invalid(text, "seconds out of range");
    }
    if (*millis >= 1000) {
        return invalid(text, "milliseconds out of range");
    }
    return TimeParseResult{Status::success(),
                           TimeOffset::from_components(*hours, static_cast<uint32_t>(*minutes),
                                                       static_cast<uint32_t>(*seconds),
                                                       static_cast<uint32_t>(*millis))};
}

}  // namespace looper
