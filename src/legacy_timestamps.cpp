//
//  legacy_timestamps.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "legacy_timestamps.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

#include "logging.hpp"

namespace looper {

namespace {

std::string_view trim(std::string_view s) {
    const char *ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<uint32_t> parse_number(std::string_view s) {
    s = trim(s);
    if (s.empty() || s.size() > 6) {
        return std::nullopt;
    }
    uint32_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    return v;
}

// `MM:SS` -> offset. Minutes are not bounded (no hour field in this format).
std::optional<TimeOffset> parse_min_sec(std::string_view s) {
    const auto colon = s.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto minutes = parse_number(s.substr(0, colon));
    const auto seconds = parse_number(s.substr(colon + 1));
    if (!minutes || !seconds) {
        return std::nullopt;
    }
    return TimeOffset(static_cast<uint64_t>(*minutes) * TimeOffset::kMsPerMinute +
                      static_cast<uint64_t>(*seconds) * TimeOffset::kMsPerSecond);
}

IntervalParseResult malformed(std::string_view line) {
    return IntervalParseResult{
        Status::failure(ErrorKind::FormatError, "Invalid timestamp line: " + std::string(line)),
        Interval{}};
}

bool read_lines(const std::string &path, std::vector<std::string> &lines, Status &status) {
    std::ifstream f(path);
    if (!f.is_open()) {
        const int err = errno;
        LP_LOG("error", "open failed for " << path << " errno=" << err << " ("
                                           << std::generic_category().message(err) << ")");
        status = Status::failure(ErrorKind::IOError, "Cannot access file: " + path);
        return false;
    }
    std::string line;
    while (std::getline(f, line)) {
        lines.push_back(line);
    }
    if (f.bad()) {
        status = Status::failure(ErrorKind::IOError, "Read failed: " + path);
        return false;
    }
    return true;
}

}  // namespace

IntervalParseResult parse_legacy_line(std::string_view line) {
    const auto d1 = line.find('-');
    if (d1 == std::string_view::npos) {
        return malformed(line);
    }
    const auto d2 = line.find('-', d1 + 1);
    if (d2 == std::string_view::npos) {
        return malformed(line);
    }
    const auto start = parse_min_sec(line.substr(0, d1));
    const auto end = parse_min_sec(line.substr(d1 + 1, d2 - d1 - 1));
    if (!start || !end) {
        return malformed(line);
    }
    Interval interval;
    interval.start = *start;
    interval.end = *end;
    interval.description = std::string(trim(line.substr(d2 + 1)));
    return IntervalParseResult{Status::success(), std::move(interval)};
}

IntervalParseResult load_legacy_file(const std::string &path, int number) {
    std::vector<std::string> lines;
    Status st;
    if (!read_lines(path, lines, st)) {
        return IntervalParseResult{std::move(st), Interval{}};
    }
    if (number < 1 || static_cast<size_t>(number) > lines.size()) {
        return IntervalParseResult{
            Status::failure(ErrorKind::IndexError, "Timestamp num is not valid"), Interval{}};
    }
    return parse_legacy_line(lines[static_cast<size_t>(number) - 1]);
}

LoadResult load_legacy_list(const std::string &path) {
    LoadResult result;
    std::vector<std::string> lines;
    if (!read_lines(path, lines, result.status)) {
        return result;
    }
    IntervalList list;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            continue;
        }
        auto parsed = parse_legacy_line(lines[i]);
        if (!parsed.status.ok) {
            LP_LOG("warn", path << ":" << (i + 1) << ": " << parsed.status.message);
            result.status = std::move(parsed.status);
            return result;
        }
        list.append(std::move(parsed.value));
    }
    LP_LOG("io", "loaded " << list.size() << " legacy intervals from " << path);
    result.intervals = std::move(list);
    return result;
}

}  // namespace looper
