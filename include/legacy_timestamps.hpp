//
//  legacy_timestamps.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

#include "interval.hpp"
#include "status.hpp"

// Read-only ingestion of the line-oriented format `MM:SS-MM:SS-description`
// (minutes/seconds only). Only the first two dashes delimit; the description may
// contain further dashes.

namespace looper {

struct IntervalParseResult {
    Status status;
    Interval value;
};

/// Parse one legacy line. Description whitespace is trimmed.
IntervalParseResult parse_legacy_line(std::string_view line);

/// Select the 1-based line `number` of a legacy file (IndexError when out of range).
IntervalParseResult load_legacy_file(const std::string &path, int number);

/// Read every non-blank line. Atomic: one bad line fails the whole load.
LoadResult load_legacy_list(const std::string &path);

}  // namespace looper
