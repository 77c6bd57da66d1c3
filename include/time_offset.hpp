//
//  time_offset.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "status.hpp"

namespace looper {

/**
 * @brief Non-negative offset from the start of the media, millisecond resolution.
 *
 * Canonical text form is `H:MM:SS.mmm` (hours unbounded). A zero offset renders as an empty
 * string; the stored value is still zero, not "unset".
 */
class TimeOffset {
   public:
    static constexpr uint64_t kMsPerSecond = 1000;
    static constexpr uint64_t kMsPerMinute = 60 * kMsPerSecond;
    static constexpr uint64_t kMsPerHour = 60 * kMsPerMinute;

    TimeOffset() = default;
    explicit constexpr TimeOffset(uint64_t ms) : ms_(ms) {}

    static constexpr TimeOffset from_components(uint64_t hours, uint32_t minutes,
                                                uint32_t seconds, uint32_t millis) {
        return TimeOffset(hours * kMsPerHour + minutes * kMsPerMinute + seconds * kMsPerSecond +
                          millis);
    }

    constexpr uint64_t ms() const { return ms_; }
    constexpr bool is_zero() const { return ms_ == 0; }

    constexpr uint64_t hours() const { return ms_ / kMsPerHour; }
    constexpr uint32_t minutes() const {
        return static_cast<uint32_t>((ms_ % kMsPerHour) / kMsPerMinute);
    }
    constexpr uint32_t seconds() const {
        return static_cast<uint32_t>((ms_ % kMsPerMinute) / kMsPerSecond);
    }
    constexpr uint32_t millis() const { return static_cast<uint32_t>(ms_ % kMsPerSecond); }

    // Canonical `H:MM:SS.mmm`, or "" for zero.
    std::string to_string() const;

    friend constexpr bool operator==(TimeOffset a, TimeOffset b) { return a.ms_ == b.ms_; }
    friend constexpr bool operator!=(TimeOffset a, TimeOffset b) { return a.ms_ != b.ms_; }
    friend constexpr bool operator<(TimeOffset a, TimeOffset b) { return a.ms_ < b.ms_; }
    friend constexpr bool operator>(TimeOffset a, TimeOffset b) { return a.ms_ > b.ms_; }
    friend constexpr bool operator<=(TimeOffset a, TimeOffset b) { return a.ms_ <= b.ms_; }
    friend constexpr bool operator>=(TimeOffset a, TimeOffset b) { return a.ms_ >= b.ms_; }

   private:
    uint64_t ms_ = 0;
};

/// Parse outcome; `value` is meaningful only when `status.ok`.
struct TimeParseResult {
    Status status;
    TimeOffset value;
};

/**
 * @brief Parse `H:MM:SS.mmm` text into a TimeOffset.
 *
 * Empty (or all-whitespace) text yields zero. Each component must be unsigned decimal digits;
 * minutes and seconds must lie in [0,60), milliseconds in [0,1000). Any violation produces a
 * FormatError whose message carries the offending text.
 */
TimeParseResult parse_time_offset(std::string_view text);

/// Canonical text form; identical to TimeOffset::to_string().
std::string format_time_offset(TimeOffset offset);

}  // namespace looper
