//
//  interval.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "status.hpp"
#include "time_offset.hpp"

namespace looper {

/// Column addressing used by the store and its presentation collaborators.
enum class Column : int { Start = 0, End = 1, Description = 2 };

inline constexpr int kColumnCount = 3;

/// Typed cell content: a TimeOffset for Start/End, text for Description.
using CellValue = std::variant<TimeOffset, std::string>;

/// @ingroup api
/// One named time interval. No ordering is enforced between start and end.
struct Interval {
    TimeOffset start;         ///< Loop start
    TimeOffset end;           ///< Loop end (may be <= start)
    std::string description;  ///< Free text

    CellValue value_at(Column column) const;
    std::string display_at(Column column) const;

    friend bool operator==(const Interval &a, const Interval &b) {
        return a.start == b.start && a.end == b.end && a.description == b.description;
    }
    friend bool operator!=(const Interval &a, const Interval &b) { return !(a == b); }
};

/// Ordered, exclusively owned sequence of intervals. Insertion order is significant.
class IntervalList {
   public:
    IntervalList() = default;
    explicit IntervalList(std::vector<Interval> intervals) : intervals_(std::move(intervals)) {}

    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }

    const Interval &at(size_t row) const { return intervals_.at(row); }
    Interval &at(size_t row) { return intervals_.at(row); }

    void append(Interval interval) { intervals_.push_back(std::move(interval)); }

    // Stable sort by start milliseconds; equal starts keep their relative order.
    void sort_by_start(bool descending);

    std::vector<Interval>::const_iterator begin() const { return intervals_.begin(); }
    std::vector<Interval>::const_iterator end() const { return intervals_.end(); }

   private:
    std::vector<Interval> intervals_;
};

/// Column header text ("Start Time", "End Time", "Description"); empty when out of range.
std::string column_header(int column);

/// Maps an integer column to Column; false when outside [0, kColumnCount).
bool column_from_index(int index, Column &out);

/// Parse outcome for a whole list; `intervals` is empty on failure.
struct LoadResult {
    Status status;
    IntervalList intervals;
};

/**
 * @brief Build an interval from persisted field text.
 *
 * Start/end go through parse_time_offset(), the same parser used by direct edits.
 */
Status make_interval(std::string_view start_text, std::string_view end_text,
                     std::string description, Interval &out);

/**
 * @brief Parse a persisted JSON document (array of `{start_time, end_time, description}`).
 *
 * Atomic: any malformed record fails the whole document and no partial list is returned.
 */
LoadResult parse_interval_list(std::string_view document);

/// Serialize to the persisted JSON array form using canonical time text.
std::string serialize_interval_list(const IntervalList &list, int indent = 2);

}  // namespace looper
