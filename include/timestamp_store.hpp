//
//  timestamp_store.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "interval.hpp"
#include "status.hpp"

namespace looper {

/// Read and parse a persisted interval file without touching any store.
LoadResult read_interval_file(const std::string &path);

/// Serialize and write a list; the file is replaced only once the write completed.
Status write_interval_file(const std::string &path, const IntervalList &list);

/**
 * @brief Authoritative in-memory interval list bound to one persisted file.
 *
 * Rows/columns follow the table addressing used by presentation collaborators
 * (0 = start, 1 = end, 2 = description). Every successful edit is written through to the
 * bound file immediately; failed operations leave the previous state untouched.
 *
 * A store without a bound file keeps edits in memory only.
 */
class TimestampStore {
   public:
    /// Rows [first_row, last_row] changed.
    using DataChangedListener = std::function<void(size_t first_row, size_t last_row)>;
    /// The whole list was replaced or reordered (load, create, adopt, sort); may be empty.
    using ResetListener = std::function<void(size_t row_count)>;
    /// A rejected edit or failed load/save; payload carries the message text.
    using ErrorListener = std::function<void(const Status &status)>;
    using ListenerToken = size_t;

    explicit TimestampStore(LooperConfig config = LooperConfig{});

    /// Replace the whole list with the contents of `path` and bind to it.
    Status load(const std::string &path);

    /// Bind to a new file holding an empty list.
    Status create(const std::string &path);

    /// Replace the whole list with `list`, bind to `path` and write it.
    Status adopt(IntervalList list, const std::string &path);

    size_t row_count() const { return list_.size(); }
    int column_count() const { return kColumnCount; }
    std::string header_at(int column) const { return column_header(column); }

    Status value_at(size_t row, int column, CellValue &out) const;
    Status display_at(size_t row, int column, std::string &out) const;

    /// Validated edit; column 0/1 parse time text, column 2 stores the text verbatim.
    Status set_value(size_t row, int column, std::string_view text);

    /// Append a row (write-through).
    Status append(Interval interval);

    /// Reorder by start time. Persists only when LooperConfig::save_on_sort is set.
    Status sort(bool descending);

    /// Full re-serialization to the bound file.
    Status save() const;

    const IntervalList &intervals() const { return list_; }
    const std::string &source_path() const { return path_; }
    const LooperConfig &config() const { return config_; }

    ListenerToken add_data_changed_listener(DataChangedListener listener);
    ListenerToken add_reset_listener(ResetListener listener);
    ListenerToken add_error_listener(ErrorListener listener);
    void remove_listener(ListenerToken token);

   private:
    Status check_cell(size_t row, int column, Column &column_out) const;
    Status report(Status status) const;
    void notify_changed(size_t first_row, size_t last_row) const;
    void notify_reset() const;

    struct Listener {
        ListenerToken token = 0;
        DataChangedListener on_changed;
        ResetListener on_reset;
        ErrorListener on_error;
    };

    LooperConfig config_;
    IntervalList list_;
    std::string path_;
    std::vector<Listener> listeners_;
    ListenerToken next_token_ = 1;
};

}  // namespace looper
