//
//  timestamp_store.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timestamp_store.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace looper {

LoadResult read_interval_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        const int err = errno;
        LP_LOG("error", "open failed for " << path << " errno=" << err << " ("
                                           << std::generic_category().message(err) << ")");
        return LoadResult{Status::failure(ErrorKind::IOError, "Cannot access timestamp file " + path),
                          IntervalList{}};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return LoadResult{Status::failure(ErrorKind::IOError, "Read failed: " + path),
                          IntervalList{}};
    }
    return parse_interval_list(ss.str());
}

Status write_interval_file(const std::string &path, const IntervalList &list) {
    // Write next to the target and rename so a failed write never truncates the old file.
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            const int err = errno;
            LP_LOG("error", "open failed for " << tmp_path << " errno=" << err << " ("
                                               << std::generic_category().message(err) << ")");
            return Status::failure(ErrorKind::IOError, "Cannot write timestamp file " + path);
        }
        out << serialize_interval_list(list);
        out.flush();
        if (!out.good()) {
            LP_LOG("error", "write failed for " << tmp_path);
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return Status::failure(ErrorKind::IOError, "Cannot write timestamp file " + path);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        LP_LOG("error", "rename " << tmp_path << " -> " << path << " failed: " << ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return Status::failure(ErrorKind::IOError, "Cannot write timestamp file " + path);
    }
    LP_LOG("io", "wrote " << list.size() << " intervals to " << path);
    return Status::success();
}

TimestampStore::TimestampStore(LooperConfig config) : config_(std::move(config)) {}

Status TimestampStore::load(const std::string &path) {
    auto loaded = read_interval_file(path);
    if (!loaded.status.ok) {
        LP_LOG("error", "load of " << path << " failed: " << loaded.status.message);
        return report(std::move(loaded.status));
    }
    list_ = std::move(loaded.intervals);
    path_ = path;
    LP_LOG("info", "loaded " << list_.size() << " intervals from " << path_);
    notify_reset();
    return Status::success();
}

Status TimestampStore::create(const std::string &path) { return adopt(IntervalList{}, path); }

Status TimestampStore::adopt(IntervalList list, const std::string &path) {
    Status st = write_interval_file(path, list);
    if (!st.ok) {
        return report(std::move(st));
    }
    list_ = std::move(list);
    path_ = path;
    notify_reset();
    return Status::success();
}

Status TimestampStore::check_cell(size_t row, int column, Column &column_out) const {
    if (row >= list_.size()) {
        return Status::failure(ErrorKind::IndexError, "Row out of range: " + std::to_string(row));
    }
    if (!column_from_index(column, column_out)) {
        return Status::failure(ErrorKind::IndexError,
                               "Column out of range: " + std::to_string(column));
    }
    return Status::success();
}

Status TimestampStore::value_at(size_t row, int column, CellValue &out) const {
    Column c{};
    Status st = check_cell(row, column, c);
    if (st.ok) {
        out = list_.at(row).value_at(c);
    }
    return st;
}

Status TimestampStore::display_at(size_t row, int column, std::string &out) const {
    Column c{};
    Status st = check_cell(row, column, c);
    if (st.ok) {
        out = list_.at(row).display_at(c);
    }
    return st;
}

Status TimestampStore::set_value(size_t row, int column, std::string_view text) {
    Column c{};
    Status st = check_cell(row, column, c);
    if (!st.ok) {
        return report(std::move(st));
    }

    Interval updated = list_.at(row);
    if (c == Column::Description) {
        updated.description = std::string(text);
    } else {
        auto parsed = parse_time_offset(text);
        if (!parsed.status.ok) {
            LP_LOG("warn", "rejected edit at row " << row << " column " << column << ": "
                                                   << parsed.status.message);
            return report(std::move(parsed.status));
        }
        if (c == Column::Start) {
            updated.start = parsed.value;
        } else {
            updated.end = parsed.value;
        }
    }

    // Write-through: swap the row in, persist, restore the old row if persisting fails.
    std::swap(list_.at(row), updated);
    if (!path_.empty()) {
        st = write_interval_file(path_, list_);
        if (!st.ok) {
            std::swap(list_.at(row), updated);
            return report(std::move(st));
        }
    }
    LP_LOG("store", "row " << row << " column " << column << " set to '" << text << "'");
    notify_changed(row, row);
    return Status::success();
}

Status TimestampStore::append(Interval interval) {
    IntervalList previous = list_;
    list_.append(std::move(interval));
    const size_t row = list_.size() - 1;
    if (!path_.empty()) {
        Status st = write_interval_file(path_, list_);
        if (!st.ok) {
            list_ = std::move(previous);
            return report(std::move(st));
        }
    }
    notify_changed(row, row);
    return Status::success();
}

Status TimestampStore::sort(bool descending) {
    IntervalList previous = list_;
    list_.sort_by_start(descending);
    if (config_.save_on_sort && !path_.empty()) {
        Status st = write_interval_file(path_, list_);
        if (!st.ok) {
            list_ = std::move(previous);
            return report(std::move(st));
        }
    }
    LP_LOG("store", "sorted " << list_.size() << " intervals "
                              << (descending ? "descending" : "ascending")
                              << (config_.save_on_sort ? " (saved)" : ""));
    notify_reset();
    return Status::success();
}

Status TimestampStore::save() const {
    if (path_.empty()) {
        return report(Status::failure(ErrorKind::IOError, "No timestamp file chosen"));
    }
    return report(write_interval_file(path_, list_));
}

TimestampStore::ListenerToken TimestampStore::add_data_changed_listener(
    DataChangedListener listener) {
    Listener l;
    l.token = next_token_++;
    l.on_changed = std::move(listener);
    listeners_.push_back(std::move(l));
    return listeners_.back().token;
}

TimestampStore::ListenerToken TimestampStore::add_reset_listener(ResetListener listener) {
    Listener l;
    l.token = next_token_++;
    l.on_reset = std::move(listener);
    listeners_.push_back(std::move(l));
    return listeners_.back().token;
}

TimestampStore::ListenerToken TimestampStore::add_error_listener(ErrorListener listener) {
    Listener l;
    l.token = next_token_++;
    l.on_error = std::move(listener);
    listeners_.push_back(std::move(l));
    return listeners_.back().token;
}

void TimestampStore::remove_listener(ListenerToken token) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [token](const Listener &l) { return l.token == token; }),
                     listeners_.end());
}

// Listeners may subscribe or unsubscribe from inside a callback, so dispatch walks a copy.
// Changes take effect from the next notification on.

Status TimestampStore::report(Status status) const {
    if (!status.ok) {
        const auto snapshot = listeners_;
        for (const auto &l : snapshot) {
            if (l.on_error) {
                l.on_error(status);
            }
        }
    }
    return status;
}

void TimestampStore::notify_changed(size_t first_row, size_t last_row) const {
    const auto snapshot = listeners_;
    for (const auto &l : snapshot) {
        if (l.on_changed) {
            l.on_changed(first_row, last_row);
        }
    }
}

void TimestampStore::notify_reset() const {
    const auto snapshot = listeners_;
    for (const auto &l : snapshot) {
        if (l.on_reset) {
            l.on_reset(list_.size());
        }
    }
}

}  // namespace looper
