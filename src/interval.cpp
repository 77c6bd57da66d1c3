//
//  interval.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "interval.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "logging.hpp"

using json = nlohmann::json;

namespace looper {

namespace {

constexpr const char *kStartKey = "start_time";
constexpr const char *kEndKey = "end_time";
constexpr const char *kDescriptionKey = "description";

// Text value of an optional string field; missing or null reads as "".
bool field_text(const json &record, const char *key, std::string &out) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        out.clear();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

CellValue Interval::value_at(Column column) const {
    switch (column) {
        case Column::Start:
            return start;
        case Column::End:
            return end;
        case Column::Description:
            break;
    }
    return description;
}

std::string Interval::display_at(Column column) const {
    switch (column) {
        case Column::Start:
            return start.to_string();
        case Column::End:
            return end.to_string();
        case Column::Description:
            break;
    }
    return description;
}

void IntervalList::sort_by_start(bool descending) {
    if (descending) {
        std::stable_sort(intervals_.begin(), intervals_.end(),
                         [](const Interval &a, const Interval &b) { return a.start > b.start; });
    } else {
        std::stable_sort(intervals_.begin(), intervals_.end(),
                         [](const Interval &a, const Interval &b) { return a.start < b.start; });
    }
}

std::string column_header(int column) {
    switch (column) {
        case 0:
            return "Start Time";
        case 1:
            return "End Time";
        case 2:
            return "Description";
        default:
            return "";
    }
}

bool column_from_index(int index, Column &out) {
    if (index < 0 || index >= kColumnCount) {
        return false;
    }
    out = static_cast<Column>(index);
    return true;
}

Status make_interval(std::string_view start_text, std::string_view end_text,
                     std::string description, Interval &out) {
    auto start = parse_time_offset(start_text);
    if (!start.status.ok) {
        return start.status;
    }
    auto end = parse_time_offset(end_text);
    if (!end.status.ok) {
        return end.status;
    }
    out.start = start.value;
    out.end = end.value;
    out.description = std::move(description);
    return Status::success();
}

LoadResult parse_interval_list(std::string_view document) {
    LoadResult result;
    json j = json::parse(document.begin(), document.end(), nullptr, false);
    if (j.is_discarded()) {
        result.status = Status::failure(ErrorKind::FormatError, "Timestamp file is invalid");
        return result;
    }
    if (!j.is_array()) {
        result.status =
            Status::failure(ErrorKind::FormatError, "Timestamp file is invalid: expected array");
        return result;
    }

    std::vector<Interval> parsed;
    parsed.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto &record = j[i];
        if (!record.is_object()) {
            result.status = Status::failure(
                ErrorKind::FormatError,
                "Timestamp file is invalid: record " + std::to_string(i) + " is not an object");
            return result;
        }
        std::string start_text;
        std::string end_text;
        std::string description;
        if (!field_text(record, kStartKey, start_text) ||
            !field_text(record, kEndKey, end_text) ||
            !field_text(record, kDescriptionKey, description)) {
            result.status = Status::failure(
                ErrorKind::FormatError,
                "Timestamp file is invalid: record " + std::to_string(i) + " has non-text field");
            return result;
        }
        Interval interval;
        Status st = make_interval(start_text, end_text, std::move(description), interval);
        if (!st.ok) {
            LP_LOG("store", "record " << i << " rejected: " << st.message);
            result.status = std::move(st);
            return result;
        }
        parsed.emplace_back(std::move(interval));
    }
    result.intervals = IntervalList(std::move(parsed));
    return result;
}

std::string serialize_interval_list(const IntervalList &list, int indent) {
    json records = json::array();
    for (const auto &interval : list) {
        json r;
        r[kStartKey] = interval.start.to_string();
        r[kEndKey] = interval.end.to_string();
        r[kDescriptionKey] = interval.description;
        records.push_back(std::move(r));
    }
    return records.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace looper
