//
//  looper.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "looper.hpp"
#include "looper_version.hpp"

#include <cctype>
#include <filesystem>
#include <utility>

#include "logging.hpp"

namespace looper {

std::string version_string() { return LOOPER_VERSION_DISPLAY; }

bool is_legacy_timestamp_path(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".txt";
}

LoadResult load_interval_source(const std::string &path) {
    if (is_legacy_timestamp_path(path)) {
        return load_legacy_list(path);
    }
    return read_interval_file(path);
}

Status convert_legacy_file(const std::string &legacy_path, const std::string &output_path) {
    LP_LOG("debug", "convert_legacy_file input=" << legacy_path << " output=" << output_path);
    auto loaded = load_legacy_list(legacy_path);
    if (!loaded.status.ok) {
        return loaded.status;
    }
    TimestampStore store;
    return store.adopt(std::move(loaded.intervals), output_path);
}

}  // namespace looper
