//
//  companion_media.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "companion_media.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include "logging.hpp"

namespace looper {

std::optional<std::string> find_companion_media(const std::string &timestamp_path) {
    namespace fs = std::filesystem;
    const fs::path stamp(timestamp_path);
    fs::path dir = stamp.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        LP_LOG("io", "cannot list " << dir.string() << ": " << ec.message());
        return std::nullopt;
    }
    std::vector<fs::path> candidates;
    for (const auto &entry : it) {
        const auto &p = entry.path();
        if (p.filename() == stamp.filename() || p.stem() != stamp.stem()) {
            continue;
        }
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }
        candidates.push_back(p);
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end());
    LP_LOG("io", "companion media for " << timestamp_path << ": " << candidates.front().string());
    return candidates.front().string();
}

}  // namespace looper
