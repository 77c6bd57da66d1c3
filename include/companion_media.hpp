//
//  companion_media.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

namespace looper {

// First other file next to `timestamp_path` sharing its stem (talk.tmsp -> talk.mp4),
// in sorted name order. Empty when there is none or the directory cannot be listed.
std::optional<std::string> find_companion_media(const std::string &timestamp_path);

}  // namespace looper
