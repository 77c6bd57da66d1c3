//
//  looper.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "companion_media.hpp"
#include "config.hpp"
#include "interval.hpp"
#include "legacy_timestamps.hpp"
#include "loop_controller.hpp"
#include "media_player.hpp"
#include "status.hpp"
#include "time_offset.hpp"
#include "timestamp_store.hpp"

namespace looper {

/// @defgroup api Looper Public API
/// Timestamp store, legacy ingestion and loop playback control.
/// @{

/**
 * @brief Return the Looper library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// True when `path` uses the legacy line format (`.txt`).
bool is_legacy_timestamp_path(const std::string &path);  ///< @ingroup api

/// Load either format, chosen by extension (`.txt` legacy, anything else JSON).
LoadResult load_interval_source(const std::string &path);  ///< @ingroup api

/**
 * @brief Convert a legacy line file into the JSON format.
 *
 * @param legacy_path Source `MM:SS-MM:SS-description` file.
 * @param output_path Destination `.tmsp` file; left untouched when the source is invalid.
 */
Status convert_legacy_file(const std::string &legacy_path,
                           const std::string &output_path);  ///< @ingroup api

/// @}

}  // namespace looper
