//
//  config.hpp
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
 * @brief Session tuning knobs shared by the store, the loop controller and the CLI.
 *
 * JSON keys match the member names. Missing keys keep their defaults, unknown keys are
 * ignored.
 */
struct LooperConfig {
    uint32_t tick_period_ms = 100;        ///< Period of LoopController::tick()
    int volume_max = 40;                  ///< Volume ceiling (not a hardware limit)
    int default_volume = 20;              ///< Applied on media load
    int volume_step = 1;                  ///< Wheel/keyboard volume step
    double rate_min = 0.2;                ///< Slowest playback rate
    double rate_max = 2.0;                ///< Fastest playback rate
    double rate_step = 0.1;               ///< Speed up/slow down step
    uint32_t progress_resolution = 10000; ///< Steps of the progress control
    bool save_on_sort = false;            ///< Persist the list after sort()
};

struct ConfigResult {
    Status status;
    LooperConfig config;
};

/// Parse a JSON config document. On failure `config` holds the defaults.
ConfigResult parse_config(std::string_view document);

/// Load a JSON config file (IOError when unreadable).
ConfigResult load_config(const std::string &path);

/// Serialize every key.
std::string config_to_json(const LooperConfig &config, int indent = 2);

}  // namespace looper
