//
//  config.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <cerrno>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace looper {

namespace {

ConfigResult rejected(const std::string &message) {
    LP_LOG("warn", "config rejected: " << message);
    return ConfigResult{Status::failure(ErrorKind::FormatError, message), LooperConfig{}};
}

}  // namespace

ConfigResult parse_config(std::string_view document) {
    json j = json::parse(document.begin(), document.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return rejected("config is not a JSON object");
    }

    LooperConfig c;
    try {
        c.tick_period_ms = j.value("tick_period_ms", c.tick_period_ms);
        c.volume_max = j.value("volume_max", c.volume_max);
        c.default_volume = j.value("default_volume", c.default_volume);
        c.volume_step = j.value("volume_step", c.volume_step);
        c.rate_min = j.value("rate_min", c.rate_min);
        c.rate_max = j.value("rate_max", c.rate_max);
        c.rate_step = j.value("rate_step", c.rate_step);
        c.progress_resolution = j.value("progress_resolution", c.progress_resolution);
        c.save_on_sort = j.value("save_on_sort", c.save_on_sort);
    } catch (const json::exception &e) {
        return rejected(std::string("config has a mistyped value: ") + e.what());
    }

    if (c.tick_period_ms == 0) {
        return rejected("tick_period_ms must be positive");
    }
    if (c.volume_max <= 0) {
        return rejected("volume_max must be positive");
    }
    if (c.default_volume < 0 || c.default_volume > c.volume_max) {
        return rejected("default_volume must lie in [0, volume_max]");
    }
    if (c.rate_min <= 0.0 || c.rate_min > c.rate_max) {
        return rejected("rate_min must be positive and not exceed rate_max");
    }
    if (c.progress_resolution == 0) {
        return rejected("progress_resolution must be positive");
    }
    return ConfigResult{Status::success(), c};
}

ConfigResult load_config(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        const int err = errno;
        LP_LOG("error", "open failed for " << path << " errno=" << err << " ("
                                           << std::generic_category().message(err) << ")");
        return ConfigResult{Status::failure(ErrorKind::IOError, "Cannot access config: " + path),
                            LooperConfig{}};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    auto result = parse_config(ss.str());
    if (result.status.ok) {
        LP_LOG("config", "loaded " << path);
    }
    return result;
}

std::string config_to_json(const LooperConfig &config, int indent) {
    json j;
    j["tick_period_ms"] = config.tick_period_ms;
    j["volume_max"] = config.volume_max;
    j["default_volume"] = config.default_volume;
    j["volume_step"] = config.volume_step;
    j["rate_min"] = config.rate_min;
    j["rate_max"] = config.rate_max;
    j["rate_step"] = config.rate_step;
    j["progress_resolution"] = config.progress_resolution;
    j["save_on_sort"] = config.save_on_sort;
    return j.dump(indent);
}

}  // namespace looper
