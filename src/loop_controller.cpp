//
//  loop_controller.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "loop_controller.hpp"

#include <algorithm>

#include "logging.hpp"

namespace looper {

const char *loop_state_name(LoopState state) {
    switch (state) {
        case LoopState::Idle:
            return "Idle";
        case LoopState::Armed:
            return "Armed";
        case LoopState::RestartPending:
            return "RestartPending";
    }
    return "unknown";
}

LoopController::LoopController(MediaPlayer &player, LooperConfig config)
    : player_(player), config_(std::move(config)), volume_(config_.default_volume) {
    player_.set_position_callback([this](int64_t ms) { on_position_changed(ms); });
}

LoopController::~LoopController() { player_.set_position_callback(nullptr); }

Status LoopController::load_media(const std::string &path) {
    disarm();
    started_ = false;
    playing_ = false;
    armed_duration_ms_ = 0;
    if (!player_.open(path) || player_.duration_ms() <= 0) {
        LP_LOG("warn", "media rejected: " << path);
        player_.close();
        media_loaded_ = false;
        return Status::failure(ErrorKind::NotReadyError, "Cannot play this media file");
    }
    media_loaded_ = true;
    player_.set_volume(volume_);
    LP_LOG("info", "media loaded: " << path << " duration=" << player_.duration_ms() << "ms");
    return Status::success();
}

Status LoopController::arm(const Interval &interval, int64_t media_duration_ms) {
    if (!media_loaded_) {
        return Status::failure(ErrorKind::NotReadyError, "No video file chosen");
    }
    if (media_duration_ms <= 0) {
        return Status::failure(ErrorKind::InvalidIntervalError,
                               "Media duration is not available yet");
    }
    if (interval.end <= interval.start) {
        LP_LOG("loop", "interval end " << interval.end.ms() << "ms is not after start "
                                       << interval.start.ms() << "ms; it restarts immediately");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        start_ms_ = interval.start.ms();
        end_ms_ = interval.end.ms();
        restart_pending_ = false;
    }
    armed_duration_ms_ = media_duration_ms;
    LP_LOG("loop", "armed [" << interval.start.ms() << ", " << interval.end.ms() << "] '"
                             << interval.description << "'");
    player_.seek_ms(static_cast<int64_t>(interval.start.ms()));
    player_.play();
    started_ = true;
    playing_ = true;
    return Status::success();
}

Status LoopController::start(const Interval *selection) {
    if (!media_loaded_) {
        return Status::failure(ErrorKind::NotReadyError, "No video file chosen");
    }
    if (selection) {
        Status st = arm(*selection, player_.duration_ms());
        if (!st.ok) {
            return st;
        }
    } else {
        disarm();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            start_ms_ = 0;
        }
        LP_LOG("loop", "playing whole media, no end bound");
        player_.seek_ms(0);
        player_.play();
        started_ = true;
        playing_ = true;
    }
    return Status::success();
}

Status LoopController::play_pause(const Interval *selection) {
    if (!started_) {
        return start(selection);
    }
    if (!media_loaded_) {
        return Status::failure(ErrorKind::NotReadyError, "No video file chosen");
    }
    if (playing_) {
        player_.pause();
    } else {
        player_.play();
    }
    playing_ = !playing_;
    return Status::success();
}

void LoopController::on_position_changed(int64_t current_ms) {
    // Strictly past the end: a position equal to end still belongs to the interval, also
    // when end is not after start.
    std::lock_guard<std::mutex> lock(mutex_);
    if (end_ms_ && current_ms > static_cast<int64_t>(*end_ms_)) {
        restart_pending_ = true;
    }
}

void LoopController::tick() {
    std::optional<uint64_t> restart_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (restart_pending_) {
            restart_pending_ = false;
            restart_at = start_ms_;
        }
    }
    if (restart_at && media_loaded_) {
        LP_LOG("loop", "restart at " << *restart_at << "ms");
        player_.seek_ms(static_cast<int64_t>(*restart_at));
    }

    if (!media_loaded_) {
        return;
    }

    // The engine stops by itself at the end of the media and will not play again
    // until the media is handed over once more.
    if (started_ && playing_ && !player_.is_playing()) {
        LP_LOG("loop", "end of media reached, resetting player");
        player_.reload();
        player_.set_volume(volume_);
        disarm();
        started_ = false;
        playing_ = false;
    }

    const double fraction = player_.position();
    for (const auto &listener : progress_listeners_) {
        listener(fraction);
    }
}

Status LoopController::set_position_fraction(double fraction) {
    if (!media_loaded_) {
        return Status::failure(ErrorKind::NotReadyError, "No video file chosen");
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    {
        // Manual scrubbing keeps the nominal start but stops enforcing the end.
        std::lock_guard<std::mutex> lock(mutex_);
        end_ms_.reset();
        restart_pending_ = false;
    }
    LP_LOG("loop", "scrub to " << fraction << ", loop end released");
    player_.set_position(fraction);
    return Status::success();
}

int LoopController::set_volume(int volume) {
    volume_ = std::clamp(volume, 0, config_.volume_max);
    player_.set_volume(volume_);
    return volume_;
}

int LoopController::modify_volume(int delta) { return set_volume(player_.volume() + delta); }

int LoopController::volume_up() { return modify_volume(config_.volume_step); }

int LoopController::volume_down() { return modify_volume(-config_.volume_step); }

bool LoopController::toggle_mute() {
    const bool muted = !player_.is_muted();
    player_.set_muted(muted);
    return muted;
}

bool LoopController::modify_rate(double delta) {
    const double rate = player_.rate() + delta;
    // Tolerate accumulated floating point error from repeated 0.1 steps.
    constexpr double kEpsilon = 1e-9;
    if (rate < config_.rate_min - kEpsilon || rate > config_.rate_max + kEpsilon) {
        return false;
    }
    player_.set_rate(std::clamp(rate, config_.rate_min, config_.rate_max));
    return true;
}

bool LoopController::speed_up() { return modify_rate(config_.rate_step); }

bool LoopController::slow_down() { return modify_rate(-config_.rate_step); }

LoopState LoopController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (restart_pending_) {
        return LoopState::RestartPending;
    }
    return end_ms_ ? LoopState::Armed : LoopState::Idle;
}

uint64_t LoopController::armed_start_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_ms_;
}

std::optional<uint64_t> LoopController::armed_end_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_ms_;
}

std::optional<Highlight> LoopController::highlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!end_ms_ || armed_duration_ms_ <= 0) {
        return std::nullopt;
    }
    const double resolution = static_cast<double>(config_.progress_resolution);
    const double duration = static_cast<double>(armed_duration_ms_);
    auto to_scale = [&](uint64_t ms) {
        return static_cast<uint32_t>(
            std::min(static_cast<double>(ms) * resolution / duration, resolution));
    };
    Highlight h;
    h.start = to_scale(start_ms_);
    h.end = to_scale(*end_ms_);
    return h;
}

void LoopController::add_progress_listener(ProgressListener listener) {
    progress_listeners_.push_back(std::move(listener));
}

void LoopController::disarm() {
    std::lock_guard<std::mutex> lock(mutex_);
    end_ms_.reset();
    restart_pending_ = false;
}

}  // namespace looper
