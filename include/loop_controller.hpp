//
//  loop_controller.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "interval.hpp"
#include "media_player.hpp"
#include "status.hpp"

namespace looper {

enum class LoopState {
    Idle,            ///< No end bound enforced; the player runs freely (or is stopped).
    Armed,           ///< Watching positions against [start, end].
    RestartPending,  ///< Played past end; the next tick() seeks back to start.
};

const char *loop_state_name(LoopState state);

/// Start/end of the armed interval on the progress control scale.
struct Highlight {
    uint32_t start = 0;
    uint32_t end = 0;
};

/**
 * @brief Drives a MediaPlayer to replay one interval in a loop.
 *
 * on_position_changed() only raises a restart flag. The seek back to the interval start is
 * issued from tick(), which the owner calls every LooperConfig::tick_period_ms on its own
 * thread. Seeking from inside the engine's position notification stalls the engine, so the
 * two phases must stay separate.
 *
 * All player-mutating calls (everything except on_position_changed()) must come from the
 * same thread as tick().
 */
class LoopController {
   public:
    using ProgressListener = std::function<void(double fraction)>;

    explicit LoopController(MediaPlayer &player, LooperConfig config = LooperConfig{});
    ~LoopController();

    LoopController(const LoopController &) = delete;
    LoopController &operator=(const LoopController &) = delete;

    /// Open media in the player. NotReadyError when the engine reports no duration.
    Status load_media(const std::string &path);
    bool has_media() const { return media_loaded_; }

    /**
     * @brief Make `interval` the active loop target: seek to its start, then play.
     *
     * Counts as the start of playback, so a following play_pause() pauses. NotReadyError
     * without media, InvalidIntervalError when `media_duration_ms` is zero/unknown. An interval whose end is
     * not after its start is armed anyway and restarts on the first position past its end.
     */
    Status arm(const Interval &interval, int64_t media_duration_ms);

    /// Begin playback of `selection` (armed) or, when null, of the whole media (Idle).
    Status start(const Interval *selection);

    /// Toggle play/pause; the first call after a media load behaves like start().
    Status play_pause(const Interval *selection);

    /// Position notification hook. Cheap, idempotent, never touches the player.
    void on_position_changed(int64_t current_ms);

    /// Periodic work: pending restart seek, end-of-media reset, progress push.
    void tick();

    /// Scrub to `fraction` of the media; stops enforcing the armed end bound.
    Status set_position_fraction(double fraction);

    /// Clamp to [0, volume_max] and apply.
    int set_volume(int volume);
    int modify_volume(int delta);
    /// Step by LooperConfig::volume_step (mouse wheel).
    int volume_up();
    int volume_down();
    bool toggle_mute();
    /// False (and no command issued) when the result would leave [rate_min, rate_max].
    bool modify_rate(double delta);
    /// Step by LooperConfig::rate_step.
    bool speed_up();
    bool slow_down();

    /// Period at which the owner's scheduler must call tick().
    uint32_t tick_period_ms() const { return config_.tick_period_ms; }

    LoopState state() const;
    bool has_started() const { return started_; }
    bool is_playing() const { return playing_; }
    int volume() const { return volume_; }
    uint64_t armed_start_ms() const;
    std::optional<uint64_t> armed_end_ms() const;
    std::optional<Highlight> highlight() const;
    const LooperConfig &config() const { return config_; }

    void add_progress_listener(ProgressListener listener);

   private:
    void disarm();

    MediaPlayer &player_;
    LooperConfig config_;

    // Shared with the notification thread.
    mutable std::mutex mutex_;
    uint64_t start_ms_ = 0;
    std::optional<uint64_t> end_ms_;
    bool restart_pending_ = false;

    // Controller thread only.
    bool media_loaded_ = false;
    bool started_ = false;
    bool playing_ = false;
    int volume_ = 0;
    int64_t armed_duration_ms_ = 0;
    std::vector<ProgressListener> progress_listeners_;
};

}  // namespace looper
