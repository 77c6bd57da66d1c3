//
//  media_player.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace looper {

/**
 * @brief Capabilities Looper needs from the external media-playback engine.
 *
 * Commands are fire-and-forget; the engine reports its own errors. Position notifications
 * may arrive on the engine's own thread. Implementations must tolerate commands issued
 * from the controller's thread while a notification is in flight, but must never be asked
 * to seek from inside the notification itself.
 */
class MediaPlayer {
   public:
    /// Receives the current absolute position in milliseconds.
    using PositionCallback = std::function<void(int64_t position_ms)>;

    virtual ~MediaPlayer() = default;

    /// Open and parse media; false when the engine cannot open the path.
    virtual bool open(const std::string &path) = 0;
    /// Drop the current media.
    virtual void close() = 0;
    /// Hand the current media to the engine again (needed after it reached the end).
    virtual void reload() = 0;

    /// Media duration in ms; 0 while unknown.
    virtual int64_t duration_ms() const = 0;
    /// Current absolute position in ms.
    virtual int64_t time_ms() const = 0;
    /// Current position as a fraction of the duration, [0,1].
    virtual double position() const = 0;

    virtual void seek_ms(int64_t position_ms) = 0;
    virtual void set_position(double fraction) = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool is_playing() const = 0;

    virtual double rate() const = 0;
    virtual void set_rate(double rate) = 0;

    virtual int volume() const = 0;
    virtual void set_volume(int volume) = 0;

    virtual bool is_muted() const = 0;
    virtual void set_muted(bool muted) = 0;

    /// Replace the position-changed subscriber; an empty callback unsubscribes.
    virtual void set_position_callback(PositionCallback callback) = 0;
};

}  // namespace looper
