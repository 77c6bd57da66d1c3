//
//  status.hpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace looper {

/// @ingroup api
/// Failure category carried by a Status.
enum class ErrorKind {
    None = 0,
    FormatError,           ///< Malformed time text, out-of-range component or bad document.
    InvalidIntervalError,  ///< Arm requested while the media duration is unknown.
    NotReadyError,         ///< Player command requested before media/duration are available.
    IOError,               ///< Reading or writing a persisted list failed.
    IndexError,            ///< Row or column outside the list.
};

/**
 * @brief Result object with success flag, failure category and optional message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty. On failure, `message`
 * contains a short description of what went wrong (for time text: `Time invalid: <text>`).
 */
struct Status {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;

    static Status success() { return Status{}; }
    static Status failure(ErrorKind kind, std::string message) {
        return Status{false, kind, std::move(message)};
    }
};

/// Short, stable name of an error kind (used in log lines and CLI output).
const char *error_kind_name(ErrorKind kind);

}  // namespace looper
