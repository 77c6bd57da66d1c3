//
//  status.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "status.hpp"

namespace looper {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::FormatError:
            return "FormatError";
        case ErrorKind::InvalidIntervalError:
            return "InvalidIntervalError";
        case ErrorKind::NotReadyError:
            return "NotReadyError";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::IndexError:
            return "IndexError";
    }
    return "unknown";
}

}  // namespace looper
