// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: diagnostic message sink
//

#pragma once

#include <memory>

#include <texpaint/status.h>

namespace texpaint {

enum class Severity {
    Debug = 0,
    Info,
    Warning,
    Error,
};

TEXPAINT_EXPORT char const *
to_string(Severity severity);

class TEXPAINT_EXPORT ILogger {
public:
    virtual ~ILogger() = default;

    // printf-style
    virtual void log(Severity severity, char const *fmt, ...) = 0;
};

/**
 * Client-supplied message callback.
 * `message` is only valid for the duration of the call.
 */
using Debug_Proc = void (*)(Severity severity, char const *message, void *user);

/**
 * Creates a logger that writes messages at or above `min_severity` to
 * standard error.
 */
TEXPAINT_EXPORT std::unique_ptr<ILogger>
make_stderr_logger(Severity min_severity);

/**
 * Creates a logger that formats messages at or above `min_severity` and hands
 * them to `proc`.
 */
TEXPAINT_EXPORT std::unique_ptr<ILogger>
make_callback_logger(Debug_Proc proc, void *user, Severity min_severity);

}
