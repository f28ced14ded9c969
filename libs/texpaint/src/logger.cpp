// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: stderr and callback loggers
//

#include "stdafx.h"
#include <texpaint/logger.h>

#include <cstdarg>
#include <cstdio>

namespace texpaint {

char const *to_string(Severity severity) {
    switch (severity) {
    case Severity::Debug: return "debug";
    case Severity::Info: return "info";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
    }

    return "?";
}

class Formatting_Logger : public ILogger {
public:
    Formatting_Logger(Severity min_severity)
        : _min_severity(min_severity) {
    }

    void log(Severity severity, char const *fmt, ...) override {
        if (fmt == nullptr || severity < _min_severity) {
            return;
        }

        std::va_list va, va2;
        va_start(va, fmt);
        va_copy(va2, va);

        auto res = vsnprintf(nullptr, 0, fmt, va);
        va_end(va);

        if (res < 0) {
            va_end(va2);
            return;
        }

        std::vector<char> buf(size_t(res) + 1);
        vsnprintf(buf.data(), buf.size(), fmt, va2);
        va_end(va2);

        emit(severity, buf.data());
    }

protected:
    virtual void emit(Severity severity, char const *message) = 0;

private:
    Severity _min_severity;
};

class Stderr_Logger : public Formatting_Logger {
public:
    using Formatting_Logger::Formatting_Logger;

protected:
    void emit(Severity severity, char const *message) override {
        fprintf(stderr, "[texpaint] %s: %s\n", to_string(severity), message);
    }
};

class Callback_Logger : public Formatting_Logger {
public:
    Callback_Logger(Debug_Proc proc, void *user, Severity min_severity)
        : Formatting_Logger(min_severity), _proc(proc), _user(user) {
    }

protected:
    void emit(Severity severity, char const *message) override {
        if (_proc != nullptr) {
            _proc(severity, message, _user);
        }
    }

private:
    Debug_Proc _proc;
    void *_user;
};

std::unique_ptr<ILogger> make_stderr_logger(Severity min_severity) {
    return std::make_unique<Stderr_Logger>(min_severity);
}

std::unique_ptr<ILogger> make_callback_logger(Debug_Proc proc, void *user, Severity min_severity) {
    return std::make_unique<Callback_Logger>(proc, user, min_severity);
}

}
