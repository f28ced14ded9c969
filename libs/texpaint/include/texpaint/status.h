// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: status codes and the exception type thrown by libtexpaint
//

#pragma once

#include <exception>

#if _WIN32 && !defined(TEXPAINT_STATIC)
#if defined(TEXPAINT_BUILDING)
#define TEXPAINT_EXPORT __declspec(dllexport)
#else
#define TEXPAINT_EXPORT __declspec(dllimport)
#endif
#else
#define TEXPAINT_EXPORT
#endif

#define TEXPAINT_RETURN_CODE [[nodiscard]] texpaint::Status

namespace texpaint {

enum class Status {
    /** No error */
    OK = 0,
    /** General failure */
    Failure,
    /** One or more arguments have an invalid value */
    Invalid_Arguments,
    /** The paint buffer couldn't be allocated */
    Out_Of_Memory,
    /** The configuration structure contains one or more invalid values */
    Invalid_Configuration,
    /** The target has no material or no geometry */
    Not_Paintable,
    /** A file couldn't be read or written */
    IO_Error,
};

TEXPAINT_EXPORT char const *
to_string(Status rc);

class TEXPAINT_EXPORT Exception : public std::exception {
public:
    Exception(Status rc)
        : rc(rc) {
    }

    Status code() const noexcept {
        return rc;
    }

    char const *what() const noexcept override {
        return to_string(rc);
    }

private:
    Status rc;
};

}
