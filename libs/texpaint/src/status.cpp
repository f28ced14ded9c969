// === Copyright (c) 2020-2021 easimer.net. All rights reserved. ===
//
// Purpose: status codes and configuration validation
//

#include "stdafx.h"
#include <texpaint/config.h>
#include <texpaint/status.h>

namespace texpaint {

char const *to_string(Status rc) {
    switch (rc) {
    case Status::OK: return "OK";
    case Status::Failure: return "failure";
    case Status::Invalid_Arguments: return "invalid arguments";
    case Status::Out_Of_Memory: return "out of memory";
    case Status::Invalid_Configuration: return "invalid configuration";
    case Status::Not_Paintable: return "target is not paintable";
    case Status::IO_Error: return "I/O error";
    }

    return "unknown status";
}

static bool valid_dimension(unsigned dim) {
    return 0 < dim && dim <= max_buffer_dimension;
}

Status validate(Config const &config) {
    if (!valid_dimension(config.buffer_width) || !valid_dimension(config.buffer_height)) {
        return Status::Invalid_Configuration;
    }

    if (config.stipple_density == 0) {
        return Status::Invalid_Configuration;
    }

    // Also rejects NaN
    if (!(0 <= config.cursor_disabled_opacity && config.cursor_disabled_opacity <= 1)) {
        return Status::Invalid_Configuration;
    }

    if (config.decode_threads == 0) {
        return Status::Invalid_Configuration;
    }

    return Status::OK;
}

}
