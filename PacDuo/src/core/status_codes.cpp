#include "pacduo/status_codes.h"

namespace pacduo {

const char* to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::NOT_FOUND: return "NOT_FOUND";
        case StatusCode::BAD_FORMAT: return "BAD_FORMAT";
        case StatusCode::IO_ERROR: return "IO_ERROR";
        case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case StatusCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN_STATUS_CODE";
    }
}

} // namespace pacduo
