#pragma once

// status_codes.h
// Status codes reported by loaders and persistence (maze files, score store).
// The simulation itself never fails; it logs and degrades instead.

#include <cstdint>

namespace pacduo {

// Keep values stable; append only.
enum class StatusCode : std::uint32_t {
    OK = 0,
    NOT_FOUND = 1,
    BAD_FORMAT = 2,
    IO_ERROR = 3,
    INVALID_ARGUMENT = 4,
    INTERNAL_ERROR = 5,
};

// Returns a stable null-terminated string literal for the status code.
const char* to_string(StatusCode code) noexcept;

} // namespace pacduo
