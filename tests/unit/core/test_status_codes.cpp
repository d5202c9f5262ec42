#include <catch2/catch_test_macros.hpp>
#include "pacduo/status_codes.h"
#include <cstring>

using namespace pacduo;

TEST_CASE("Status codes have stable string representations", "[core]") {
    struct Case { StatusCode code; const char* expected; } cases[] = {
        {StatusCode::OK, "OK"},
        {StatusCode::NOT_FOUND, "NOT_FOUND"},
        {StatusCode::BAD_FORMAT, "BAD_FORMAT"},
        {StatusCode::IO_ERROR, "IO_ERROR"},
        {StatusCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
        {StatusCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
    };
    for (auto& c : cases) {
        REQUIRE(std::strcmp(to_string(c.code), c.expected) == 0);
    }
    REQUIRE(static_cast<std::uint32_t>(StatusCode::OK) == 0u);
    REQUIRE(std::strcmp(to_string(static_cast<StatusCode>(999)), "UNKNOWN_STATUS_CODE") == 0);
}
