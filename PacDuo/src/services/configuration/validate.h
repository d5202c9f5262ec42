#pragma once
#include <string>

namespace pacduo::cfgvalidate {
// Dotted lowercase segments, e.g. "input.player1.up". Used for setters and
// for keys derived from PACDUO_* environment overrides.
bool isValidKey(const std::string& key);
}
