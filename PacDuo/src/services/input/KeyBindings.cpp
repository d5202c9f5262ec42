#include "services/input/KeyBindings.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"

#include <cctype>
#include <charconv>
#include <vector>

namespace pacduo::input {

namespace {

using logging::LogManager;

std::string trimCopy(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string toLower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

struct KeyNameEntry {
    std::string lowercaseToken;
    int keyCode;
    std::string displayToken;
};

const std::vector<KeyNameEntry>& namedKeys() {
    static const std::vector<KeyNameEntry> kNames = {
        {"up", KEY_UP, "Up"},
        {"arrowup", KEY_UP, "Up"},
        {"down", KEY_DOWN, "Down"},
        {"arrowdown", KEY_DOWN, "Down"},
        {"left", KEY_LEFT, "Left"},
        {"arrowleft", KEY_LEFT, "Left"},
        {"right", KEY_RIGHT, "Right"},
        {"arrowright", KEY_RIGHT, "Right"},
        {"space", KEY_SPACE, "Space"},
        {"enter", KEY_ENTER, "Enter"},
        {"return", KEY_ENTER, "Enter"},
        {"tab", KEY_TAB, "Tab"},
        {"backspace", KEY_BACKSPACE, "Backspace"},
        {"rightshift", KEY_RIGHT_SHIFT, "RShift"},
        {"leftshift", KEY_LEFT_SHIFT, "LShift"},
        {"rightcontrol", KEY_RIGHT_CONTROL, "RCtrl"},
        {"leftcontrol", KEY_LEFT_CONTROL, "LCtrl"},
        {"slash", KEY_SLASH, "/"},
        {"/", KEY_SLASH, "/"},
        {"period", KEY_PERIOD, "."},
        {".", KEY_PERIOD, "."},
        {"comma", KEY_COMMA, ","},
        {",", KEY_COMMA, ","},
        {"semicolon", KEY_SEMICOLON, ";"},
        {";", KEY_SEMICOLON, ";"},
        {"apostrophe", KEY_APOSTROPHE, "'"},
        {"'", KEY_APOSTROPHE, "'"},
        {"minus", KEY_MINUS, "-"},
        {"-", KEY_MINUS, "-"},
        {"equal", KEY_EQUAL, "="},
        {"=", KEY_EQUAL, "="},
    };
    return kNames;
}

bool parseNumpadDigit(const std::string& lower, int& outKeyCode) {
    if (lower.rfind("numpad", 0) != 0 || lower.size() != 7) {
        return false;
    }
    char digit = lower[6];
    if (digit < '0' || digit > '9') {
        return false;
    }
    outKeyCode = KEY_KP_0 + (digit - '0');
    return true;
}

bool parseFunctionKey(const std::string& lower, int& outKeyCode) {
    if (lower.size() < 2 || lower[0] != 'f') {
        return false;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(lower.data() + 1, lower.data() + lower.size(), value);
    if (ec != std::errc() || ptr != lower.data() + lower.size() || value < 1 || value > 12) {
        return false;
    }
    outKeyCode = KEY_F1 + (value - 1);
    return true;
}

int readBinding(const std::string& prefix, const char* action, int fallback) {
    const std::string key = prefix + action;
    std::string name = ConfigurationManager::getString(key, "");
    if (name.empty()) {
        return fallback;
    }
    if (auto code = parseKeyName(name)) {
        return *code;
    }
    LogManager::warn("Input: unknown key '{}' for {}, keeping {}", name, key, keyDisplayName(fallback));
    return fallback;
}

} // namespace

std::optional<int> parseKeyName(std::string_view text) {
    std::string lower = toLower(trimCopy(text));
    if (lower.empty()) {
        return std::nullopt;
    }
    if (lower.size() == 1 && lower[0] >= 'a' && lower[0] <= 'z') {
        return KEY_A + (lower[0] - 'a');
    }
    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '9') {
        return KEY_ZERO + (lower[0] - '0');
    }
    int code = 0;
    if (parseFunctionKey(lower, code) || parseNumpadDigit(lower, code)) {
        return code;
    }
    for (const auto& entry : namedKeys()) {
        if (lower == entry.lowercaseToken) {
            return entry.keyCode;
        }
    }
    return std::nullopt;
}

std::string keyDisplayName(int keyCode) {
    if (keyCode >= KEY_A && keyCode <= KEY_Z) {
        return std::string(1, static_cast<char>('A' + (keyCode - KEY_A)));
    }
    if (keyCode >= KEY_ZERO && keyCode <= KEY_NINE) {
        return std::string(1, static_cast<char>('0' + (keyCode - KEY_ZERO)));
    }
    if (keyCode >= KEY_F1 && keyCode <= KEY_F12) {
        return "F" + std::to_string(1 + keyCode - KEY_F1);
    }
    if (keyCode >= KEY_KP_0 && keyCode <= KEY_KP_9) {
        return "Num" + std::to_string(keyCode - KEY_KP_0);
    }
    for (const auto& entry : namedKeys()) {
        if (entry.keyCode == keyCode) {
            return entry.displayToken;
        }
    }
    return "?";
}

KeyBindings KeyBindings::defaultsForPlayer(int playerNumber) {
    if (playerNumber == 2) {
        return KeyBindings{KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT, KEY_SLASH};
    }
    return KeyBindings{};
}

KeyBindings KeyBindings::fromConfiguration(int playerNumber) {
    KeyBindings bindings = defaultsForPlayer(playerNumber);
    const std::string prefix = "input.player" + std::to_string(playerNumber) + ".";
    bindings.up = readBinding(prefix, "up", bindings.up);
    bindings.down = readBinding(prefix, "down", bindings.down);
    bindings.left = readBinding(prefix, "left", bindings.left);
    bindings.right = readBinding(prefix, "right", bindings.right);
    bindings.swap = readBinding(prefix, "swap", bindings.swap);
    return bindings;
}

} // namespace pacduo::input
