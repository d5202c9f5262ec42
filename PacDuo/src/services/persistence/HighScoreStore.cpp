#include "services/persistence/HighScoreStore.h"
#include "services/configuration/json_io.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <limits>

namespace pacduo::persistence {

using logging::LogManager;
using nlohmann::json;

JsonScoreStore::JsonScoreStore(std::string path) : path_(std::move(path)) {}

int JsonScoreStore::readHighScore() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        lastReadStatus_ = StatusCode::NOT_FOUND;
        return 0;
    }
    auto doc = jsonio::readJson(path_);
    if (!doc || !doc->is_object()) {
        LogManager::warn("High score file {} is unreadable, starting from 0", path_);
        lastReadStatus_ = StatusCode::BAD_FORMAT;
        return 0;
    }
    auto it = doc->find(kHighScoreKey);
    if (it == doc->end()) {
        lastReadStatus_ = StatusCode::NOT_FOUND;
        return 0;
    }
    if (!it->is_number_integer() || it->get<long long>() < 0 ||
        it->get<long long>() > std::numeric_limits<int>::max()) {
        LogManager::warn("High score file {} holds an invalid value, starting from 0", path_);
        lastReadStatus_ = StatusCode::BAD_FORMAT;
        return 0;
    }
    lastReadStatus_ = StatusCode::OK;
    return it->get<int>();
}

StatusCode JsonScoreStore::writeHighScore(int score) {
    if (score < 0) return StatusCode::INVALID_ARGUMENT;

    json doc = json::object();
    if (auto existing = jsonio::readJson(path_); existing && existing->is_object()) {
        doc = std::move(*existing);
    }
    doc[kHighScoreKey] = score;

    if (!jsonio::writeJsonAtomic(path_, doc)) {
        LogManager::error("High score could not be written to {}", path_);
        return StatusCode::IO_ERROR;
    }
    return StatusCode::OK;
}

} // namespace pacduo::persistence
