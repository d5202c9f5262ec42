#pragma once
#include "pacduo/status_codes.h"
#include <string>

namespace pacduo::persistence {

// Key/value contract for the best combined score.
class ScoreStore {
public:
    virtual ~ScoreStore() = default;
    virtual int readHighScore() = 0;
    virtual StatusCode writeHighScore(int score) = 0;
};

// JSON document on disk: { "PacDuoHighScore": <int> }. Other keys are kept.
class JsonScoreStore final : public ScoreStore {
public:
    static constexpr const char* kHighScoreKey = "PacDuoHighScore";

    explicit JsonScoreStore(std::string path);

    // Missing or unreadable files read as 0.
    int readHighScore() override;
    StatusCode writeHighScore(int score) override;

    const std::string& path() const { return path_; }
    StatusCode lastReadStatus() const { return lastReadStatus_; }

private:
    std::string path_;
    StatusCode lastReadStatus_{StatusCode::OK};
};

class MemoryScoreStore final : public ScoreStore {
public:
    explicit MemoryScoreStore(int initial = 0) : value_(initial) {}

    int readHighScore() override { ++reads_; return value_; }
    StatusCode writeHighScore(int score) override {
        if (score < 0) return StatusCode::INVALID_ARGUMENT;
        value_ = score;
        ++writes_;
        return StatusCode::OK;
    }

    int value() const { return value_; }
    int reads() const { return reads_; }
    int writes() const { return writes_; }

private:
    int value_{0};
    int reads_{0};
    int writes_{0};
};

} // namespace pacduo::persistence
