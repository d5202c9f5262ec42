#include "sim/RandomSource.h"
#include <raylib.h>
#include <ctime>

namespace pacduo::sim {

namespace {
// Resolution of nextFloat(); stays below RAND_MAX on every platform.
constexpr int kFloatSteps = 10000;
} // namespace

RaylibRandomSource::RaylibRandomSource(std::uint32_t seed)
    : seed_(seed != 0 ? seed : static_cast<std::uint32_t>(std::time(nullptr))) {
    SetRandomSeed(seed_);
}

float RaylibRandomSource::nextFloat() {
    return static_cast<float>(GetRandomValue(0, kFloatSteps - 1)) / static_cast<float>(kFloatSteps);
}

int RaylibRandomSource::nextInt(int lo, int hi) {
    if (hi <= lo) return lo;
    return GetRandomValue(lo, hi);
}

} // namespace pacduo::sim
