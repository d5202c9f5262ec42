#pragma once
#include <cstdint>

namespace pacduo::sim {

// Randomness seam so pursuer and pellet decisions can be scripted in tests.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Uniform in [0, 1).
    virtual float nextFloat() = 0;
    // Uniform in [lo, hi]; returns lo when hi < lo.
    virtual int nextInt(int lo, int hi) = 0;
};

// raylib's GetRandomValue. The generator is process-wide, so two instances
// share one sequence; the seed is applied on construction.
class RaylibRandomSource final : public RandomSource {
public:
    // seed 0 seeds from the clock.
    explicit RaylibRandomSource(std::uint32_t seed = 0);

    float nextFloat() override;
    int nextInt(int lo, int hi) override;

    std::uint32_t seed() const { return seed_; }

private:
    std::uint32_t seed_{0};
};

} // namespace pacduo::sim
