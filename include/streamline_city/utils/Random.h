#pragma once

#include <cstdint>
#include <random>

namespace streamline_city {
namespace utils {

/**
 * Random - seeded PRNG owned by one generator
 *
 * Every stochastic stage holds its own instance so a pass is reproducible
 * from its seed and two stages never share a stream.
 */
class Random {
public:
    explicit Random(uint32_t seed = 0) : engine_(seed) {}

    void reset(uint32_t seed) {
        engine_.seed(seed);
    }

    // Random float [0, 1)
    double floatVal() {
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
    }

    // Random float [min, max)
    double range(double min, double max) {
        return min + floatVal() * (max - min);
    }

    // Random integer in range [min, max)
    int intVal(int min, int max) {
        if (max <= min) return min;
        return std::uniform_int_distribution<int>(min, max - 1)(engine_);
    }

    // Seed for a child generator (noise octaves, sub-stages)
    uint32_t nextSeed() {
        return static_cast<uint32_t>(engine_());
    }

private:
    std::mt19937 engine_;
};

} // namespace utils
} // namespace streamline_city
