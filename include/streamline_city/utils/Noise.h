#pragma once

#include "streamline_city/utils/Random.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

namespace streamline_city {
namespace utils {

/**
 * Perlin - seeded 2D gradient noise
 *
 * Output is roughly in [-1, 1]. The permutation table is shuffled from the
 * seed so two instances with different seeds give unrelated fields.
 */
class Perlin {
public:
    double gridSize = 1.0;
    double amplitude = 1.0;

    explicit Perlin(uint32_t seed = 0) {
        for (int i = 0; i < 256; ++i) {
            p_[i] = i;
        }
        std::mt19937 rng(seed);
        std::shuffle(p_.begin(), p_.begin() + 256, rng);
        for (int i = 0; i < 256; ++i) {
            p_[i + 256] = p_[i];
        }
    }

    double get(double x, double y) const {
        x *= gridSize;
        y *= gridSize;

        int xi = static_cast<int>(std::floor(x));
        int yi = static_cast<int>(std::floor(y));
        double xf = x - xi;
        double yf = y - yi;
        double u = fade(xf);
        double v = fade(yf);

        int x0 = xi & 255;
        int x1 = (xi + 1) & 255;
        int y0 = yi & 255;
        int y1 = (yi + 1) & 255;

        int aa = p_[p_[x0] + y0];
        int ba = p_[p_[x1] + y0];
        int ab = p_[p_[x0] + y1];
        int bb = p_[p_[x1] + y1];

        double n00 = grad(aa, xf, yf);
        double n10 = grad(ba, xf - 1, yf);
        double n01 = grad(ab, xf, yf - 1);
        double n11 = grad(bb, xf - 1, yf - 1);

        double nx0 = n00 + u * (n10 - n00);
        double nx1 = n01 + u * (n11 - n01);
        return amplitude * (nx0 + v * (nx1 - nx0));
    }

private:
    std::array<int, 512> p_{};

    // 6t^5 - 15t^4 + 10t^3
    static double fade(double t) {
        return t * t * t * (t * (6 * t - 15) + 10);
    }

    // Eight gradient directions, scaled so the result stays near [-1, 1]
    static double grad(int hash, double x, double y) {
        switch (hash & 7) {
            case 0: return x + y;
            case 1: return x - y;
            case 2: return -x + y;
            case 3: return -x - y;
            case 4: return x * 1.4142135;
            case 5: return -x * 1.4142135;
            case 6: return y * 1.4142135;
            case 7: return -y * 1.4142135;
            default: return 0;
        }
    }
};

/**
 * FractalNoise - multi-octave Perlin noise
 *
 * Each octave doubles the grid frequency and scales the amplitude by
 * `persistence`. Octave seeds are drawn from the supplied Random.
 */
class FractalNoise {
public:
    std::vector<Perlin> components;

    static FractalNoise create(Random& random, int octaves = 1, double gridSize = 1.0,
                               double persistence = 0.5) {
        FractalNoise noise;
        double amplitude = 1.0;
        double currentGridSize = gridSize;

        for (int i = 0; i < octaves; ++i) {
            Perlin perlin(random.nextSeed());
            perlin.gridSize = currentGridSize;
            perlin.amplitude = amplitude;
            noise.components.push_back(perlin);

            currentGridSize *= 2.0;
            amplitude *= persistence;
        }

        return noise;
    }

    double get(double x, double y) const {
        double result = 0;
        for (const auto& component : components) {
            result += component.get(x, y);
        }
        return result;
    }
};

} // namespace utils
} // namespace streamline_city
