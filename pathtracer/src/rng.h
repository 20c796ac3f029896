#pragma once
#include <cstdint>
#include <random>
#include "core.h"

/**
 * @brief Seedable random source owned by exactly one render worker.
 * Wraps std::mt19937 with the sampling helpers used by the camera and materials.
 * Not thread-safe; each worker gets its own instance.
 */
class Rng {
public:
    /// Seed directly.
    explicit Rng(std::uint32_t seed = 12345) : engine_(seed) {}

    /// Seed from a render seed and a worker index so workers draw independent streams.
    Rng(std::uint32_t seed, std::uint32_t stream) {
        std::seed_seq seq{seed, stream, 0x9E3779B9u};
        engine_.seed(seq);
    }

    /// Uniform double in [0, 1).
    double uniform() { return uni_(engine_); }

    /// Uniform double in [lo, hi).
    double uniform(double lo, double hi) { return lo + (hi - lo) * uniform(); }

    /// Uniform point inside the unit sphere (rejection sampling).
    Vec3 in_unit_sphere() {
        while (true) {
            Vec3 p(uniform(-1, 1), uniform(-1, 1), uniform(-1, 1));
            if (p.length_squared() < 1.0) return p;
        }
    }

    /// Uniform direction on the unit sphere.
    Vec3 unit_vector() {
        while (true) {
            Vec3 p = in_unit_sphere();
            double len2 = p.length_squared();
            if (len2 > 1e-160) return p / std::sqrt(len2);
        }
    }

    /// Uniform point inside the unit disk in the z=0 plane.
    Vec3 in_unit_disk() {
        while (true) {
            Vec3 p(uniform(-1, 1), uniform(-1, 1), 0.0);
            if (p.length_squared() < 1.0) return p;
        }
    }

private:
    std::mt19937 engine_;
    std::uniform_real_distribution<double> uni_{0.0, 1.0};
};
