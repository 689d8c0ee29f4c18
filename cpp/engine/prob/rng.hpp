// ============================================================================
// Fragment 4.2.01 — Deterministic Random Stream (xorshift64* + Box-Muller)
// File: rng.hpp
// ============================================================================
//
// - Explicit object, no process-wide seed. Copying a stream forks an identical
//   sequence, which is how the MC driver keeps its config reusable.
// - Same seed -> same sequence on every platform (integer core, IEEE doubles).
//
// ============================================================================

#pragma once
#include "engine/core/require.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace aeroforge::prob {

class Rng64 final {
public:
    explicit Rng64(std::uint64_t seed = 42) : seed_(seed), s_(seed ? seed : 0x9e3779b97f4a7c15ull) {}

    std::uint64_t seed() const noexcept { return seed_; }

    std::uint64_t next_u64() noexcept {
        std::uint64_t x = s_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s_ = x;
        return x * 2685821657736338717ull;
    }

    // Uniform in (0,1)
    double next_u01() noexcept {
        // Top 53 bits -> double mantissa
        const std::uint64_t u = next_u64();
        const std::uint64_t m = (u >> 11) | 1ull; // ensure nonzero
        return static_cast<double>(m) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Standard normal N(0,1), Box-Muller (cosine branch only, two uniforms per draw).
    double std_normal() noexcept {
        const double u1 = std::max(1e-12, next_u01());
        const double u2 = next_u01();
        const double r = std::sqrt(-2.0 * std::log(u1));
        const double theta = 2.0 * kPi * u2;
        return r * std::cos(theta);
    }

private:
    std::uint64_t seed_;
    std::uint64_t s_;
};

} // namespace aeroforge::prob
