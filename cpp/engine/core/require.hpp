#pragma once
/*
===============================================================================
Fragment 4.0.02 — Hardened Math Utilities + Require Glue (C++)
File: require.hpp
===============================================================================
*/

#include "engine/core/error.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace aeroforge {

// -----------------------------
// Constants
// -----------------------------
inline constexpr double kPi = 3.141592653589793238462643383279502884;

// Sentinels for "no clamp" on distribution bounds.
inline constexpr double kNoFloor = -std::numeric_limits<double>::infinity();
inline constexpr double kNoCeiling = std::numeric_limits<double>::infinity();

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// Clamp (generic for arithmetic)
// -----------------------------
template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
    static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
    return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// -----------------------------
// Require wrappers
// Keep using AEROFORGE_REQUIRE macro for file/line context.
// -----------------------------
inline void require_finite(double x, ErrorCode code, const std::string& what) {
    AEROFORGE_REQUIRE(is_finite(x), code, what + " must be finite");
}

inline void require_positive(double x, ErrorCode code, const std::string& what) {
    AEROFORGE_REQUIRE(is_finite(x) && x > 0.0, code, what + " must be finite and > 0");
}

inline void require_nonnegative(double x, ErrorCode code, const std::string& what) {
    AEROFORGE_REQUIRE(is_finite(x) && x >= 0.0, code, what + " must be finite and >= 0");
}

} // namespace aeroforge
