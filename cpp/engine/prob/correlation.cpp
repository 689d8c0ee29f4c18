// ============================================================================
// Fragment 4.2.04 — Pearson Correlation
// File: correlation.cpp
// ============================================================================

#include "correlation.hpp"

#include <algorithm>
#include <cmath>

namespace aeroforge::prob {

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    AEROFORGE_REQUIRE(x.size() == y.size(), ErrorCode::InvalidInput, "pearson: length mismatch");

    // Two-pass (means first) for stability on large-magnitude inputs.
    std::size_t n = 0;
    double sx = 0.0;
    double sy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!is_finite(x[i]) || !is_finite(y[i])) continue;
        sx += x[i];
        sy += y[i];
        ++n;
    }
    if (n < 2) return 0.0;

    const double mx = sx / static_cast<double>(n);
    const double my = sy / static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!is_finite(x[i]) || !is_finite(y[i])) continue;
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx <= 0.0 || syy <= 0.0) return 0.0;
    const double r = sxy / std::sqrt(sxx * syy);
    return is_finite(r) ? clamp(r, -1.0, 1.0) : 0.0;
}

void rank_by_magnitude(std::vector<Correlation>& cs) {
    std::stable_sort(cs.begin(), cs.end(), [](const Correlation& a, const Correlation& b) {
        return std::fabs(a.r) > std::fabs(b.r);
    });
}

} // namespace aeroforge::prob
