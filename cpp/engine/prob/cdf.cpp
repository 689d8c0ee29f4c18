// ============================================================================
// Fragment 4.2.03 — Empirical CDF
// File: cdf.cpp
// ============================================================================

#include "cdf.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace aeroforge::prob {

double Moments::stddev() const noexcept {
    return std::sqrt(std::max(0.0, variance));
}

double Moments::stddev_sample() const noexcept {
    return std::sqrt(std::max(0.0, variance_sample));
}

EmpiricalCdf::EmpiricalCdf(const std::vector<double>& samples) {
    reset(samples);
}

void EmpiricalCdf::reset(const std::vector<double>& samples) {
    xs_.clear();
    xs_.reserve(samples.size());
    for (double x : samples) {
        if (is_finite(x)) xs_.push_back(x);
    }
    std::sort(xs_.begin(), xs_.end());
}

double EmpiricalCdf::cdf(double x) const noexcept {
    if (xs_.empty()) return 0.0;
    if (std::isnan(x)) return 0.0;

    // upper_bound gives first element > x, so count <= x
    const auto it = std::upper_bound(xs_.begin(), xs_.end(), x);
    const double k = static_cast<double>(std::distance(xs_.begin(), it));
    const double n = static_cast<double>(xs_.size());
    return clamp(k / n, 0.0, 1.0);
}

double EmpiricalCdf::exceed(double t) const noexcept {
    if (xs_.empty()) return 0.0;
    if (std::isnan(t)) return 0.0;

    // P(X >= t) = 1 - P(X < t)
    const auto it = std::lower_bound(xs_.begin(), xs_.end(), t); // first >= t
    const double k_ge = static_cast<double>(std::distance(it, xs_.end()));
    const double n = static_cast<double>(xs_.size());
    return clamp(k_ge / n, 0.0, 1.0);
}

double EmpiricalCdf::quantile(double p) const noexcept {
    if (xs_.empty()) return 0.0;
    if (!is_finite(p)) return 0.0;

    const double pp = clamp(p, 0.0, 1.0);
    const std::size_t n = xs_.size();
    if (n == 1) return xs_[0];

    // R type=7
    const double h = 1.0 + (static_cast<double>(n) - 1.0) * pp;
    const double hf = std::floor(h);
    const std::size_t j = static_cast<std::size_t>(std::max(1.0, std::min(hf, static_cast<double>(n)))) - 1; // 0-based
    const double g = h - hf;

    if (j + 1 >= n) return xs_.back();
    const double xj = xs_[j];
    const double xk = xs_[j + 1];
    const double q = (1.0 - g) * xj + g * xk;
    return is_finite(q) ? q : 0.0;
}

Moments EmpiricalCdf::moments() const noexcept {
    Moments m;
    m.n = xs_.size();
    if (m.n == 0) return m;

    m.min = xs_.front();
    m.max = xs_.back();

    // Welford
    double mean = 0.0;
    double M2 = 0.0;
    std::size_t k = 0;
    for (double x : xs_) {
        ++k;
        const double delta = x - mean;
        mean += delta / static_cast<double>(k);
        const double delta2 = x - mean;
        M2 += delta * delta2;
    }

    m.mean = is_finite(mean) ? mean : 0.0;
    m.variance = M2 / static_cast<double>(m.n);
    m.variance_sample = (m.n > 1) ? M2 / static_cast<double>(m.n - 1) : 0.0;

    if (!is_finite(m.variance) || m.variance < 0.0) m.variance = 0.0;
    if (!is_finite(m.variance_sample) || m.variance_sample < 0.0) m.variance_sample = 0.0;

    return m;
}

} // namespace aeroforge::prob
