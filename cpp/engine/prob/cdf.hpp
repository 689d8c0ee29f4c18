// ============================================================================
// Fragment 4.2.03 — Empirical CDF (Moments, Quantiles, Threshold Exceedance)
// File: cdf.hpp
// ============================================================================
//
// Purpose:
// - Summary statistics for the range ensemble.
// - Empirical CDF from samples (non-finite values filtered out).
//
// Quantile definition (type=7, linear interpolation between order stats;
// same as numpy.percentile default):
//   q(p) = (1-g)*x[j] + g*x[j+1]
//   where h = 1 + (n-1)*p, j = floor(h), g = h-j
//
// ============================================================================

#pragma once
#include "engine/core/require.hpp"

#include <cstddef>
#include <vector>

namespace aeroforge::prob {

struct Moments final {
    std::size_t n = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double variance = 0.0;         // population (divide by n)
    double variance_sample = 0.0;  // divide by n-1; 0 when n < 2

    double stddev() const noexcept;
    double stddev_sample() const noexcept;
};

class EmpiricalCdf final {
public:
    EmpiricalCdf() = default;

    // Construct from raw samples (filters non-finite).
    explicit EmpiricalCdf(const std::vector<double>& samples);

    void reset(const std::vector<double>& samples);

    std::size_t size() const noexcept { return xs_.size(); }
    bool empty() const noexcept { return xs_.empty(); }
    const std::vector<double>& sorted() const noexcept { return xs_; }

    // F(x) = P(X <= x). 0 if empty.
    double cdf(double x) const noexcept;

    // P(X >= t), inclusive threshold. 0 if empty.
    double exceed(double t) const noexcept;

    // Same as exceed(t) expressed in percent [0,100].
    double exceed_pct(double t) const noexcept { return 100.0 * exceed(t); }

    // q(p), p in [0,1]. 0 if empty.
    double quantile(double p) const noexcept;

    double median() const noexcept { return quantile(0.5); }

    Moments moments() const noexcept;

private:
    std::vector<double> xs_;
};

} // namespace aeroforge::prob
