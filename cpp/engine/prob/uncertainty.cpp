// ============================================================================
// Fragment 4.2.02 — Uncertainty Specs
// File: uncertainty.cpp
// ============================================================================

#include "uncertainty.hpp"

#include <cmath>

namespace aeroforge::prob {

void DistSpec::validate(const std::string& what) const {
    AEROFORGE_REQUIRE(kind == SpreadKind::Relative || kind == SpreadKind::Absolute,
                      ErrorCode::InvalidConfig, what + ": unknown spread kind");
    require_positive(sigma, ErrorCode::InvalidConfig, what + ".spread");
    AEROFORGE_REQUIRE(!std::isnan(floor) && floor != kNoCeiling,
                      ErrorCode::InvalidConfig, what + ".floor invalid");
    AEROFORGE_REQUIRE(!std::isnan(ceiling) && ceiling != kNoFloor,
                      ErrorCode::InvalidConfig, what + ".ceiling invalid");
    AEROFORGE_REQUIRE(floor <= ceiling, ErrorCode::InvalidConfig, what + ": floor > ceiling");
}

double DistSpec::apply(double nominal, double z) const noexcept {
    double x = (kind == SpreadKind::Relative) ? nominal * (1.0 + sigma * z)
                                              : nominal + sigma * z;
    if (x < floor) x = floor;
    if (x > ceiling) x = ceiling;
    return x;
}

DistSpec relative_normal(double sigma, double floor, double ceiling) {
    DistSpec s;
    s.kind = SpreadKind::Relative;
    s.sigma = sigma;
    s.floor = floor;
    s.ceiling = ceiling;
    return s;
}

DistSpec absolute_normal(double sigma, double floor, double ceiling) {
    DistSpec s;
    s.kind = SpreadKind::Absolute;
    s.sigma = sigma;
    s.floor = floor;
    s.ceiling = ceiling;
    return s;
}

std::vector<double> sample_field(double nominal, const DistSpec& spec, std::size_t n, Rng64& rng) {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = spec.apply(nominal, rng.std_normal());
    }
    return out;
}

} // namespace aeroforge::prob
