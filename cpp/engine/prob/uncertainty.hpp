// ============================================================================
// Fragment 4.2.02 — Uncertainty Specs (Nominal-Relative / Absolute Normal + Clamp)
// File: uncertainty.hpp
// ============================================================================
//
// Purpose:
// - Describe how one RangeParams field varies across the ensemble.
// - Sampling rule, with Z ~ N(0,1) from the run's Rng64:
//     Relative: x = v * (1 + sigma * Z)
//     Absolute: x = v + sigma * Z
//     x = min(ceiling, max(floor, x))
//   v is the field's nominal value. Floor/ceiling act on the field value, not
//   on the noise factor, and nothing is re-normalized after clamping (the
//   realized distribution piles up at the bounds).
//
// ============================================================================

#pragma once
#include "rng.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aeroforge::prob {

enum class SpreadKind : std::uint8_t {
    Relative = 0,
    Absolute = 1
};

struct DistSpec final {
    SpreadKind kind = SpreadKind::Relative;
    double sigma = 0.1;

    // Hard clamp on the sampled value (kNoFloor / kNoCeiling => unbounded)
    double floor = kNoFloor;
    double ceiling = kNoCeiling;

    bool has_floor() const noexcept { return floor != kNoFloor; }
    bool has_ceiling() const noexcept { return ceiling != kNoCeiling; }

    // `what` names the field in error messages.
    void validate(const std::string& what) const;

    // Map one standard-normal draw to a field value.
    double apply(double nominal, double z) const noexcept;
};

// Named uncertainty on one RangeParams field. Field names are resolved by the
// MC driver; an unknown name is a configuration error there.
struct FieldUncertainty final {
    std::string field;
    DistSpec dist;
};

DistSpec relative_normal(double sigma, double floor = kNoFloor, double ceiling = kNoCeiling);
DistSpec absolute_normal(double sigma, double floor = kNoFloor, double ceiling = kNoCeiling);

// Draw n values for one field, consuming n normals from rng in order.
std::vector<double> sample_field(double nominal, const DistSpec& spec, std::size_t n, Rng64& rng);

} // namespace aeroforge::prob
