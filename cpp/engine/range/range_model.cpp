// ============================================================================
// Fragment 4.1.02 — Range Model
// File: range_model.cpp
// ============================================================================

#include "range_model.hpp"

namespace aeroforge::range {

const char* to_string(RangeClamp c) noexcept {
    switch (c) {
        case RangeClamp::None:      return "none";
        case RangeClamp::NonFinite: return "non_finite";
        case RangeClamp::Negative:  return "negative";
        case RangeClamp::Ceiling:   return "ceiling";
    }
    return "none";
}

double clamp_range_km(double raw_km, double max_range_km, RangeClamp* which) noexcept {
    const double ceiling = (max_range_km > 0.0 && max_range_km < kMaxRangeKm) ? max_range_km : kMaxRangeKm;

    RangeClamp c = RangeClamp::None;
    double r = raw_km;
    if (!is_finite(r)) {
        c = RangeClamp::NonFinite;
        r = 0.0;
    } else if (r < 0.0) {
        c = RangeClamp::Negative;
        r = 0.0;
    } else if (r > ceiling) {
        c = RangeClamp::Ceiling;
        r = ceiling;
    }
    if (which) *which = c;
    return r;
}

RangeBreakdown evaluate_breakdown(const RangeParams& p, const RangeModelConfig& cfg) noexcept {
    RangeBreakdown b;

    b.pack_energy_Wh = p.pack_energy_density * p.battery_mass;
    b.harvest_energy_Wh = p.harvest_power * units::kW_to_W * cfg.cruise_hours;
    b.eta_effective = p.eta_system * p.sic_gain;
    b.usable_energy_Wh = b.eta_effective * (b.pack_energy_Wh + b.harvest_energy_Wh);

    // Plain IEEE division: x/0 -> Inf/NaN, caught by the clamp below.
    const double denom = p.gravity * p.lift_to_drag * p.sfc_eq * p.total_mass;
    const double range_m = b.usable_energy_Wh / denom;
    b.raw_range_km = range_m / units::km_to_m;

    b.range_km = clamp_range_km(b.raw_range_km, cfg.max_range_km, &b.clamp);
    return b;
}

double range_km(const RangeParams& p, const RangeModelConfig& cfg) noexcept {
    return evaluate_breakdown(p, cfg).range_km;
}

} // namespace aeroforge::range
