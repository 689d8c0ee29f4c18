// ============================================================================
// Fragment 4.1.02 — Range Model (Electric Breguet Range, Al-ion + SiC + Harvest)
// File: range_model.hpp
// ============================================================================
//
// Closed form:
//   E_pack    = pack_energy_density * battery_mass                [Wh]
//   E_harvest = harvest_power * 1000 * cruise_hours               [Wh]
//   eta_eff   = eta_system * sic_gain          (NOT clamped to <= 1)
//   E_usable  = eta_eff * (E_pack + E_harvest)                    [Wh]
//   R         = E_usable / (g * L/D * sfc_eq * m_total) / 1000    [km]
//
// Output policy:
// - Non-finite or negative -> 0.
// - Above max_range_km     -> max_range_km (never above kMaxRangeKm).
// - Never throws on any input (division by zero lands in the clamp).
//
// eta_eff > 1 is passed through on purpose: the reference formula permits
// usable energy above stored + harvested energy. The breakdown exposes
// eta_effective so callers can inspect it.
//
// ============================================================================

#pragma once
#include "range_params.hpp"

#include <cstdint>
#include <string>

namespace aeroforge::range {

// Hard upper bound of every RangeResult [km]. Configured ceilings may only lower it.
inline constexpr double kMaxRangeKm = 50000.0;

// max_range_km must lie in (0, kMaxRangeKm].
inline void require_range_ceiling(double max_range_km, const std::string& what) {
    require_positive(max_range_km, ErrorCode::InvalidConfig, what);
    AEROFORGE_REQUIRE(max_range_km <= kMaxRangeKm, ErrorCode::InvalidConfig,
                      what + " must be <= 50000 km (got " + std::to_string(max_range_km) + ")");
}

struct RangeModelConfig final {
    double cruise_hours = 6.0;            // harvest accumulation window
    double max_range_km = kMaxRangeKm;    // sanity ceiling

    void validate() const {
        require_positive(cruise_hours, ErrorCode::InvalidConfig, "RangeModelConfig.cruise_hours");
        require_range_ceiling(max_range_km, "RangeModelConfig.max_range_km");
    }
};

enum class RangeClamp : std::uint8_t {
    None = 0,
    NonFinite = 1,   // NaN/Inf intermediate (e.g. zero mass)
    Negative = 2,
    Ceiling = 3
};

const char* to_string(RangeClamp c) noexcept;

struct RangeBreakdown final {
    double pack_energy_Wh = 0.0;
    double harvest_energy_Wh = 0.0;
    double eta_effective = 0.0;
    double usable_energy_Wh = 0.0;
    double raw_range_km = 0.0;     // before clamping (may be NaN/Inf)
    double range_km = 0.0;         // clamped result
    RangeClamp clamp = RangeClamp::None;
};

// Clamp policy shared by all evaluators. The effective ceiling is
// min(max_range_km, kMaxRangeKm); a non-positive or NaN ceiling falls back to
// kMaxRangeKm, so the result is always in [0, kMaxRangeKm].
double clamp_range_km(double raw_km, double max_range_km, RangeClamp* which = nullptr) noexcept;

// Full intermediate terms. range_km is identical to range_km(p, cfg).
RangeBreakdown evaluate_breakdown(const RangeParams& p, const RangeModelConfig& cfg = {}) noexcept;

// Pure range evaluation [km], always finite, in [0, cfg.max_range_km].
double range_km(const RangeParams& p, const RangeModelConfig& cfg = {}) noexcept;

} // namespace aeroforge::range
