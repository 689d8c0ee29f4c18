// ============================================================================
// Fragment 4.1.01 — Range Parameter Vector (Nine Physical Inputs, Named Access)
// File: range_params.hpp
// ============================================================================
//
// Purpose:
// - Fixed-shape input of the range formula.
// - Stable field ids + string keys so config files and uncertainty specs can
//   address individual fields.
// - validate() is for user-supplied input (CLI / config). The range model does
//   NOT call it; sampled vectors are pre-clamped by their distributions.
//
// ============================================================================

#pragma once
#include "engine/core/require.hpp"
#include "engine/core/units.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aeroforge::range {

enum class ParamField : std::uint8_t {
    EtaSystem = 0,
    PackEnergyDensity = 1,
    BatteryMass = 2,
    TotalMass = 3,
    Gravity = 4,
    LiftToDrag = 5,
    SfcEq = 6,
    HarvestPower = 7,
    SicGain = 8
};

inline constexpr std::size_t kParamFieldCount = 9;

inline constexpr std::array<ParamField, kParamFieldCount> kAllParamFields{
    ParamField::EtaSystem,  ParamField::PackEnergyDensity, ParamField::BatteryMass,
    ParamField::TotalMass,  ParamField::Gravity,           ParamField::LiftToDrag,
    ParamField::SfcEq,      ParamField::HarvestPower,      ParamField::SicGain};

// Stable config/CSV key for a field.
const char* field_name(ParamField f) noexcept;

// Human label with units, for plots and console output.
const char* field_label(ParamField f) noexcept;

// Reverse lookup; nullopt when the name is not a RangeParams field.
std::optional<ParamField> field_from_name(std::string_view name) noexcept;

struct RangeParams final {
    double eta_system = 0.92;             // base system efficiency, (0,1]
    double pack_energy_density = 450.0;   // Wh/kg
    double battery_mass = 25000.0;        // kg
    double total_mass = 80000.0;          // kg
    double gravity = units::g0;           // m/s^2
    double lift_to_drag = 22.0;           // -
    double sfc_eq = 0.00015;              // equivalent specific consumption
    double harvest_power = 15.0;          // kW
    double sic_gain = 1.08;               // SiC efficiency multiplier, >= 1

    double get(ParamField f) const noexcept;
    void set(ParamField f, double v) noexcept;

    // Physical plausibility for user input. Throws InvalidInput naming the field.
    void validate() const;

    static RangeParams reference() { return RangeParams{}; }
};

bool operator==(const RangeParams& a, const RangeParams& b) noexcept;
inline bool operator!=(const RangeParams& a, const RangeParams& b) noexcept { return !(a == b); }

} // namespace aeroforge::range
