// ============================================================================
// Fragment 4.1.01 — Range Parameter Vector
// File: range_params.cpp
// ============================================================================

#include "range_params.hpp"

namespace aeroforge::range {

namespace {

struct FieldInfo final {
    ParamField field;
    const char* name;
    const char* label;
};

constexpr std::array<FieldInfo, kParamFieldCount> kFieldTable{{
    {ParamField::EtaSystem,         "eta_system",          "System Efficiency"},
    {ParamField::PackEnergyDensity, "pack_energy_density", "Battery Energy Density (Wh/kg)"},
    {ParamField::BatteryMass,       "battery_mass",        "Battery Mass (kg)"},
    {ParamField::TotalMass,         "total_mass",          "Total Mass (kg)"},
    {ParamField::Gravity,           "gravity",             "Gravity (m/s^2)"},
    {ParamField::LiftToDrag,        "lift_to_drag",        "Lift-to-Drag Ratio"},
    {ParamField::SfcEq,             "sfc_eq",              "Equivalent SFC"},
    {ParamField::HarvestPower,      "harvest_power",       "Harvesting Power (kW)"},
    {ParamField::SicGain,           "sic_gain",            "SiC Efficiency Gain"},
}};

const FieldInfo& info(ParamField f) noexcept {
    return kFieldTable[static_cast<std::size_t>(f)];
}

} // namespace

const char* field_name(ParamField f) noexcept { return info(f).name; }
const char* field_label(ParamField f) noexcept { return info(f).label; }

std::optional<ParamField> field_from_name(std::string_view name) noexcept {
    for (const auto& fi : kFieldTable) {
        if (name == fi.name) return fi.field;
    }
    return std::nullopt;
}

double RangeParams::get(ParamField f) const noexcept {
    switch (f) {
        case ParamField::EtaSystem:         return eta_system;
        case ParamField::PackEnergyDensity: return pack_energy_density;
        case ParamField::BatteryMass:       return battery_mass;
        case ParamField::TotalMass:         return total_mass;
        case ParamField::Gravity:           return gravity;
        case ParamField::LiftToDrag:        return lift_to_drag;
        case ParamField::SfcEq:             return sfc_eq;
        case ParamField::HarvestPower:      return harvest_power;
        case ParamField::SicGain:           return sic_gain;
    }
    return 0.0;
}

void RangeParams::set(ParamField f, double v) noexcept {
    switch (f) {
        case ParamField::EtaSystem:         eta_system = v; break;
        case ParamField::PackEnergyDensity: pack_energy_density = v; break;
        case ParamField::BatteryMass:       battery_mass = v; break;
        case ParamField::TotalMass:         total_mass = v; break;
        case ParamField::Gravity:           gravity = v; break;
        case ParamField::LiftToDrag:        lift_to_drag = v; break;
        case ParamField::SfcEq:             sfc_eq = v; break;
        case ParamField::HarvestPower:      harvest_power = v; break;
        case ParamField::SicGain:           sic_gain = v; break;
    }
}

void RangeParams::validate() const {
    AEROFORGE_REQUIRE(is_finite(eta_system) && eta_system > 0.0 && eta_system <= 1.0,
                      ErrorCode::InvalidInput, "eta_system must be in (0,1]");
    require_positive(pack_energy_density, ErrorCode::InvalidInput, "pack_energy_density");
    require_positive(battery_mass, ErrorCode::InvalidInput, "battery_mass");
    require_positive(total_mass, ErrorCode::InvalidInput, "total_mass");
    require_positive(gravity, ErrorCode::InvalidInput, "gravity");
    require_positive(lift_to_drag, ErrorCode::InvalidInput, "lift_to_drag");
    require_positive(sfc_eq, ErrorCode::InvalidInput, "sfc_eq");
    require_nonnegative(harvest_power, ErrorCode::InvalidInput, "harvest_power");
    AEROFORGE_REQUIRE(is_finite(sic_gain) && sic_gain >= 1.0,
                      ErrorCode::InvalidInput, "sic_gain must be finite and >= 1.0");
}

bool operator==(const RangeParams& a, const RangeParams& b) noexcept {
    for (ParamField f : kAllParamFields) {
        if (a.get(f) != b.get(f)) return false;
    }
    return true;
}

} // namespace aeroforge::range
