#pragma once
/*
================================================================================
Fragment 4.0.04 — Core: Units + Constants
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit unit conversions used by the range formula so the physics code
    stays readable (kW vs W, m vs km).
================================================================================
*/

namespace aeroforge::units {

// Gravity
inline constexpr double g0 = 9.80665; // m/s^2

// Power
inline constexpr double kW_to_W = 1000.0;

// Length
inline constexpr double km_to_m = 1000.0;

} // namespace aeroforge::units
