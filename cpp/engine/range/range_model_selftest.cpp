/*
  Fragment 4.1.04 — Range Model Selftest

  Objective
  ---------
  Framework-free checks for the closed-form range model:
    1) Golden regression value for the reference AeroForge inputs.
    2) Output always finite and inside [0, 50000] km (zero mass, negative
       inputs, NaN inputs, huge inputs).
    3) Monotonic response per field, all others held fixed.
    4) eta_system * sic_gain > 1 is passed through, not clamped.
    5) Evaluator strategy: analytic and host callable agree.

  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "engine/range/range_evaluator.hpp"
#include "engine/range/range_model.hpp"
#include "engine/range/range_params.hpp"

namespace aeroforge::range {
namespace {

int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

bool near(double a, double b, double rel = 1e-12) {
  const double d = std::fabs(a - b);
  return d <= rel * std::max(std::fabs(a), std::fabs(b));
}

bool in_bounds(double r) { return std::isfinite(r) && r >= 0.0 && r <= 50000.0; }

void test_golden_reference() {
  const RangeParams p = RangeParams::reference();
  const double r = range_km(p);
  expect_true(near(r, 4.352111716400236), "reference inputs -> 4.352111716400236 km");

  const auto b = evaluate_breakdown(p);
  expect_true(b.pack_energy_Wh == 450.0 * 25000.0, "pack energy = density * mass");
  expect_true(b.harvest_energy_Wh == 15.0 * 1000.0 * 6.0, "harvest energy uses 6 h cruise");
  expect_true(near(b.eta_effective, 0.92 * 1.08), "eta_effective = eta_system * sic_gain");
  expect_true(b.range_km == r, "breakdown range matches range_km()");
  expect_true(b.clamp == RangeClamp::None, "reference result is not clamped");
}

void test_purity() {
  const RangeParams p = RangeParams::reference();
  const double a = range_km(p);
  bool same = true;
  for (int i = 0; i < 1000; ++i) same = same && (range_km(p) == a);
  expect_true(same, "identical inputs -> identical output");
}

void test_degenerate_inputs() {
  RangeParams p = RangeParams::reference();
  p.total_mass = 0.0;
  expect_true(range_km(p) == 0.0, "total_mass = 0 -> 0 km");
  expect_true(evaluate_breakdown(p).clamp == RangeClamp::NonFinite, "total_mass = 0 flagged non_finite");

  p = RangeParams::reference();
  p.total_mass = 0.0;
  p.pack_energy_density = 0.0;
  p.harvest_power = 0.0;
  expect_true(range_km(p) == 0.0, "0/0 -> 0 km");

  p = RangeParams::reference();
  p.lift_to_drag = -22.0;
  expect_true(range_km(p) == 0.0, "negative L/D -> 0 km");
  expect_true(evaluate_breakdown(p).clamp == RangeClamp::Negative, "negative result flagged");

  p = RangeParams::reference();
  p.eta_system = std::numeric_limits<double>::quiet_NaN();
  expect_true(range_km(p) == 0.0, "NaN input -> 0 km");

  p = RangeParams::reference();
  p.sfc_eq = 1e-12;
  expect_true(range_km(p) == 50000.0, "huge result clamps to 50000 km");
  expect_true(evaluate_breakdown(p).clamp == RangeClamp::Ceiling, "ceiling flagged");

  p = RangeParams::reference();
  p.gravity = std::numeric_limits<double>::infinity();
  expect_true(range_km(p) == 0.0, "infinite gravity -> 0 km");
}

void test_bounds_sweep() {
  bool ok = true;
  const std::vector<double> scales{0.0, 1e-9, 0.5, 1.0, 2.0, 1e6, -1.0};
  for (ParamField f : kAllParamFields) {
    for (double s : scales) {
      RangeParams p = RangeParams::reference();
      p.set(f, p.get(f) * s);
      ok = ok && in_bounds(range_km(p));
    }
  }
  expect_true(ok, "output in [0, 50000] for scaled inputs on every field");
}

// dir = +1: never decreases with the field; -1: never increases.
void check_monotone(ParamField f, int dir) {
  const RangeParams base = RangeParams::reference();
  double prev = -1.0;
  bool ok = true;
  for (int k = 1; k <= 40; ++k) {
    RangeParams p = base;
    p.set(f, base.get(f) * (0.25 * k));
    const double r = range_km(p);
    if (prev >= 0.0) {
      ok = ok && (dir > 0 ? r >= prev : r <= prev);
    }
    prev = r;
  }
  expect_true(ok, std::string("monotone response: ") + field_name(f));
}

void test_monotonicity() {
  check_monotone(ParamField::PackEnergyDensity, +1);
  check_monotone(ParamField::HarvestPower, +1);
  check_monotone(ParamField::EtaSystem, +1);
  check_monotone(ParamField::SicGain, +1);
  check_monotone(ParamField::TotalMass, -1);
  check_monotone(ParamField::SfcEq, -1);
  check_monotone(ParamField::Gravity, -1);
}

void test_efficiency_above_unity_passes_through() {
  RangeParams p = RangeParams::reference();
  p.eta_system = 0.98;
  p.sic_gain = 1.3;
  const auto b = evaluate_breakdown(p);
  expect_true(b.eta_effective > 1.0, "eta_effective may exceed 1.0");
  expect_true(b.usable_energy_Wh > b.pack_energy_Wh + b.harvest_energy_Wh,
              "usable energy may exceed stored + harvested (not clamped)");
}

void test_custom_model_config() {
  RangeModelConfig cfg;
  cfg.cruise_hours = 12.0;
  cfg.max_range_km = 1.0;
  RangeParams p = RangeParams::reference();
  const auto b = evaluate_breakdown(p, cfg);
  expect_true(b.harvest_energy_Wh == 15.0 * 1000.0 * 12.0, "cruise_hours configurable");
  expect_true(b.range_km == 1.0 && b.clamp == RangeClamp::Ceiling, "max_range_km configurable");

  bool threw = false;
  try {
    RangeModelConfig bad;
    bad.cruise_hours = 0.0;
    bad.validate();
  } catch (const AeroforgeError& e) {
    threw = (e.code() == ErrorCode::InvalidConfig);
  }
  expect_true(threw, "cruise_hours = 0 rejected");

  threw = false;
  try {
    RangeModelConfig bad;
    bad.max_range_km = 60000.0;
    bad.validate();
  } catch (const AeroforgeError& e) {
    threw = (e.code() == ErrorCode::InvalidConfig);
  }
  expect_true(threw, "max_range_km above 50000 rejected");

  // Unvalidated ceilings cannot lift results past the hard bound.
  RangeModelConfig loose;
  loose.max_range_km = 1.0e9;
  p.sfc_eq = 1.0e-12;
  expect_true(range_km(p, loose) == kMaxRangeKm, "result capped at 50000 km whatever the ceiling");
  expect_true(clamp_range_km(1.0e8, 1.0e9) == 50000.0, "clamp_range_km caps at 50000 km");
  expect_true(clamp_range_km(1.0e8, std::nan("")) == 50000.0, "NaN ceiling falls back to 50000 km");
}

void test_evaluators() {
  const AnalyticRangeEvaluator analytic;
  const FunctionRangeEvaluator external("external", [](const RangeParams& p) { return range_km(p); });
  const RangeParams p = RangeParams::reference();
  expect_true(analytic.evaluate(p) == external.evaluate(p), "analytic and callable evaluators agree");
  expect_true(analytic.name() == "analytic" && external.name() == "external", "evaluator names");
  expect_true(analytic.thread_safe() && !external.thread_safe(), "thread-safety defaults");

  bool threw = false;
  try {
    FunctionRangeEvaluator empty("x", RangeFunction{});
  } catch (const AeroforgeError& e) {
    threw = (e.code() == ErrorCode::InvalidConfig);
  }
  expect_true(threw, "empty callable rejected");
}

void test_params_api() {
  bool ok = true;
  for (ParamField f : kAllParamFields) {
    const auto back = field_from_name(field_name(f));
    ok = ok && back.has_value() && *back == f;
  }
  expect_true(ok, "field names round-trip");
  expect_true(!field_from_name("wing_span").has_value(), "unknown field name -> nullopt");

  RangeParams p = RangeParams::reference();
  p.sic_gain = 0.9;
  bool threw = false;
  try {
    p.validate();
  } catch (const AeroforgeError& e) {
    threw = (e.code() == ErrorCode::InvalidInput) && std::string(e.what()).find("sic_gain") != std::string::npos;
  }
  expect_true(threw, "validate() names the offending field");

  bool ref_ok = true;
  try {
    RangeParams::reference().validate();
  } catch (const AeroforgeError&) {
    ref_ok = false;
  }
  expect_true(ref_ok, "reference parameters validate");
}

}  // namespace
}  // namespace aeroforge::range

int main() {
  using namespace aeroforge::range;

  test_golden_reference();
  test_purity();
  test_degenerate_inputs();
  test_bounds_sweep();
  test_monotonicity();
  test_efficiency_above_unity_passes_through();
  test_custom_model_config();
  test_evaluators();
  test_params_api();

  if (g_fail_count != 0) {
    std::cerr << "\n" << g_fail_count << " selftest(s) failed.\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
