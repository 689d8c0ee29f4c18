/*
  Fragment 4.3.03 — Range Monte Carlo Selftest

  Objective
  ---------
  Framework-free checks for the MC driver:
    1) Ensemble size == n_runs; run indices 1..N.
    2) Same config + seed -> bit-identical ensemble (serial and parallel).
    3) Fixed fields stay nominal; floors/ceilings hold on sampled fields.
    4) Threshold percentages bounded and ordered.
    5) Configuration errors (N <= 0, unknown/duplicate field) abort before
       any evaluation and produce no result.
    6) Injected evaluator outputs are clamped; evaluator failure aborts.

  Non-zero return code indicates failure.
*/

#include <atomic>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "engine/core/logging.hpp"
#include "engine/mc/range_mc.hpp"

namespace aeroforge::mc {
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

bool same_ensemble(const RangeMcResult& a, const RangeMcResult& b) {
  if (a.ensemble.size() != b.ensemble.size()) return false;
  for (std::size_t i = 0; i < a.ensemble.size(); ++i) {
    const auto& x = a.ensemble[i];
    const auto& y = b.ensemble[i];
    if (x.run != y.run || x.params != y.params || x.range_km != y.range_km) return false;
  }
  return true;
}

// Long-range variant so the 5000/10000 km thresholds are actually crossed.
RangeMcConfig long_range_config(std::int64_t n) {
  RangeMcConfig cfg = RangeMcConfig::reference();
  cfg.nominal.sfc_eq = 1.0e-7;
  cfg.n_runs = n;
  return cfg;
}

void test_reference_run() {
  const RangeMcConfig cfg = RangeMcConfig::reference();
  const range::AnalyticRangeEvaluator ev;
  const auto res = run_range_monte_carlo(cfg, ev);

  expect_true(res.ensemble.size() == 2000, "reference ensemble has 2000 runs");
  expect_true(res.summary.n == 2000, "summary n == N");
  expect_true(res.ensemble.front().run == 1 && res.ensemble.back().run == 2000, "runs numbered 1..N");
  expect_true(res.seed == 42 && res.evaluator == "analytic", "seed and evaluator recorded");
  expect_true(res.uncertain_fields.size() == 5 && res.correlations.size() == 5, "five uncertain fields");

  bool bounds = true;
  bool fixed = true;
  for (const auto& s : res.ensemble) {
    bounds = bounds && std::isfinite(s.range_km) && s.range_km >= 0.0 && s.range_km <= 50000.0;
    bounds = bounds && s.params.pack_energy_density >= 200.0 && s.params.lift_to_drag >= 15.0;
    bounds = bounds && s.params.harvest_power >= 0.0 && s.params.sic_gain >= 1.0;
    bounds = bounds && s.params.eta_system >= 0.7 && s.params.eta_system <= 0.98;
    fixed = fixed && s.params.battery_mass == cfg.nominal.battery_mass &&
            s.params.total_mass == cfg.nominal.total_mass &&
            s.params.gravity == cfg.nominal.gravity && s.params.sfc_eq == cfg.nominal.sfc_eq;
  }
  expect_true(bounds, "samples respect floors/ceilings; ranges in [0, 50000]");
  expect_true(fixed, "fields without uncertainty stay nominal");

  const auto& s = res.summary;
  expect_true(s.p5 <= s.median && s.median <= s.p95, "p5 <= median <= p95");
  expect_true(s.min <= s.mean && s.mean <= s.max, "min <= mean <= max");
  expect_true(s.stddev > 0.0, "non-degenerate spread");
  // The reference formula lands near 4 km; the targets are not reached.
  expect_true(s.pct_ge_threshold_1 == 0.0 && s.pct_ge_threshold_2 == 0.0, "reference case: 0% reach 5000 km");
  expect_true(res.correlations.front().name == "pack_energy_density", "energy density dominates correlation");
}

void test_reproducibility() {
  const range::AnalyticRangeEvaluator ev;
  RangeMcConfig cfg = long_range_config(777);
  cfg.reseed(2024);

  const auto a = run_range_monte_carlo(cfg, ev);
  const auto b = run_range_monte_carlo(cfg, ev);
  expect_true(same_ensemble(a, b), "same seed -> bit-identical ensemble");

  RangeMcConfig par = cfg;
  par.parallel = true;
  const auto c = run_range_monte_carlo(par, ev);
  expect_true(same_ensemble(a, c), "parallel evaluation matches serial bit-for-bit");

  RangeMcConfig other = cfg;
  other.reseed(2025);
  const auto d = run_range_monte_carlo(other, ev);
  expect_true(!same_ensemble(a, d), "different seed -> different ensemble");

  const auto inputs = draw_parameter_vectors(cfg);
  bool match = inputs.size() == a.ensemble.size();
  for (std::size_t i = 0; match && i < inputs.size(); ++i) match = (inputs[i] == a.ensemble[i].params);
  expect_true(match, "draw phase alone reproduces the ensemble inputs");
}

void test_ensemble_sizes() {
  const range::AnalyticRangeEvaluator ev;
  bool ok = true;
  for (std::int64_t n : {1, 2, 17, 1000}) {
    RangeMcConfig cfg = RangeMcConfig::reference();
    cfg.n_runs = n;
    const auto r = run_range_monte_carlo(cfg, ev);
    ok = ok && r.ensemble.size() == static_cast<std::size_t>(n) && r.summary.n == static_cast<std::size_t>(n);
  }
  expect_true(ok, "ensemble size == N for N in {1,2,17,1000}");
}

void test_threshold_rates() {
  const range::AnalyticRangeEvaluator ev;
  const auto res = run_range_monte_carlo(long_range_config(3000), ev);
  const auto& s = res.summary;
  expect_true(s.pct_ge_threshold_1 >= 0.0 && s.pct_ge_threshold_1 <= 100.0, "pct >= 5000 in [0,100]");
  expect_true(s.pct_ge_threshold_2 >= 0.0 && s.pct_ge_threshold_2 <= 100.0, "pct >= 10000 in [0,100]");
  expect_true(s.pct_ge_threshold_1 >= s.pct_ge_threshold_2, "pct >= 5000 not below pct >= 10000");
  expect_true(s.pct_ge_threshold_1 > 0.0 && s.pct_ge_threshold_1 < 100.0, "long-range case straddles 5000 km");

  std::size_t count = 0;
  for (const auto& x : res.ensemble) count += (x.range_km >= 5000.0) ? 1 : 0;
  expect_true(std::fabs(s.pct_ge_threshold_1 - 100.0 * static_cast<double>(count) / 3000.0) < 1e-9,
              "pct counts ranges >= 5000 inclusive");
}

void test_config_errors() {
  std::atomic<int> calls{0};
  const range::FunctionRangeEvaluator counting("counting", [&calls](const range::RangeParams& p) {
    ++calls;
    return range::range_km(p);
  });

  auto expect_config_error = [&](RangeMcConfig cfg, ErrorCode code, std::string_view needle, std::string_view msg) {
    bool produced = false;
    bool ok = false;
    try {
      const auto r = run_range_monte_carlo(cfg, counting);
      produced = !r.ensemble.empty();
    } catch (const AeroforgeError& e) {
      ok = e.code() == code && std::string(e.what()).find(needle) != std::string::npos;
    }
    expect_true(ok && !produced && calls.load() == 0, msg);
  };

  RangeMcConfig zero = RangeMcConfig::reference();
  zero.n_runs = 0;
  expect_config_error(zero, ErrorCode::InvalidConfig, "runs", "N = 0 -> configuration error, no ensemble");

  RangeMcConfig neg = RangeMcConfig::reference();
  neg.n_runs = -5;
  expect_config_error(neg, ErrorCode::InvalidConfig, "runs", "N < 0 -> configuration error");

  RangeMcConfig unknown = RangeMcConfig::reference();
  unknown.uncertain.push_back(prob::FieldUncertainty{"wing_span", prob::relative_normal(0.1)});
  expect_config_error(unknown, ErrorCode::UnknownField, "wing_span", "unknown field named in error");

  RangeMcConfig dup = RangeMcConfig::reference();
  dup.uncertain.push_back(prob::FieldUncertainty{"sic_gain", prob::relative_normal(0.1)});
  expect_config_error(dup, ErrorCode::InvalidConfig, "sic_gain", "duplicate field rejected");

  RangeMcConfig bad_sigma = RangeMcConfig::reference();
  bad_sigma.uncertain[0].dist.sigma = 0.0;
  expect_config_error(bad_sigma, ErrorCode::InvalidConfig, "pack_energy_density", "zero spread rejected");

  RangeMcConfig bad_thr = RangeMcConfig::reference();
  bad_thr.threshold_1_km = 20000.0;
  expect_config_error(bad_thr, ErrorCode::InvalidConfig, "threshold", "inverted thresholds rejected");

  RangeMcConfig high_cap = RangeMcConfig::reference();
  high_cap.max_range_km = 1.0e9;
  expect_config_error(high_cap, ErrorCode::InvalidConfig, "max_range_km", "ceiling above 50000 km rejected");
}

void test_injected_evaluator() {
  RangeMcConfig cfg = RangeMcConfig::reference();
  cfg.n_runs = 50;

  const range::FunctionRangeEvaluator huge("huge", [](const range::RangeParams&) { return 1.0e12; });
  const auto r1 = run_range_monte_carlo(cfg, huge);
  bool capped = true;
  for (const auto& s : r1.ensemble) capped = capped && s.range_km == 50000.0;
  expect_true(capped, "external outputs clamped to 50000 km");
  expect_true(r1.summary.pct_ge_threshold_2 == 100.0, "all clamped runs meet 10000 km");

  const range::FunctionRangeEvaluator nan_ev("nan", [](const range::RangeParams&) { return std::nan(""); });
  const auto r2 = run_range_monte_carlo(cfg, nan_ev);
  bool zeroed = true;
  for (const auto& s : r2.ensemble) zeroed = zeroed && s.range_km == 0.0;
  expect_true(zeroed, "non-finite external outputs degrade to 0");

  const range::FunctionRangeEvaluator throwing("throwing", [](const range::RangeParams&) -> double {
    throw std::runtime_error("backend unavailable");
  });
  bool aborted = false;
  try {
    (void)run_range_monte_carlo(cfg, throwing);
  } catch (const std::runtime_error& e) {
    aborted = std::string(e.what()) == "backend unavailable";
  }
  expect_true(aborted, "evaluator failure aborts the batch");

  // Not thread-safe => serial even when parallel is requested.
  std::atomic<int> calls{0};
  const range::FunctionRangeEvaluator serial_only("serial_only", [&calls](const range::RangeParams& p) {
    ++calls;
    return range::range_km(p);
  });
  RangeMcConfig par = cfg;
  par.parallel = true;
  const auto r3 = run_range_monte_carlo(par, serial_only);
  expect_true(calls.load() == 50 && r3.ensemble.size() == 50, "one evaluation per sample");
}

void test_summarize_ranges() {
  const auto s = summarize_ranges({0.0, 5000.0, 9999.0, 10000.0, 20000.0});
  expect_true(s.n == 5, "summary n");
  expect_true(s.pct_ge_threshold_1 == 80.0, "4 of 5 >= 5000");
  expect_true(s.pct_ge_threshold_2 == 40.0, "2 of 5 >= 10000");
  expect_true(s.median == 9999.0, "median");
  expect_true(std::fabs(s.mean - 8999.8) < 1e-9, "mean");
}

}  // namespace
}  // namespace aeroforge::mc

int main() {
  using namespace aeroforge::mc;

  aeroforge::set_log_level(aeroforge::LogLevel::WARN);

  test_reference_run();
  test_reproducibility();
  test_ensemble_sizes();
  test_threshold_rates();
  test_config_errors();
  test_injected_evaluator();
  test_summarize_ranges();

  if (g_fail_count != 0) {
    std::cerr << "\n" << g_fail_count << " selftest(s) failed.\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
