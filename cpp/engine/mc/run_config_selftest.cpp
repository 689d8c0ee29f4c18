/*
  Fragment 4.3.04 — Run Configuration Selftest

  Parses key = value texts and checks:
    - empty text reproduces the reference case (seed 42, 2000 runs),
    - scalar keys, outputs and log level land where expected,
    - field overrides, new uncertain fields (appended), fixed fields,
    - unknown keys/fields and malformed values fail with line + key.

  Non-zero return code indicates failure.
*/

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/mc/run_config.hpp"

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

const prob::FieldUncertainty* find_uncertain(const RangeMcConfig& cfg, std::string_view name) {
  for (const auto& u : cfg.uncertain) {
    if (u.field == name) return &u;
  }
  return nullptr;
}

void expect_error(std::string_view text, ErrorCode code, std::string_view needle, std::string_view msg) {
  bool ok = false;
  try {
    (void)parse_run_config(text);
  } catch (const AeroforgeError& e) {
    ok = e.code() == code && std::string(e.what()).find(needle) != std::string::npos;
    if (!ok) std::cerr << "       got: " << to_string(e.code()) << " " << e.what() << "\n";
  }
  expect_true(ok, msg);
}

void test_defaults() {
  const RunConfig rc = parse_run_config("");
  expect_true(rc.mc.n_runs == 2000 && rc.mc.rng.seed() == 42, "empty text -> 2000 runs, seed 42");
  expect_true(rc.mc.nominal == range::RangeParams::reference(), "empty text -> reference nominal");
  expect_true(rc.mc.uncertain.size() == 5 && rc.mc.uncertain.front().field == "pack_energy_density",
              "empty text -> reference uncertainty order");
  expect_true(rc.csv_path.empty() && rc.figure_path.empty() && !rc.log_level, "no outputs by default");

  const RunConfig comments = parse_run_config("# only a comment\n\n   \n# another\n");
  expect_true(comments.mc.n_runs == 2000, "comments and blank lines ignored");
}

void test_scalars() {
  const RunConfig rc = parse_run_config(
      "seed = 7\n"
      "runs = 500   # trailing comment\n"
      "parallel = 1\r\n"
      "threshold_1_km = 4000\n"
      "threshold_2_km = 8000.5\n"
      "log_level = debug\n"
      "output.csv = out/results.csv\n"
      "output.summary_csv = out/summary.csv\n"
      "output.figure = out/analysis.svg");
  expect_true(rc.mc.rng.seed() == 7 && rc.mc.n_runs == 500, "seed/runs");
  expect_true(rc.mc.parallel, "parallel = 1");
  expect_true(rc.mc.threshold_1_km == 4000.0 && rc.mc.threshold_2_km == 8000.5, "thresholds");
  expect_true(rc.log_level && *rc.log_level == LogLevel::DEBUG, "log level");
  expect_true(rc.csv_path == "out/results.csv" && rc.summary_csv_path == "out/summary.csv" &&
                  rc.figure_path == "out/analysis.svg",
              "output paths (last line without newline)");
}

void test_fields() {
  const RunConfig rc = parse_run_config(
      "sfc_eq.nominal = 1e-7\n"
      "lift_to_drag.spread = 0.05\n"
      "harvest_power.uncertain = 0\n"
      "eta_system.ceiling = none\n"
      "battery_mass.spread_kind = absolute\n"
      "battery_mass.spread = 500\n"
      "battery_mass.floor = 20000\n");

  expect_true(rc.mc.nominal.sfc_eq == 1e-7, "nominal override");

  const auto* ld = find_uncertain(rc.mc, "lift_to_drag");
  expect_true(ld && ld->dist.sigma == 0.05 && ld->dist.floor == 15.0, "spread override keeps floor");

  expect_true(find_uncertain(rc.mc, "harvest_power") == nullptr, "uncertain = 0 holds field fixed");

  const auto* eta = find_uncertain(rc.mc, "eta_system");
  expect_true(eta && !eta->dist.has_ceiling() && eta->dist.floor == 0.7, "ceiling = none clears ceiling");

  const auto* bm = find_uncertain(rc.mc, "battery_mass");
  expect_true(bm && bm->dist.kind == prob::SpreadKind::Absolute && bm->dist.sigma == 500.0 &&
                  bm->dist.floor == 20000.0,
              "new uncertain field (keys in any order)");
  expect_true(rc.mc.uncertain.back().field == "battery_mass", "new field appended to draw order");
  expect_true(rc.mc.uncertain.size() == 5, "4 reference fields + 1 new");

  bool valid = false;
  try {
    rc.mc.validate();
    valid = true;
  } catch (const AeroforgeError& e) {
    std::cerr << "       got: " << to_string(e.code()) << " " << e.what() << "\n";
  }
  expect_true(valid, "parsed config validates");

  const RunConfig again = parse_run_config("sic_gain.uncertain = 1\n");
  const auto* sic = find_uncertain(again.mc, "sic_gain");
  expect_true(sic && sic->dist.sigma == 0.20 && again.mc.uncertain.size() == 5,
              "uncertain = 1 on an uncertain field keeps its spread");
}

void test_errors() {
  expect_error("runs = 10\nbogus = 1\n", ErrorCode::ParseError, "line 2 (bogus)", "unknown key names line + key");
  expect_error("wing_span.spread = 0.1\n", ErrorCode::UnknownField, "wing_span", "unknown field");
  expect_error("eta_system.colour = red\n", ErrorCode::ParseError, "colour", "unknown attribute");
  expect_error("runs = many\n", ErrorCode::ParseError, "line 1 (runs)", "malformed integer");
  expect_error("runs = 10.5\n", ErrorCode::ParseError, "runs", "fractional run count");
  expect_error("threshold_1_km = 5e400\n", ErrorCode::ParseError, "threshold_1_km", "overflowing number");
  expect_error("parallel = yes\n", ErrorCode::ParseError, "parallel", "bad boolean");
  expect_error("seed = -1\n", ErrorCode::ParseError, "seed", "negative seed");
  expect_error("log_level = loud\n", ErrorCode::ParseError, "log_level", "bad log level");
  expect_error("just some words\n", ErrorCode::ParseError, "line 1", "missing '='");
  expect_error("runs =\n", ErrorCode::ParseError, "empty value", "empty value");
  expect_error("gravity.floor = 9\n", ErrorCode::InvalidConfig, "gravity.spread", "floor on fixed field");
  expect_error("total_mass.uncertain = 1\n", ErrorCode::InvalidConfig, "total_mass.spread",
               "uncertain = 1 without spread on fixed field");
  expect_error("sic_gain.spread_kind = gaussian\n", ErrorCode::ParseError, "sic_gain.spread_kind", "bad spread kind");

  // Parses fine; the driver rejects it before sampling.
  const RunConfig zero = parse_run_config("runs = 0\n");
  bool rejected = false;
  try {
    zero.mc.validate();
  } catch (const AeroforgeError& e) {
    rejected = e.code() == ErrorCode::InvalidConfig;
  }
  expect_true(rejected, "runs = 0 rejected by validate()");
}

void test_load_file() {
  const std::string path = "aeroforge_run_config_selftest.cfg";
  {
    std::ofstream ofs(path);
    ofs << "runs = 123\nseed = 9\n";
  }
  const RunConfig rc = load_run_config(path);
  expect_true(rc.mc.n_runs == 123 && rc.mc.rng.seed() == 9, "load_run_config reads file");
  std::remove(path.c_str());

  bool io = false;
  try {
    (void)load_run_config("does/not/exist.cfg");
  } catch (const AeroforgeError& e) {
    io = e.code() == ErrorCode::IOError;
  }
  expect_true(io, "missing file -> IOError");
}

}  // namespace
}  // namespace aeroforge::mc

int main() {
  using namespace aeroforge::mc;

  aeroforge::set_log_level(aeroforge::LogLevel::WARN);

  try {
    test_defaults();
    test_scalars();
    test_fields();
    test_errors();
    test_load_file();
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] unexpected exception: " << e.what() << "\n";
    return 1;
  }

  if (g_fail_count != 0) {
    std::cerr << "\n" << g_fail_count << " selftest(s) failed.\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
