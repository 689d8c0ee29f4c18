/*
================================================================================
Fragment 4.5.01 — CLI: Main Entry Point (aeroforge)
FILE: cpp/cli/main.cpp

Usage:
  aeroforge [command] [options]

Commands:
  range        - Evaluate the range formula once and print the energy breakdown
  montecarlo   - Run the Monte-Carlo range analysis
  help         - Show help message

Exit codes are stable for CI integration (see print_help()).
================================================================================
*/

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/exports/range_figure_svg.hpp"
#include "engine/exports/range_report_csv.hpp"
#include "engine/mc/range_mc.hpp"
#include "engine/mc/run_config.hpp"
#include "engine/range/range_evaluator.hpp"
#include "engine/range/range_model.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace aeroforge;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
aeroforge - Electric aircraft range under parameter uncertainty

Usage:
  aeroforge [command] [options]

Commands:
  range         Evaluate the range formula once
  montecarlo    Run the Monte-Carlo range analysis
  help          Show this help message

range options:
  --<field> <value>      Override a nominal input. Fields:
                         eta_system pack_energy_density battery_mass total_mass
                         gravity lift_to_drag sfc_eq harvest_power sic_gain

montecarlo options:
  --config <path>        key = value run configuration
  --runs <N>             Number of Monte-Carlo runs (default 2000)
  --seed <S>             Random seed (default 42)
  --parallel 0|1         Evaluate samples with OpenMP (default 0)
  --csv <path>           Per-run table (Run,Efficiency,...,Range_km)
  --summary-csv <path>   Summary statistics table
  --figure <path>        2x2 SVG figure
  --log-level <level>    debug|info|warn|error

Examples:
  aeroforge range --sic_gain 1.2
  aeroforge montecarlo --runs 5000 --seed 7 --csv runs.csv --figure analysis.svg

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation / configuration failed
  3 - Computation failed
  4 - I/O error
)";
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int64(const char* s, long long* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) return false;
  *out = v;
  return true;
}

bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

int report_error(const AeroforgeError& e) {
  std::cerr << "AEROFORGE ERROR code=" << to_string(e.code())
            << " msg=" << e.what()
            << " at " << e.where().file << ":" << e.where().line
            << " (" << e.where().func << ")\n";
  if (e.code() == ErrorCode::IOError) return IO_ERROR;
  if (e.is_config_error() || e.code() == ErrorCode::InvalidInput) return VALIDATION_FAILED;
  return COMPUTATION_FAILED;
}

int cmd_range(int argc, char** argv) {
  range::RangeParams p = range::RangeParams::reference();

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    if (std::strncmp(k, "--", 2) != 0) {
      std::cerr << "Unknown argument: " << k << "\n";
      return INVALID_ARGS;
    }
    const auto f = range::field_from_name(k + 2);
    if (!f) {
      std::cerr << "Unknown field: " << (k + 2) << "\n";
      return INVALID_ARGS;
    }
    const char* v = nullptr;
    double d = 0.0;
    if (!get_next(i, argc, argv, &v) || !parse_double(v, &d)) {
      std::cerr << k << " requires a finite number\n";
      return INVALID_ARGS;
    }
    p.set(*f, d);
  }

  try {
    p.validate();
  } catch (const AeroforgeError& e) {
    return report_error(e);
  }

  const auto b = range::evaluate_breakdown(p);

  std::cout << "=== AeroForge Range Calculation ===\n";
  for (range::ParamField f : range::kAllParamFields) {
    std::cout << "  " << std::left << std::setw(22) << range::field_name(f) << p.get(f) << "\n";
  }
  std::cout << std::right << std::setprecision(10)
            << "\nEnergy breakdown:\n"
            << "  Pack energy:          " << b.pack_energy_Wh << " Wh\n"
            << "  Harvest energy:       " << b.harvest_energy_Wh << " Wh\n"
            << "  Effective efficiency: " << b.eta_effective << "\n"
            << "  Usable energy:        " << b.usable_energy_Wh << " Wh\n"
            << "\nRange: " << b.range_km << " km (clamp: " << range::to_string(b.clamp) << ")\n";

  if (b.eta_effective > 1.0) {
    log_warn("effective efficiency exceeds 1.0; usable energy exceeds stored + harvested energy");
  }
  return SUCCESS;
}

struct McArgs {
  std::string config_path;
  std::optional<long long> runs;
  std::optional<long long> seed;
  std::optional<bool> parallel;
  std::optional<std::string> csv_path;
  std::optional<std::string> summary_csv_path;
  std::optional<std::string> figure_path;
  std::optional<LogLevel> log_level;
};

bool parse_mc_args(int argc, char** argv, McArgs* a, std::string* err) {
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }

    if (std::strcmp(k, "--config") == 0) {
      a->config_path = v;
    } else if (std::strcmp(k, "--runs") == 0) {
      long long n = 0;
      if (!parse_int64(v, &n)) { *err = "--runs must be an integer"; return false; }
      a->runs = n;
    } else if (std::strcmp(k, "--seed") == 0) {
      long long s = 0;
      if (!parse_int64(v, &s) || s < 0) { *err = "--seed must be a non-negative integer"; return false; }
      a->seed = s;
    } else if (std::strcmp(k, "--parallel") == 0) {
      bool b = false;
      if (!parse_bool01(v, &b)) { *err = "--parallel must be 0 or 1"; return false; }
      a->parallel = b;
    } else if (std::strcmp(k, "--csv") == 0) {
      a->csv_path = v;
    } else if (std::strcmp(k, "--summary-csv") == 0) {
      a->summary_csv_path = v;
    } else if (std::strcmp(k, "--figure") == 0) {
      a->figure_path = v;
    } else if (std::strcmp(k, "--log-level") == 0) {
      a->log_level = parse_log_level(v);
      if (!a->log_level) { *err = "--log-level must be debug|info|warn|error"; return false; }
    } else {
      *err = std::string("Unknown argument: ") + k;
      return false;
    }
  }
  return true;
}

int cmd_montecarlo(int argc, char** argv) {
  McArgs a;
  std::string err;
  if (!parse_mc_args(argc, argv, &a, &err)) {
    std::cerr << err << "\n";
    return INVALID_ARGS;
  }
  if (a.log_level) set_log_level(*a.log_level);

  try {
    mc::RunConfig rc = a.config_path.empty() ? mc::RunConfig{} : mc::load_run_config(a.config_path);

    // Command line wins over the config file.
    if (rc.log_level && !a.log_level) set_log_level(*rc.log_level);
    if (a.runs) rc.mc.n_runs = *a.runs;
    if (a.seed) rc.mc.reseed(static_cast<std::uint64_t>(*a.seed));
    if (a.parallel) rc.mc.parallel = *a.parallel;
    if (a.csv_path) rc.csv_path = *a.csv_path;
    if (a.summary_csv_path) rc.summary_csv_path = *a.summary_csv_path;
    if (a.figure_path) rc.figure_path = *a.figure_path;

    const range::AnalyticRangeEvaluator evaluator;
    const mc::RangeMcResult res = mc::run_range_monte_carlo(rc.mc, evaluator);

    std::cout << console_summary(res);

    int rc_code = SUCCESS;
    if (!rc.csv_path.empty()) {
      if (write_run_table_csv_file(res, rc.csv_path)) {
        std::cout << "Results saved to: " << rc.csv_path << "\n";
      } else {
        log_error("failed to write run table: " + rc.csv_path);
        rc_code = IO_ERROR;
      }
    }
    if (!rc.summary_csv_path.empty()) {
      if (write_summary_csv_file(res, rc.summary_csv_path)) {
        std::cout << "Summary saved to: " << rc.summary_csv_path << "\n";
      } else {
        log_error("failed to write summary: " + rc.summary_csv_path);
        rc_code = IO_ERROR;
      }
    }
    if (!rc.figure_path.empty()) {
      if (write_range_figure_svg_file(res, rc.figure_path)) {
        std::cout << "Plots saved to: " << rc.figure_path << "\n";
      } else {
        log_error("failed to write figure: " + rc.figure_path);
        rc_code = IO_ERROR;
      }
    }
    return rc_code;

  } catch (const AeroforgeError& e) {
    return report_error(e);
  } catch (const std::exception& e) {
    std::cerr << "STD EXCEPTION: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  }
}

} // namespace

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  if (cmd == "range") {
    return cmd_range(argc, argv);
  }

  if (cmd == "montecarlo" || cmd == "mc") {
    return cmd_montecarlo(argc, argv);
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'aeroforge help' for usage information.\n";
  return INVALID_ARGS;
}
