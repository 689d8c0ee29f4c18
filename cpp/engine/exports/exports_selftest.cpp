/*
  Fragment 4.4.03 — Range Report Exporters Selftest

  Checks:
    - run table header text and row count (header + N rows),
    - NaN exported as an empty cell,
    - summary CSV keys (incl. corr_<field>),
    - console summary headings,
    - histogram conservation (counts sum to n) and degenerate spans,
    - SVG envelope, the four panel titles, both dashed target lines,
    - file writers: true on success, false on an unwritable path.

  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <numeric>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/exports/range_figure_svg.hpp"
#include "engine/exports/range_report_csv.hpp"

namespace aeroforge {
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

bool contains(const std::string& s, std::string_view needle) { return s.find(needle) != std::string::npos; }

std::size_t count_lines(const std::string& s) {
  return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n'));
}

std::size_t count_occurrences(const std::string& s, std::string_view needle) {
  std::size_t n = 0;
  for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) ++n;
  return n;
}

mc::RangeMcResult small_run(std::int64_t n) {
  mc::RangeMcConfig cfg = mc::RangeMcConfig::reference();
  cfg.n_runs = n;
  return mc::run_range_monte_carlo(cfg, range::AnalyticRangeEvaluator());
}

void test_run_table() {
  expect_true(run_table_csv_header() == "Run,Efficiency,Epack_Wh_kg,L_over_D,Harvest_kW,SiC_Gain,Range_km",
              "run table header");

  const auto r = small_run(25);
  const std::string csv = run_table_csv(r);
  expect_true(count_lines(csv) == 26, "header + N rows");

  std::istringstream is(csv);
  std::string header;
  std::string first;
  std::getline(is, header);
  std::getline(is, first);
  expect_true(first.rfind("1,", 0) == 0, "first row is run 1");
  expect_true(std::count(first.begin(), first.end(), ',') == 6, "seven columns per row");

  CsvExportOptions no_header;
  no_header.include_header = false;
  expect_true(count_lines(run_table_csv(r, no_header)) == 25, "header can be omitted");

  mc::RangeSample bad;
  bad.run = 7;
  bad.range_km = std::nan("");
  const std::string row = run_table_csv_row(bad);
  expect_true(row.rfind("7,", 0) == 0 && row.back() == ',', "NaN exported as empty cell");

  CsvExportOptions semi;
  semi.delimiter = ';';
  expect_true(contains(run_table_csv_header(semi), "Run;Efficiency"), "custom delimiter");
}

void test_summary() {
  const auto r = small_run(100);
  const std::string s = summary_csv(r);
  expect_true(s.rfind("metric,value\n", 0) == 0, "summary header");
  for (const char* key : {"evaluator,analytic", "seed,42", "n,100", "mean_km,", "stddev_km,", "min_km,", "max_km,",
                          "median_km,", "p5_km,", "p95_km,", "threshold_1_km,5000.000000",
                          "pct_ge_threshold_1,0.000000", "threshold_2_km,10000.000000", "pct_ge_threshold_2,",
                          "corr_pack_energy_density,", "corr_eta_system,"}) {
    expect_true(contains(s, key), std::string("summary has ") + key);
  }
  expect_true(count_lines(s) == 1 + 14 + r.correlations.size(), "one row per metric");

  const std::string text = console_summary(r);
  expect_true(contains(text, "=== AeroForge Results Summary ==="), "console banner");
  expect_true(contains(text, "Target Achievement:") && contains(text, ">=5000 km: 0.0% of cases"),
              "console threshold lines");
  expect_true(contains(text, "Parameter Correlations with Range:"), "console correlations");
}

void test_histogram() {
  const std::vector<double> xs = {1.0, 2.0, 2.5, 3.0, 10.0, std::nan("")};
  const Histogram h = build_histogram(xs, 4);
  const std::size_t total = std::accumulate(h.counts.begin(), h.counts.end(), std::size_t{0});
  expect_true(h.counts.size() == 4 && total == 5, "histogram counts finite samples");
  expect_true(h.lo == 1.0 && h.hi == 10.0, "histogram span = data span");
  expect_true(h.counts.back() == 1, "max lands in last bin");

  const Histogram flat = build_histogram({5.0, 5.0, 5.0}, 50);
  const std::size_t flat_total = std::accumulate(flat.counts.begin(), flat.counts.end(), std::size_t{0});
  expect_true(flat.lo == 4.5 && flat.hi == 5.5 && flat_total == 3, "degenerate span widened");

  const auto r = small_run(2000);
  const Histogram rh = build_histogram(r.ranges(), 50);
  const std::size_t rtotal = std::accumulate(rh.counts.begin(), rh.counts.end(), std::size_t{0});
  expect_true(rh.counts.size() == 50 && rtotal == 2000, "50 bins hold all 2000 ranges");
}

void test_svg() {
  const auto r = small_run(200);
  const std::string svg = range_figure_svg(r);
  expect_true(svg.rfind("<?xml", 0) == 0, "svg starts with xml prolog");
  expect_true(svg.size() > 7 && svg.compare(svg.size() - 7, 7, "</svg>\n") == 0, "svg closed");
  expect_true(contains(svg, "Range Distribution (mean="), "histogram panel");
  expect_true(contains(svg, "Range vs Battery Density"), "energy density panel");
  expect_true(contains(svg, "Range vs Energy Harvesting"), "harvest panel");
  expect_true(contains(svg, "Range vs SiC Enhancement"), "SiC panel");
  // Reference ranges sit near 4 km; the axis still reaches both targets.
  expect_true(contains(svg, "5000 km target") && contains(svg, "10000 km target"), "both target lines labelled");
  expect_true(count_occurrences(svg, "stroke-dasharray") == 2, "two dashed target lines drawn");

  mc::RangeMcConfig cfg = mc::RangeMcConfig::reference();
  cfg.nominal.sfc_eq = 1.0e-7;
  cfg.n_runs = 500;
  const auto lr = mc::run_range_monte_carlo(cfg, range::AnalyticRangeEvaluator());
  if (lr.summary.min < 5000.0 && lr.summary.max > 5000.0) {
    const std::string svg2 = range_figure_svg(lr);
    expect_true(contains(svg2, "stroke-dasharray") && contains(svg2, "5000 km target"),
                "in-span target drawn as dashed line");
  }
}

void test_writers() {
  const auto r = small_run(10);
  const std::string csv_path = "aeroforge_exports_selftest.csv";
  const std::string svg_path = "aeroforge_exports_selftest.svg";
  expect_true(write_run_table_csv_file(r, csv_path), "write run table");
  expect_true(write_range_figure_svg_file(r, svg_path), "write figure");

  std::ifstream ifs(csv_path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  expect_true(ss.str() == run_table_csv(r), "file content matches");
  ifs.close();
  std::remove(csv_path.c_str());
  std::remove(svg_path.c_str());

  expect_true(!write_summary_csv_file(r, "no/such/dir/summary.csv"), "unwritable path -> false");
}

}  // namespace
}  // namespace aeroforge

int main() {
  using namespace aeroforge;

  set_log_level(LogLevel::WARN);

  try {
    test_run_table();
    test_summary();
    test_histogram();
    test_svg();
    test_writers();
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
