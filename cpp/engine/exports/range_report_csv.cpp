/*
================================================================================
Fragment 4.4.01 — Engine: Range MC Report Exporters Implementation
FILE: cpp/engine/exports/range_report_csv.cpp
================================================================================
*/

#include "range_report_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace aeroforge {

// Helper: format double, or empty string if NaN/Inf
static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string run_table_csv_header(const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream h;
  h << "Run" << d
    << "Efficiency" << d
    << "Epack_Wh_kg" << d
    << "L_over_D" << d
    << "Harvest_kW" << d
    << "SiC_Gain" << d
    << "Range_km";
  return h.str();
}

std::string run_table_csv_row(const mc::RangeSample& s, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  const int p = opt.precision;
  std::ostringstream row;
  row << s.run << d
      << csv_double(s.params.eta_system, p) << d
      << csv_double(s.params.pack_energy_density, p) << d
      << csv_double(s.params.lift_to_drag, p) << d
      << csv_double(s.params.harvest_power, p) << d
      << csv_double(s.params.sic_gain, p) << d
      << csv_double(s.range_km, p);
  return row.str();
}

std::string run_table_csv(const mc::RangeMcResult& r, const CsvExportOptions& opt) {
  std::string out;
  out.reserve(64 + r.ensemble.size() * 96);
  if (opt.include_header) {
    out.append(run_table_csv_header(opt));
    out.push_back('\n');
  }
  for (const auto& s : r.ensemble) {
    out.append(run_table_csv_row(s, opt));
    out.push_back('\n');
  }
  return out;
}

std::string summary_csv(const mc::RangeMcResult& r, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  const int p = opt.precision;
  const auto& s = r.summary;

  std::ostringstream os;
  if (opt.include_header) os << "metric" << d << "value\n";

  auto row = [&](const std::string& k, double v) { os << k << d << csv_double(v, p) << "\n"; };

  os << "evaluator" << d << r.evaluator << "\n";
  os << "seed" << d << r.seed << "\n";
  os << "n" << d << s.n << "\n";
  row("mean_km", s.mean);
  row("stddev_km", s.stddev);
  row("min_km", s.min);
  row("max_km", s.max);
  row("median_km", s.median);
  row("p5_km", s.p5);
  row("p95_km", s.p95);
  row("threshold_1_km", s.threshold_1_km);
  row("pct_ge_threshold_1", s.pct_ge_threshold_1);
  row("threshold_2_km", s.threshold_2_km);
  row("pct_ge_threshold_2", s.pct_ge_threshold_2);
  for (const auto& c : r.correlations) row("corr_" + c.name, c.r);

  return os.str();
}

std::string console_summary(const mc::RangeMcResult& r) {
  const auto& s = r.summary;
  std::ostringstream os;
  os << std::fixed;

  os << "=== AeroForge Results Summary ===\n";
  os << "Evaluator: " << r.evaluator << ", Runs: " << s.n << ", Seed: " << r.seed << "\n";
  os << "Range Statistics:\n";
  os << std::setprecision(0)
     << "  Mean: " << s.mean << " km (+/-" << s.stddev << " km std)\n"
     << "  Median: " << s.median << " km\n"
     << "  90% Confidence: " << s.p5 << " - " << s.p95 << " km\n";

  os << "\nTarget Achievement:\n";
  os << "  >=" << std::setprecision(0) << s.threshold_1_km << " km: "
     << std::setprecision(1) << s.pct_ge_threshold_1 << "% of cases\n";
  os << "  >=" << std::setprecision(0) << s.threshold_2_km << " km: "
     << std::setprecision(1) << s.pct_ge_threshold_2 << "% of cases\n";

  if (!r.correlations.empty()) {
    os << "\nParameter Correlations with Range:\n" << std::setprecision(3);
    for (const auto& c : r.correlations) os << "  " << c.name << ": " << c.r << "\n";
  }

  os << "\nAnalysis completed in " << std::setprecision(2) << r.elapsed_s << " seconds\n";
  return os.str();
}

bool write_text_file(const std::string& file_path, const std::string& content) {
  std::ofstream ofs(file_path, std::ios::binary);
  if (!ofs.is_open()) return false;
  ofs << content;
  return ofs.good();
}

bool write_run_table_csv_file(const mc::RangeMcResult& r,
                              const std::string& file_path,
                              const CsvExportOptions& opt) {
  return write_text_file(file_path, run_table_csv(r, opt));
}

bool write_summary_csv_file(const mc::RangeMcResult& r,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  return write_text_file(file_path, summary_csv(r, opt));
}

}  // namespace aeroforge
