#pragma once
/*
================================================================================
Fragment 4.4.01 — Engine: Range MC Report Exporters (Run Table, Summary, Console)
FILE: cpp/engine/exports/range_report_csv.hpp

Outputs:
  - Run table CSV, one row per MC run, fixed column order:
      Run, Efficiency, Epack_Wh_kg, L_over_D, Harvest_kW, SiC_Gain, Range_km
  - Summary CSV: "metric,value" rows (AnalysisSummary + corr_<field>).
  - Console summary text (mean +/- std, median, 5-95 % band, threshold rates,
    correlation ranking).

Hardening:
  - NaN/Inf export as empty string (not "nan").
  - Stable column ordering, fixed precision.
  - File writers return false on I/O error; callers decide the exit code.
================================================================================
*/

#include "engine/mc/range_mc.hpp"

#include <string>

namespace aeroforge {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

std::string run_table_csv_header(const CsvExportOptions& opt = CsvExportOptions());
std::string run_table_csv_row(const mc::RangeSample& s, const CsvExportOptions& opt = CsvExportOptions());
std::string run_table_csv(const mc::RangeMcResult& r, const CsvExportOptions& opt = CsvExportOptions());

std::string summary_csv(const mc::RangeMcResult& r, const CsvExportOptions& opt = CsvExportOptions());

std::string console_summary(const mc::RangeMcResult& r);

bool write_run_table_csv_file(const mc::RangeMcResult& r,
                              const std::string& file_path,
                              const CsvExportOptions& opt = CsvExportOptions());

bool write_summary_csv_file(const mc::RangeMcResult& r,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

// Shared by exporters: write a whole string to a file.
bool write_text_file(const std::string& file_path, const std::string& content);

}  // namespace aeroforge
