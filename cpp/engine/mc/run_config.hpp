// ============================================================================
// Fragment 4.3.02 — Run Configuration (key = value file → RangeMcConfig + outputs)
// File: run_config.hpp
// ============================================================================
//
// Format:
//   # comment
//   seed = 42
//   runs = 2000
//   parallel = 0|1
//   threshold_1_km = 5000
//   threshold_2_km = 10000
//   log_level = debug|info|warn|error
//   output.csv = results.csv
//   output.summary_csv = summary.csv
//   output.figure = analysis.svg
//   <field>.nominal = <number>
//   <field>.spread = <number>            (declares/updates an uncertainty)
//   <field>.spread_kind = relative|absolute
//   <field>.floor = <number>|none
//   <field>.ceiling = <number>|none
//   <field>.uncertain = 0                (hold the field at nominal)
//
// The file overlays RangeMcConfig::reference(). A field made uncertain by the
// file is appended to the draw order after the reference fields.
//
// Errors: ParseError for malformed lines/values, UnknownField for a field name
// that is not in RangeParams. Messages carry "line N" and the key.
//
// ============================================================================

#pragma once
#include "range_mc.hpp"

#include "engine/core/logging.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace aeroforge::mc {

struct RunConfig final {
    RangeMcConfig mc = RangeMcConfig::reference();

    std::string csv_path;          // empty => not written
    std::string summary_csv_path;
    std::string figure_path;

    std::optional<LogLevel> log_level;
};

RunConfig parse_run_config(std::string_view text);

// Reads the whole file; IOError if it cannot be opened.
RunConfig load_run_config(const std::string& path);

} // namespace aeroforge::mc
