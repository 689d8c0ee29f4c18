// ============================================================================
// Fragment 4.3.02 — Run Configuration
// File: run_config.cpp
// ============================================================================

#include "run_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace aeroforge::mc {

namespace {

struct LineCtx final {
    int line = 0;
    std::string key;
};

[[noreturn]] void parse_fail(const LineCtx& c, const std::string& msg, ErrorCode code = ErrorCode::ParseError) {
    fail(code, "config line " + std::to_string(c.line) + " (" + c.key + "): " + msg, AEROFORGE_SITE);
}

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

double parse_number(const LineCtx& c, std::string_view v) {
    const std::string s(v);
    char* end = nullptr;
    errno = 0;
    const double x = std::strtod(s.c_str(), &end);
    if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE || !is_finite(x)) {
        parse_fail(c, "expected a finite number, got '" + s + "'");
    }
    return x;
}

std::int64_t parse_int(const LineCtx& c, std::string_view v) {
    const std::string s(v);
    char* end = nullptr;
    errno = 0;
    const long long x = std::strtoll(s.c_str(), &end, 10);
    if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE) {
        parse_fail(c, "expected an integer, got '" + s + "'");
    }
    return static_cast<std::int64_t>(x);
}

bool parse_bool01(const LineCtx& c, std::string_view v) {
    if (v == "1" || v == "true") return true;
    if (v == "0" || v == "false") return false;
    parse_fail(c, "expected 0|1, got '" + std::string(v) + "'");
}

// Per-field edits collected over the whole file, applied at the end so the
// order of keys within the file does not matter.
struct FieldEdit final {
    std::string name;
    int first_line = 0;
    std::optional<double> spread;
    std::optional<prob::SpreadKind> kind;
    std::optional<double> floor;
    std::optional<double> ceiling;
    std::optional<bool> uncertain;
};

FieldEdit& edit_for(std::vector<FieldEdit>& edits, const std::string& name, int line) {
    for (auto& e : edits) {
        if (e.name == name) return e;
    }
    FieldEdit e;
    e.name = name;
    e.first_line = line;
    edits.push_back(e);
    return edits.back();
}

void apply_field_edits(RangeMcConfig& cfg, const std::vector<FieldEdit>& edits) {
    for (const auto& e : edits) {
        auto it = cfg.uncertain.begin();
        for (; it != cfg.uncertain.end(); ++it) {
            if (it->field == e.name) break;
        }

        if (e.uncertain.has_value() && !*e.uncertain) {
            if (it != cfg.uncertain.end()) cfg.uncertain.erase(it);
            continue;
        }

        // "uncertain = 1" alone needs a spread just like floor/ceiling do.
        const bool touches_dist = e.spread || e.kind || e.floor || e.ceiling || e.uncertain.has_value();
        if (!touches_dist) continue;

        if (it == cfg.uncertain.end()) {
            if (!e.spread) {
                LineCtx c{e.first_line, e.name};
                parse_fail(c, "field is not uncertain; set " + e.name + ".spread first", ErrorCode::InvalidConfig);
            }
            cfg.uncertain.push_back(prob::FieldUncertainty{e.name, prob::relative_normal(*e.spread)});
            it = cfg.uncertain.end() - 1;
        }

        if (e.spread) it->dist.sigma = *e.spread;
        if (e.kind) it->dist.kind = *e.kind;
        if (e.floor) it->dist.floor = *e.floor;
        if (e.ceiling) it->dist.ceiling = *e.ceiling;
    }
}

} // namespace

RunConfig parse_run_config(std::string_view text) {
    RunConfig rc;
    std::vector<FieldEdit> edits;

    int line_no = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const auto nl = text.find('\n', pos);
        const auto raw = text.substr(pos, (nl == std::string_view::npos) ? std::string_view::npos : nl - pos);
        pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
        ++line_no;

        auto line = raw;
        const auto hash = line.find('#');
        if (hash != std::string_view::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        LineCtx c{line_no, std::string(trim(line.substr(0, eq)))};
        if (eq == std::string_view::npos) parse_fail(c, "expected 'key = value'");
        const auto value = trim(line.substr(eq + 1));
        if (c.key.empty()) parse_fail(c, "empty key");
        if (value.empty()) parse_fail(c, "empty value");

        const std::string& key = c.key;

        if (key == "seed") {
            const auto s = parse_int(c, value);
            if (s < 0) parse_fail(c, "seed must be >= 0");
            rc.mc.reseed(static_cast<std::uint64_t>(s));
        } else if (key == "runs") {
            rc.mc.n_runs = parse_int(c, value);
        } else if (key == "parallel") {
            rc.mc.parallel = parse_bool01(c, value);
        } else if (key == "threshold_1_km") {
            rc.mc.threshold_1_km = parse_number(c, value);
        } else if (key == "threshold_2_km") {
            rc.mc.threshold_2_km = parse_number(c, value);
        } else if (key == "log_level") {
            rc.log_level = parse_log_level(value);
            if (!rc.log_level) parse_fail(c, "expected debug|info|warn|error");
        } else if (key == "output.csv") {
            rc.csv_path = std::string(value);
        } else if (key == "output.summary_csv") {
            rc.summary_csv_path = std::string(value);
        } else if (key == "output.figure") {
            rc.figure_path = std::string(value);
        } else {
            const auto dot = key.rfind('.');
            if (dot == std::string::npos) parse_fail(c, "unknown key");

            const std::string field = key.substr(0, dot);
            const std::string attr = key.substr(dot + 1);
            const auto f = range::field_from_name(field);
            if (!f) parse_fail(c, "unknown field '" + field + "'", ErrorCode::UnknownField);

            if (attr == "nominal") {
                rc.mc.nominal.set(*f, parse_number(c, value));
                continue;
            }

            FieldEdit& e = edit_for(edits, field, line_no);
            if (attr == "spread") {
                e.spread = parse_number(c, value);
            } else if (attr == "spread_kind") {
                if (value == "relative") e.kind = prob::SpreadKind::Relative;
                else if (value == "absolute") e.kind = prob::SpreadKind::Absolute;
                else parse_fail(c, "expected relative|absolute");
            } else if (attr == "floor") {
                e.floor = (value == "none") ? kNoFloor : parse_number(c, value);
            } else if (attr == "ceiling") {
                e.ceiling = (value == "none") ? kNoCeiling : parse_number(c, value);
            } else if (attr == "uncertain") {
                e.uncertain = parse_bool01(c, value);
            } else {
                parse_fail(c, "unknown attribute '" + attr + "'");
            }
        }
    }

    apply_field_edits(rc.mc, edits);
    return rc;
}

RunConfig load_run_config(const std::string& path) {
    std::ifstream ifs(path);
    AEROFORGE_REQUIRE(ifs.is_open(), ErrorCode::IOError, "cannot open config file: " + path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    log_debug("loaded config file " + path);
    return parse_run_config(ss.str());
}

} // namespace aeroforge::mc
