// ============================================================================
// Fragment 4.3.01 — Range Monte Carlo Driver
// File: range_mc.cpp
// ============================================================================

#include "range_mc.hpp"

#include "engine/core/logging.hpp"
#include "engine/prob/cdf.hpp"

#include <omp.h>

#include <chrono>
#include <exception>
#include <sstream>

namespace aeroforge::mc {

namespace {

struct ResolvedUncertainty final {
    range::ParamField field;
    prob::DistSpec dist;
};

// Name -> field, with duplicate detection. Throws before any sampling.
std::vector<ResolvedUncertainty> resolve(const std::vector<prob::FieldUncertainty>& specs) {
    std::vector<ResolvedUncertainty> out;
    out.reserve(specs.size());
    for (const auto& u : specs) {
        const auto f = range::field_from_name(u.field);
        AEROFORGE_REQUIRE(f.has_value(), ErrorCode::UnknownField,
                          "uncertainty references unknown field '" + u.field + "'");
        for (const auto& prev : out) {
            AEROFORGE_REQUIRE(prev.field != *f, ErrorCode::InvalidConfig,
                              "duplicate uncertainty for field '" + u.field + "'");
        }
        u.dist.validate(u.field);
        out.push_back(ResolvedUncertainty{*f, u.dist});
    }
    return out;
}

std::string describe(const RangeMcConfig& cfg) {
    std::ostringstream os;
    os << "n_runs=" << cfg.n_runs << " seed=" << cfg.rng.seed() << " uncertain=[";
    for (std::size_t i = 0; i < cfg.uncertain.size(); ++i) {
        if (i) os << ",";
        os << cfg.uncertain[i].field;
    }
    os << "]" << (cfg.parallel ? " parallel" : "");
    return os.str();
}

} // namespace

void RangeMcConfig::validate() const {
    AEROFORGE_REQUIRE(n_runs > 0, ErrorCode::InvalidConfig,
                      "runs must be > 0 (got " + std::to_string(n_runs) + ")");
    AEROFORGE_REQUIRE(n_runs <= 100'000'000, ErrorCode::InvalidConfig, "runs too large");

    for (range::ParamField f : range::kAllParamFields) {
        require_finite(nominal.get(f), ErrorCode::InvalidConfig,
                       std::string(range::field_name(f)) + ".nominal");
    }

    (void)resolve(uncertain);

    require_finite(threshold_1_km, ErrorCode::InvalidConfig, "threshold_1_km");
    require_finite(threshold_2_km, ErrorCode::InvalidConfig, "threshold_2_km");
    AEROFORGE_REQUIRE(threshold_1_km <= threshold_2_km, ErrorCode::InvalidConfig,
                      "threshold_1_km must be <= threshold_2_km");
    range::require_range_ceiling(max_range_km, "max_range_km");
}

std::vector<prob::FieldUncertainty> reference_uncertainties() {
    using range::ParamField;
    using range::field_name;
    return {
        // Al-ion pack scaling is the dominant unknown.
        {field_name(ParamField::PackEnergyDensity), prob::relative_normal(0.25, 200.0)},
        {field_name(ParamField::LiftToDrag),        prob::relative_normal(0.15, 15.0)},
        // Harvest is weather dependent.
        {field_name(ParamField::HarvestPower),      prob::relative_normal(0.40, 0.0)},
        {field_name(ParamField::SicGain),           prob::relative_normal(0.20, 1.0)},
        {field_name(ParamField::EtaSystem),         prob::relative_normal(0.10, 0.7, 0.98)},
    };
}

RangeMcConfig RangeMcConfig::reference() {
    RangeMcConfig cfg;
    cfg.nominal = range::RangeParams::reference();
    cfg.uncertain = reference_uncertainties();
    cfg.n_runs = 2000;
    cfg.reseed(42);
    return cfg;
}

std::vector<double> RangeMcResult::ranges() const {
    std::vector<double> out;
    out.reserve(ensemble.size());
    for (const auto& s : ensemble) out.push_back(s.range_km);
    return out;
}

std::vector<double> RangeMcResult::column(range::ParamField f) const {
    std::vector<double> out;
    out.reserve(ensemble.size());
    for (const auto& s : ensemble) out.push_back(s.params.get(f));
    return out;
}

std::vector<range::RangeParams> draw_parameter_vectors(const RangeMcConfig& cfg) {
    cfg.validate();
    const auto specs = resolve(cfg.uncertain);
    const auto n = static_cast<std::size_t>(cfg.n_runs);

    std::vector<range::RangeParams> out(n, cfg.nominal);

    prob::Rng64 rng = cfg.rng;
    for (const auto& u : specs) {
        const double v = cfg.nominal.get(u.field);
        const auto xs = prob::sample_field(v, u.dist, n, rng);
        for (std::size_t i = 0; i < n; ++i) out[i].set(u.field, xs[i]);
    }
    return out;
}

AnalysisSummary summarize_ranges(const std::vector<double>& ranges_km,
                                 double threshold_1_km,
                                 double threshold_2_km) {
    const prob::EmpiricalCdf cdf(ranges_km);
    const auto m = cdf.moments();

    AnalysisSummary s;
    s.n = m.n;
    s.mean = m.mean;
    s.stddev = m.stddev_sample();
    s.min = m.min;
    s.max = m.max;
    s.median = cdf.median();
    s.p5 = cdf.quantile(0.05);
    s.p95 = cdf.quantile(0.95);

    s.threshold_1_km = threshold_1_km;
    s.threshold_2_km = threshold_2_km;
    s.pct_ge_threshold_1 = cdf.exceed_pct(threshold_1_km);
    s.pct_ge_threshold_2 = cdf.exceed_pct(threshold_2_km);
    return s;
}

RangeMcResult run_range_monte_carlo(const RangeMcConfig& cfg,
                                    const range::IRangeEvaluator& evaluator) {
    const auto t0 = std::chrono::steady_clock::now();

    // Validates; throws before anything is sampled.
    const auto inputs = draw_parameter_vectors(cfg);
    const auto specs = resolve(cfg.uncertain);

    log_info("range MC start: evaluator=" + evaluator.name() + " " + describe(cfg));

    const auto n = static_cast<std::int64_t>(inputs.size());
    std::vector<double> ranges(inputs.size(), 0.0);

    const bool parallel = cfg.parallel && evaluator.thread_safe();
    if (cfg.parallel && !parallel) {
        log_warn("evaluator '" + evaluator.name() + "' is not thread-safe; evaluating serially");
    }

    // Exceptions may not leave an OpenMP region: keep the first, rethrow after.
    std::exception_ptr first_error;

    #pragma omp parallel for schedule(static) if (parallel)
    for (std::int64_t i = 0; i < n; ++i) {
        try {
            const double raw = evaluator.evaluate(inputs[static_cast<std::size_t>(i)]);
            ranges[static_cast<std::size_t>(i)] = range::clamp_range_km(raw, cfg.max_range_km);
        } catch (...) {
            #pragma omp critical(aeroforge_mc_error)
            {
                if (!first_error) first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        log_error("range MC aborted: evaluator '" + evaluator.name() + "' failed");
        std::rethrow_exception(first_error);
    }

    RangeMcResult out;
    out.evaluator = evaluator.name();
    out.seed = cfg.rng.seed();

    out.ensemble.reserve(inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        out.ensemble.push_back(RangeSample{i + 1, inputs[i], ranges[i]});
    }

    out.summary = summarize_ranges(ranges, cfg.threshold_1_km, cfg.threshold_2_km);

    out.uncertain_fields.reserve(specs.size());
    out.correlations.reserve(specs.size());
    for (const auto& u : specs) {
        out.uncertain_fields.push_back(u.field);
        out.correlations.push_back(prob::Correlation{range::field_name(u.field),
                                                     prob::pearson(out.column(u.field), ranges)});
    }
    prob::rank_by_magnitude(out.correlations);

    const auto t1 = std::chrono::steady_clock::now();
    out.elapsed_s = std::chrono::duration<double>(t1 - t0).count();

    std::ostringstream os;
    os << "range MC done: n=" << out.summary.n << " mean_km=" << out.summary.mean
       << " elapsed_s=" << out.elapsed_s
       << " omp_threads=" << (parallel ? omp_get_max_threads() : 1);
    log_info(os.str());

    return out;
}

} // namespace aeroforge::mc
