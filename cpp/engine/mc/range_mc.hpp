// ============================================================================
// Fragment 4.3.01 — Range Monte Carlo Driver (Sample → Evaluate → Summarize)
// File: range_mc.hpp
// ============================================================================
//
// Purpose:
// - Propagate RangeParams uncertainty through a range evaluator.
// - Two phases:
//     1) draw: every uncertain field, in declaration order, takes n_runs
//        normals from a copy of cfg.rng (column by column). All parameter
//        vectors exist before the first evaluation.
//     2) evaluate: one evaluator call per vector, stored by run index. With
//        cfg.parallel and a thread-safe evaluator this loop runs under OpenMP.
//   Same config (seed, N, specs) => bit-identical ensemble, serial or parallel.
// - Evaluator outputs go through clamp_range_km(), whatever the backend.
//
// Errors:
// - Any configuration problem throws AeroforgeError before sampling starts:
//   n_runs <= 0, unknown/duplicate field, bad spread/floor/ceiling/threshold.
// - An evaluator exception aborts the whole batch (no partial ensembles).
//
// ============================================================================

#pragma once
#include "engine/prob/correlation.hpp"
#include "engine/prob/rng.hpp"
#include "engine/prob/uncertainty.hpp"
#include "engine/range/range_evaluator.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aeroforge::mc {

struct RangeMcConfig final {
    range::RangeParams nominal{};

    // Uncertain fields in draw order. Fields not listed stay at nominal.
    std::vector<prob::FieldUncertainty> uncertain;

    // Signed so that a non-positive request is representable and rejected.
    std::int64_t n_runs = 2000;

    // Random stream owned by the config. The driver works on a copy.
    prob::Rng64 rng{42};

    // Threshold-crossing rates reported as P(range >= t) in percent.
    double threshold_1_km = 5000.0;
    double threshold_2_km = 10000.0;

    // Ceiling applied to every evaluator output, in (0, range::kMaxRangeKm].
    double max_range_km = range::kMaxRangeKm;

    bool parallel = false;

    void reseed(std::uint64_t seed) { rng = prob::Rng64(seed); }

    void validate() const;

    // Reference AeroForge case: seed 42, 2000 runs, five uncertain fields.
    static RangeMcConfig reference();
};

// Reference uncertainty table (draw order: energy density, L/D, harvest, SiC, eta).
std::vector<prob::FieldUncertainty> reference_uncertainties();

struct RangeSample final {
    std::size_t run = 0;          // 1-based
    range::RangeParams params{};
    double range_km = 0.0;
};

struct AnalysisSummary final {
    std::size_t n = 0;

    double mean = 0.0;
    double stddev = 0.0;          // sample (n-1)
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double p5 = 0.0;
    double p95 = 0.0;

    double threshold_1_km = 5000.0;
    double pct_ge_threshold_1 = 0.0;  // [0,100]
    double threshold_2_km = 10000.0;
    double pct_ge_threshold_2 = 0.0;  // [0,100]
};

struct RangeMcResult final {
    std::string evaluator;
    std::uint64_t seed = 0;

    std::vector<range::ParamField> uncertain_fields;   // draw order
    std::vector<RangeSample> ensemble;                 // size == n_runs

    AnalysisSummary summary;

    // Pearson r(field samples, range), ranked by |r|.
    std::vector<prob::Correlation> correlations;

    double elapsed_s = 0.0;

    std::vector<double> ranges() const;
    std::vector<double> column(range::ParamField f) const;
};

// Phase 1 only: validated config -> n_runs parameter vectors.
std::vector<range::RangeParams> draw_parameter_vectors(const RangeMcConfig& cfg);

// Statistics over a range sequence.
AnalysisSummary summarize_ranges(const std::vector<double>& ranges_km,
                                 double threshold_1_km = 5000.0,
                                 double threshold_2_km = 10000.0);

RangeMcResult run_range_monte_carlo(const RangeMcConfig& cfg,
                                    const range::IRangeEvaluator& evaluator);

} // namespace aeroforge::mc
