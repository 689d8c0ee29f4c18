// ============================================================================
// Fragment 4.1.03 — Range Evaluator Strategy (Analytic + Host-Supplied Backend)
// File: range_evaluator.hpp
// ============================================================================
//
// Purpose:
// - One interface for "nine inputs -> one range [km]".
// - AnalyticRangeEvaluator: the closed form in range_model.hpp.
// - FunctionRangeEvaluator: wraps a host callable (e.g. an external
//   block-diagram simulation run once per sample). The MC driver applies
//   clamp_range_km() to every evaluator output, so any backend still yields
//   RangeResults in [0, max_range_km].
//
// Implementations must be const-callable and free of shared mutable state:
// the MC driver may call evaluate() concurrently when parallel mode is on.
//
// ============================================================================

#pragma once
#include "range_model.hpp"

#include <functional>
#include <string>
#include <utility>

namespace aeroforge::range {

class IRangeEvaluator {
public:
    virtual ~IRangeEvaluator() = default;

    virtual double evaluate(const RangeParams& p) const = 0;

    // Short id for logs/reports ("analytic", "external", ...).
    virtual std::string name() const = 0;

    // False => the driver never calls evaluate() from more than one thread.
    virtual bool thread_safe() const noexcept { return true; }
};

class AnalyticRangeEvaluator final : public IRangeEvaluator {
public:
    explicit AnalyticRangeEvaluator(const RangeModelConfig& cfg = {}) : cfg_(cfg) { cfg_.validate(); }

    double evaluate(const RangeParams& p) const override { return range_km(p, cfg_); }
    std::string name() const override { return "analytic"; }

    const RangeModelConfig& config() const noexcept { return cfg_; }

private:
    RangeModelConfig cfg_;
};

using RangeFunction = std::function<double(const RangeParams&)>;

class FunctionRangeEvaluator final : public IRangeEvaluator {
public:
    FunctionRangeEvaluator(std::string name, RangeFunction fn, bool thread_safe = false)
        : name_(std::move(name)), fn_(std::move(fn)), thread_safe_(thread_safe) {
        AEROFORGE_REQUIRE(!name_.empty(), ErrorCode::InvalidConfig, "FunctionRangeEvaluator name empty");
        AEROFORGE_REQUIRE(static_cast<bool>(fn_), ErrorCode::InvalidConfig, "FunctionRangeEvaluator callable empty");
    }

    double evaluate(const RangeParams& p) const override { return fn_(p); }
    std::string name() const override { return name_; }
    bool thread_safe() const noexcept override { return thread_safe_; }

private:
    std::string name_;
    RangeFunction fn_;
    bool thread_safe_ = false;
};

} // namespace aeroforge::range
