// ============================================================================
// Fragment 4.2.04 — Pearson Correlation (Input/Output Sensitivity Ranking)
// File: correlation.hpp
// ============================================================================

#pragma once
#include "engine/core/require.hpp"

#include <string>
#include <vector>

namespace aeroforge::prob {

// Pearson r over paired samples. Pairs with a non-finite member are skipped.
// Returns 0 when fewer than two pairs remain or either side has zero variance.
// Throws InvalidInput on length mismatch.
double pearson(const std::vector<double>& x, const std::vector<double>& y);

struct Correlation final {
    std::string name;
    double r = 0.0;
};

// Sort by |r| descending; ties keep input order.
void rank_by_magnitude(std::vector<Correlation>& cs);

} // namespace aeroforge::prob
