#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/profile/historical_profile.hpp"

#include <map>
#include <string>
#include <vector>

namespace demanddna::dna {

/// Historical year -> normalized weight; weights of the included years sum to 1.
using SimilarityWeights = std::map<int, double>;

/**
 * @struct SimilarityRequest
 * @brief Inputs of the inverse-error year weighting.
 */
struct SimilarityRequest {
	std::vector<std::string> entities;
	int projection_year = 0;
	core::DateRange trial;
	/// Observed (unadjusted) trial totals.
	core::MetricTotals observed;
	double epsilon = 0.01;
};

/**
 * @brief Weights each historical year by how closely its totals over the
 * trial's days of year match the observed trial totals.
 *
 * For every year other than the projection year, daily records of the
 * selected entities on the trial's days of year are summed. The error is the
 * mean of |observed - sum| / max(observed, 1) over sessions, conversions and
 * revenue; the raw weight is 1 / (error + epsilon), then weights are
 * normalized to sum to 1.
 *
 * @return An empty mapping when no historical year overlaps the trial window.
 */
SimilarityWeights computeSimilarityWeights(const profile::HistoricalProfile &profile,
                                           const SimilarityRequest &request);

} // namespace demanddna::dna
