#include "demand-dna/dna/similarity.hpp"
#include "demand-dna/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace demanddna::dna {

namespace {

double relativeError(double observed, double historical) {
	return std::abs(observed - historical) / std::max(observed, 1.0);
}

} // namespace

SimilarityWeights computeSimilarityWeights(const profile::HistoricalProfile &profile,
                                           const SimilarityRequest &request) {
	const auto trial_days_vec = request.trial.periodsCovered(core::Granularity::Daily);
	const std::set<int> trial_days(trial_days_vec.begin(), trial_days_vec.end());

	std::map<int, core::MetricTotals> yearly_sums;
	for (const auto &record : profile.select(request.entities, core::Granularity::Daily)) {
		if (record.isOverall() || *record.year == request.projection_year) {
			continue;
		}
		if (trial_days.find(record.period) == trial_days.end()) {
			continue;
		}
		yearly_sums[*record.year] += record.raw;
	}

	SimilarityWeights weights;
	double total = 0.0;
	for (const auto &entry : yearly_sums) {
		const auto &sums = entry.second;
		const double error = (relativeError(request.observed.sessions, sums.sessions) +
		                      relativeError(request.observed.conversions, sums.conversions) +
		                      relativeError(request.observed.revenue, sums.revenue)) /
		                     3.0;
		const double weight = 1.0 / (error + request.epsilon);
		weights[entry.first] = weight;
		total += weight;
	}

	if (total <= 0.0) {
		DEMANDDNA_WARN("No historical year overlaps the trial window {} to {}.", request.trial.start.toString(),
		               request.trial.end.toString());
		return {};
	}
	for (auto &entry : weights) {
		entry.second /= total;
		DEMANDDNA_DEBUG("Similarity weight for {}: {:.4f}", entry.first, entry.second);
	}
	return weights;
}

} // namespace demanddna::dna
