#pragma once

#include "demand-dna/core/types.hpp"
#include "demand-dna/dna/similarity.hpp"
#include "demand-dna/profile/historical_profile.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace demanddna::dna {

/**
 * @class PureDna
 * @brief Canonical monthly seasonality profile: one index triple per calendar month.
 *
 * Months absent from the profile are treated as neutral (1.0) when the
 * profile is broadcast onto a year.
 */
class PureDna {
public:
	PureDna() = default;
	explicit PureDna(std::map<int, core::IndexTriple> months);

	/// Profile with the same triple for all twelve months.
	static PureDna flat(const core::IndexTriple &value = core::IndexTriple::neutral());

	std::optional<core::IndexTriple> month(int month) const;

	/// Index for @p month, or the neutral triple when the month is not mapped.
	core::IndexTriple monthOrNeutral(int month) const;

	const std::map<int, core::IndexTriple> &months() const noexcept {
		return months_;
	}

	bool empty() const noexcept {
		return months_.empty();
	}

private:
	std::map<int, core::IndexTriple> months_;
};

/**
 * @brief Blends the all-time shape with the similarity-weighted yearly shapes.
 *
 * For every month m present in the overall pseudo-year:
 *   pure[m] = overall_share * overall[m]
 *           + (1 - overall_share) * sum_y( w_y * year_y[m] )
 * where overall[m] and year_y[m] are medians across the selected entities.
 * A weighted year without data for m contributes overall[m] instead.
 */
PureDna blendPureDna(const profile::HistoricalProfile &profile, const std::vector<std::string> &entities,
                     const SimilarityWeights &weights, double overall_share = 0.35);

} // namespace demanddna::dna
