#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/events/event.hpp"
#include "demand-dna/profile/historical_profile.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demanddna::signature {

/**
 * @struct DailyTotals
 * @brief Totals of the selected entities on one calendar day.
 */
struct DailyTotals {
	core::CivilDate date;
	core::MetricTotals totals;
};

/**
 * @struct ShockSignature
 * @brief Excess demand of a historical anomaly above its organic floor.
 *
 * The daily vectors hold one entry per calendar day of the origin window;
 * days without data carry zero excess.
 */
struct ShockSignature {
	std::string name;
	core::DateRange origin;
	int duration = 0;

	/// Organic floor per metric (a low quantile of the window itself).
	core::MetricTotals floor;
	/// Summed daily excess.
	core::MetricTotals total_excess;

	double organic_conversion_rate = 0.0;
	double event_conversion_rate = 0.0;
	double conversion_rate_delta = 0.0;

	std::vector<core::MetricTotals> daily_excess;
	std::vector<core::MetricTotals> daily_relative;

	/// Aggregated window plus context days, for display.
	std::vector<DailyTotals> context;
};

/**
 * @struct ExtractionRequest
 * @brief Window to isolate and the entities to aggregate.
 */
struct ExtractionRequest {
	core::DateRange window;
	std::vector<std::string> entities;
	/// Name of the signature; defaults to "Shock <start>-><end>" when empty.
	std::string name;
	int context_days = 14;
	double floor_quantile = 0.10;
};

/// Daily totals of the selected entities within @p range, sorted by date.
std::vector<DailyTotals> aggregateDaily(const std::vector<profile::DailyRecord> &daily,
                                        const std::vector<std::string> &entities, const core::DateRange &range);

/**
 * @brief Isolates the excess demand of a historical window.
 *
 * The floor of each metric is the floor_quantile of its daily values inside
 * the window (context days excluded); daily excess is max(0, observed - floor)
 * and the relative fraction is excess / floor (0 when the floor is 0).
 * Organic conversion rate is floor conversions / floor sessions; event
 * conversion rate is excess conversions / excess sessions.
 *
 * @return Nothing when the window has no data or the total excess traffic is
 *         not positive (no significant shock).
 */
std::optional<ShockSignature> extractSignature(const std::vector<profile::DailyRecord> &daily,
                                               const ExtractionRequest &request);

/**
 * @brief Builds a ReappliedShock event that replays @p signature from @p new_start.
 */
events::ReappliedShockEvent reapplySignature(const ShockSignature &signature, const core::CivilDate &new_start,
                                             events::InjectionMode mode);

} // namespace demanddna::signature
