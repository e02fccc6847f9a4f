#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/projection/projection_builder.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demanddna::goal {

enum class TargetMetric { Sessions, Conversions, Revenue, ConversionRate, OrderValue };

/// Volume lever expected to close the gap to a target.
enum class VolumeDriver { Traffic, ConversionRate, OrderValue };

std::string toString(TargetMetric metric);
std::string toString(VolumeDriver driver);

/// Metric whose volume is attributed: ratio targets are tracked through revenue.
core::Metric gapMetric(TargetMetric metric) noexcept;

/**
 * @struct TargetSpec
 * @brief Business target over a date window of the projection year.
 */
struct TargetSpec {
	TargetMetric metric = TargetMetric::Revenue;
	double value = 0.0;
	core::DateRange window;
	VolumeDriver driver = VolumeDriver::Traffic;
};

/// Target value implied by growing @p base_value by @p growth_pct percent.
double targetFromGrowth(double base_value, double growth_pct) noexcept;

/**
 * @struct KpiSnapshot
 * @brief Volumes and the two ratios derived from them.
 */
struct KpiSnapshot {
	core::MetricTotals totals;
	double conversion_rate = 0.0;
	double order_value = 0.0;

	/// Ratios from @p totals; zero denominators give zero.
	static KpiSnapshot of(const core::MetricTotals &totals);
};

/**
 * @struct GoalPlan
 * @brief What the target requires over its window, against what the projection delivers.
 */
struct GoalPlan {
	TargetSpec target;
	KpiSnapshot needed;
	/// Baseline over the window; ratios fall back to the calibration constants.
	KpiSnapshot before;
	/// Simulation over the window.
	KpiSnapshot after;
};

/**
 * @brief Translates a target into the volumes needed over its window.
 *
 * The needed volumes depend on the metric and the volume driver; the levers
 * that are not expected to move keep their baseline value:
 *   - revenue / traffic: conversions = revenue / aov, sessions = conversions / cr
 *   - revenue / conversion rate: baseline sessions, conversions = revenue / aov
 *   - revenue / order value: baseline sessions and conversions
 *   - conversions / traffic: sessions = conversions / cr, revenue = conversions * aov
 *   - conversions / other: baseline sessions, revenue = conversions * aov
 *   - sessions: conversions = sessions * cr, revenue = conversions * aov
 *   - conversion rate: baseline sessions, conversions = sessions * target
 *   - order value: baseline sessions and conversions, revenue = conversions * target
 * where cr and aov are the baseline ratios over the window.
 *
 * @return Nothing when the window has no days in the projection year.
 */
std::optional<GoalPlan> translateTarget(const projection::ProjectionResult &projection, const TargetSpec &target);

/**
 * @struct GoalPeriodRow
 * @brief Needed against projected volumes for one period of the target window.
 */
struct GoalPeriodRow {
	int period = 0;
	core::CivilDate first_date;
	core::MetricTotals baseline;
	core::MetricTotals simulation;
	core::MetricTotals needed;
	/// baseline - needed
	core::MetricTotals baseline_gap;
	/// simulation - needed
	core::MetricTotals simulation_gap;
};

/**
 * @brief Spreads the needed volumes of @p plan over the periods of its window.
 *
 * Each needed volume is split in proportion to the baseline share of the
 * period; a metric with zero baseline over the window needs zero everywhere.
 * Rows are ordered by period number.
 */
std::vector<GoalPeriodRow> trackGoal(const projection::ProjectionResult &projection, const GoalPlan &plan,
                                     core::Granularity granularity);

} // namespace demanddna::goal
