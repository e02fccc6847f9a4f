#include "demand-dna/goal/target_translation.hpp"
#include "demand-dna/utils/logging.hpp"

#include <array>
#include <map>

namespace demanddna::goal {

namespace {

double ratio(double numerator, double denominator) {
	return denominator > 0.0 ? numerator / denominator : 0.0;
}

constexpr std::array<core::Metric, 3> kVolumes = {core::Metric::Sessions, core::Metric::Conversions,
                                                  core::Metric::Revenue};

} // namespace

std::string toString(TargetMetric metric) {
	switch (metric) {
	case TargetMetric::Sessions:
		return "Sessions";
	case TargetMetric::Conversions:
		return "Conversions";
	case TargetMetric::Revenue:
		return "Revenue";
	case TargetMetric::ConversionRate:
		return "Conversion Rate";
	case TargetMetric::OrderValue:
		return "Order Value";
	}
	return "Unknown";
}

std::string toString(VolumeDriver driver) {
	switch (driver) {
	case VolumeDriver::Traffic:
		return "Traffic";
	case VolumeDriver::ConversionRate:
		return "Conversion Rate";
	case VolumeDriver::OrderValue:
		return "Order Value";
	}
	return "Unknown";
}

core::Metric gapMetric(TargetMetric metric) noexcept {
	switch (metric) {
	case TargetMetric::Sessions:
		return core::Metric::Sessions;
	case TargetMetric::Conversions:
		return core::Metric::Conversions;
	default:
		return core::Metric::Revenue;
	}
}

double targetFromGrowth(double base_value, double growth_pct) noexcept {
	return base_value * (1.0 + growth_pct / 100.0);
}

KpiSnapshot KpiSnapshot::of(const core::MetricTotals &totals) {
	KpiSnapshot snapshot;
	snapshot.totals = totals;
	snapshot.conversion_rate = totals.conversionRate();
	snapshot.order_value = totals.orderValue();
	return snapshot;
}

std::optional<GoalPlan> translateTarget(const projection::ProjectionResult &projection, const TargetSpec &target) {
	if (projection.daysIn(target.window) == 0) {
		DEMANDDNA_WARN("Target window {} to {} has no days in {}.", target.window.start.toString(),
		               target.window.end.toString(), projection.frame().year());
		return std::nullopt;
	}

	const auto base = projection.baselineTotals(target.window);
	const auto &constants = projection.constants();
	const double eff_aov = base.conversions > 0.0 ? base.revenue / base.conversions : constants.base_order_value;
	const double eff_cr = base.sessions > 0.0 ? base.conversions / base.sessions : constants.base_conversion_rate;

	const double tv = target.value;
	core::MetricTotals need;
	switch (target.metric) {
	case TargetMetric::Revenue:
		need.revenue = tv;
		if (target.driver == VolumeDriver::Traffic) {
			need.conversions = ratio(tv, eff_aov);
			need.sessions = ratio(need.conversions, eff_cr);
		} else if (target.driver == VolumeDriver::ConversionRate) {
			need.sessions = base.sessions;
			need.conversions = ratio(tv, eff_aov);
		} else {
			need.sessions = base.sessions;
			need.conversions = base.conversions;
		}
		break;
	case TargetMetric::Conversions:
		need.conversions = tv;
		need.revenue = tv * eff_aov;
		need.sessions = target.driver == VolumeDriver::Traffic ? ratio(tv, eff_cr) : base.sessions;
		break;
	case TargetMetric::Sessions:
		need.sessions = tv;
		need.conversions = tv * eff_cr;
		need.revenue = need.conversions * eff_aov;
		break;
	case TargetMetric::ConversionRate:
		need.sessions = base.sessions;
		need.conversions = base.sessions * tv;
		need.revenue = need.conversions * eff_aov;
		break;
	case TargetMetric::OrderValue:
		need.sessions = base.sessions;
		need.conversions = base.conversions;
		need.revenue = base.conversions * tv;
		break;
	}

	GoalPlan plan;
	plan.target = target;
	plan.needed = KpiSnapshot::of(need);
	plan.before.totals = base;
	plan.before.conversion_rate = eff_cr;
	plan.before.order_value = eff_aov;
	plan.after = KpiSnapshot::of(projection.simulationTotals(target.window));

	DEMANDDNA_DEBUG("{} target {} via {}: needs {:.1f} sessions, {:.1f} conversions, {:.2f} revenue.",
	                toString(target.metric), tv, toString(target.driver), need.sessions, need.conversions,
	                need.revenue);
	return plan;
}

std::vector<GoalPeriodRow> trackGoal(const projection::ProjectionResult &projection, const GoalPlan &plan,
                                     core::Granularity granularity) {
	const auto &frame = projection.frame();
	const auto &rows = projection.rows();

	std::map<int, GoalPeriodRow> periods;
	for (const auto row : frame.rowsIn(plan.target.window)) {
		const int key = frame.period(row, granularity);
		auto it = periods.find(key);
		if (it == periods.end()) {
			GoalPeriodRow entry;
			entry.period = key;
			entry.first_date = rows[row].date;
			it = periods.emplace(key, entry).first;
		}
		it->second.baseline += rows[row].baseline;
		it->second.simulation += rows[row].simulation;
	}

	const auto window_base = projection.baselineTotals(plan.target.window);

	std::vector<GoalPeriodRow> result;
	result.reserve(periods.size());
	for (auto &entry : periods) {
		auto &row = entry.second;
		for (const auto metric : kVolumes) {
			const double total = window_base.get(metric);
			const double needed = total > 0.0 ? plan.needed.totals.get(metric) * row.baseline.get(metric) / total : 0.0;
			row.needed.get(metric) = needed;
			row.baseline_gap.get(metric) = row.baseline.get(metric) - needed;
			row.simulation_gap.get(metric) = row.simulation.get(metric) - needed;
		}
		result.push_back(row);
	}
	return result;
}

} // namespace demanddna::goal
