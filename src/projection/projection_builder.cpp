#include "demand-dna/projection/projection_builder.hpp"
#include "demand-dna/events/shock_engine.hpp"
#include "demand-dna/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace demanddna::projection {

ProjectionResult::ProjectionResult(core::YearFrame frame, calibration::CalibrationConstants constants,
                                   std::vector<ProjectionRow> rows, double margin_fraction)
    : frame_(std::move(frame)), constants_(constants), rows_(std::move(rows)), margin_fraction_(margin_fraction) {
	if (rows_.size() != frame_.size()) {
		throw std::invalid_argument("Projection rows must match the year frame length.");
	}
}

std::size_t ProjectionResult::daysIn(const core::DateRange &window) const {
	return frame_.rowsIn(window).size();
}

core::MetricTotals ProjectionResult::baselineTotals(const core::DateRange &window) const {
	core::MetricTotals totals;
	for (const auto row : frame_.rowsIn(window)) {
		totals += rows_[row].baseline;
	}
	return totals;
}

core::MetricTotals ProjectionResult::simulationTotals(const core::DateRange &window) const {
	core::MetricTotals totals;
	for (const auto row : frame_.rowsIn(window)) {
		totals += rows_[row].simulation;
	}
	return totals;
}

core::MetricTotals ProjectionResult::baselineTotals() const {
	core::MetricTotals totals;
	for (const auto &row : rows_) {
		totals += row.baseline;
	}
	return totals;
}

core::MetricTotals ProjectionResult::simulationTotals() const {
	core::MetricTotals totals;
	for (const auto &row : rows_) {
		totals += row.simulation;
	}
	return totals;
}

ProjectionResult buildProjection(core::YearFrame frame, const calibration::CalibrationConstants &constants,
                                 const events::EventLog &log, double margin_fraction) {
	if (margin_fraction < 0.0 || margin_fraction > 1.0) {
		throw std::invalid_argument("Margin fraction must lie in [0, 1].");
	}
	const auto injections = events::buildInjections(frame, log);
	const auto &pre_trial = frame.layer(core::Layer::PreTrial);
	const auto &work = frame.layer(core::Layer::Work);
	const double low = 1.0 - margin_fraction;
	const double high = 1.0 + margin_fraction;

	std::vector<ProjectionRow> rows;
	rows.reserve(frame.size());
	for (std::size_t i = 0; i < frame.size(); ++i) {
		ProjectionRow row {frame.date(i)};

		row.baseline.sessions = constants.base_traffic * pre_trial.traffic[i];
		row.baseline.conversions = row.baseline.sessions * (constants.base_conversion_rate * pre_trial.conversion_rate[i]);
		row.baseline.revenue = row.baseline.conversions * (constants.base_order_value * pre_trial.order_value[i]);

		row.shock = events::shockMultiplier(row.date, log);
		const double sessions_std = constants.base_traffic * work.traffic[i] * (1.0 + row.shock);
		const double conversions_std = sessions_std * (constants.base_conversion_rate * work.conversion_rate[i]);
		const double revenue_std = conversions_std * (constants.base_order_value * work.order_value[i]);

		const auto &rel = injections.relative[i];
		const auto &abs = injections.absolute[i];
		row.simulation.sessions = sessions_std + row.baseline.sessions * rel.sessions + abs.sessions;
		row.simulation.conversions = conversions_std + row.baseline.conversions * rel.conversions + abs.conversions;
		row.simulation.revenue = revenue_std + row.baseline.revenue * rel.revenue + abs.revenue;

		row.baseline_min = row.baseline.scaled(low);
		row.baseline_max = row.baseline.scaled(high);
		row.simulation_min = row.simulation.scaled(low);
		row.simulation_max = row.simulation.scaled(high);
		rows.push_back(row);
	}
	DEMANDDNA_DEBUG("Projected {} days for {} with {} events.", rows.size(), frame.year(), log.size());
	return ProjectionResult(std::move(frame), constants, std::move(rows), margin_fraction);
}

} // namespace demanddna::projection
