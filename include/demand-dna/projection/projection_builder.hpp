#pragma once

#include "demand-dna/calibration/calibrator.hpp"
#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/core/year_frame.hpp"
#include "demand-dna/events/event_log.hpp"

#include <cstddef>
#include <vector>

namespace demanddna::projection {

/**
 * @struct ProjectionRow
 * @brief Baseline and simulated demand of one calendar day with fixed-percentage bands.
 */
struct ProjectionRow {
	core::CivilDate date;
	/// Summed lift of the active Shock events.
	double shock = 0.0;

	core::MetricTotals baseline;
	core::MetricTotals baseline_min;
	core::MetricTotals baseline_max;

	core::MetricTotals simulation;
	core::MetricTotals simulation_min;
	core::MetricTotals simulation_max;
};

/**
 * @class ProjectionResult
 * @brief Compiled year frame extended with baseline / simulation series.
 */
class ProjectionResult {
public:
	ProjectionResult(core::YearFrame frame, calibration::CalibrationConstants constants,
	                 std::vector<ProjectionRow> rows, double margin_fraction);

	const core::YearFrame &frame() const noexcept {
		return frame_;
	}

	const calibration::CalibrationConstants &constants() const noexcept {
		return constants_;
	}

	const std::vector<ProjectionRow> &rows() const noexcept {
		return rows_;
	}

	double marginFraction() const noexcept {
		return margin_fraction_;
	}

	/// Number of projection days inside @p window.
	std::size_t daysIn(const core::DateRange &window) const;

	/// Baseline totals over the days of @p window inside the projection year.
	core::MetricTotals baselineTotals(const core::DateRange &window) const;

	/// Simulation totals over the days of @p window inside the projection year.
	core::MetricTotals simulationTotals(const core::DateRange &window) const;

	/// Baseline totals over the full year.
	core::MetricTotals baselineTotals() const;

	/// Simulation totals over the full year.
	core::MetricTotals simulationTotals() const;

private:
	core::YearFrame frame_;
	calibration::CalibrationConstants constants_;
	std::vector<ProjectionRow> rows_;
	double margin_fraction_;
};

/**
 * @brief Builds baseline and simulation series for every day of @p frame.
 *
 * Baseline uses the pre-trial layer and no shocks:
 *   sessions = base_traffic * traffic_idx, conversions = sessions * base_cr * cr_idx,
 *   revenue = conversions * base_ov * ov_idx.
 * Simulation uses the work layer with the shock lift applied to sessions and
 * chained into conversions and revenue, then adds re-applied signatures:
 *   metric_sim = metric_standard + metric_baseline * relative + absolute.
 * Bands are (1 -/+ margin_fraction) times the central value.
 */
ProjectionResult buildProjection(core::YearFrame frame, const calibration::CalibrationConstants &constants,
                                 const events::EventLog &log, double margin_fraction = 0.15);

} // namespace demanddna::projection
