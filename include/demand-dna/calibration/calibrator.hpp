#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/core/year_frame.hpp"

#include <optional>

namespace demanddna::calibration {

/**
 * @struct TrialObservation
 * @brief Recent window with known actual totals.
 *
 * Adjustment percentages strip (positive) or restore (negative) a known
 * distortion of the trial before calibration: adjusted = raw / (1 + pct/100).
 */
struct TrialObservation {
	core::DateRange window;
	core::MetricTotals observed;
	core::MetricTotals adjustment_pct;

	/// Observed totals with the adjustment percentages applied; a zero factor keeps the raw value.
	core::MetricTotals adjusted() const;
};

/**
 * @struct CalibrationConstants
 * @brief Absolute-unit constants that reproduce the trial totals from the pre-trial layer.
 */
struct CalibrationConstants {
	double base_traffic = 0.0;
	double base_conversion_rate = 0.0;
	double base_order_value = 0.0;
};

/**
 * @brief Anchors the pre-trial layer to the observed trial totals.
 *
 * base_traffic = sessions / sum(pre-trial traffic index over trial days);
 * base_conversion_rate = (conversions / sessions) / mean(pre-trial conversion-rate index);
 * base_order_value = (revenue / conversions) / mean(pre-trial order-value index).
 * Zero observed denominators give a zero trial ratio; a zero index mean keeps
 * the trial ratio unnormalized.
 *
 * @param frame Compiled year frame (its pre-trial layer is read).
 * @param trial Trial window; only the days inside the frame's year count.
 * @param totals Trial totals, already adjusted.
 * @return Nothing when the window has no days in the year or the traffic
 *         index sums to zero: the trial cannot be calibrated and must be widened.
 */
std::optional<CalibrationConstants> calibrate(const core::YearFrame &frame, const core::DateRange &trial,
                                              const core::MetricTotals &totals);

} // namespace demanddna::calibration
