#include "demand-dna/calibration/calibrator.hpp"
#include "demand-dna/utils/logging.hpp"

namespace demanddna::calibration {

namespace {

double stripAdjustment(double raw, double pct) {
	const double factor = 1.0 + pct / 100.0;
	return factor != 0.0 ? raw / factor : raw;
}

} // namespace

core::MetricTotals TrialObservation::adjusted() const {
	return core::MetricTotals {stripAdjustment(observed.sessions, adjustment_pct.sessions),
	                           stripAdjustment(observed.conversions, adjustment_pct.conversions),
	                           stripAdjustment(observed.revenue, adjustment_pct.revenue)};
}

std::optional<CalibrationConstants> calibrate(const core::YearFrame &frame, const core::DateRange &trial,
                                              const core::MetricTotals &totals) {
	const auto rows = frame.rowsIn(trial);
	if (rows.empty()) {
		DEMANDDNA_WARN("Trial window {} to {} has no days in {}; widen the trial period.", trial.start.toString(),
		               trial.end.toString(), frame.year());
		return std::nullopt;
	}

	const auto &pre_trial = frame.layer(core::Layer::PreTrial);
	double traffic_sum = 0.0;
	double rate_sum = 0.0;
	double order_value_sum = 0.0;
	for (const auto row : rows) {
		traffic_sum += pre_trial.traffic[row];
		rate_sum += pre_trial.conversion_rate[row];
		order_value_sum += pre_trial.order_value[row];
	}
	if (traffic_sum == 0.0) {
		DEMANDDNA_WARN("Pre-trial traffic index sums to zero over the trial window; widen the trial period.");
		return std::nullopt;
	}
	const double n = static_cast<double>(rows.size());
	const double rate_mean = rate_sum / n;
	const double order_value_mean = order_value_sum / n;

	const double trial_rate = totals.sessions > 0.0 ? totals.conversions / totals.sessions : 0.0;
	const double trial_order_value = totals.conversions > 0.0 ? totals.revenue / totals.conversions : 0.0;

	CalibrationConstants constants;
	constants.base_traffic = totals.sessions / traffic_sum;
	constants.base_conversion_rate = rate_mean > 0.0 ? trial_rate / rate_mean : trial_rate;
	constants.base_order_value = order_value_mean > 0.0 ? trial_order_value / order_value_mean : trial_order_value;

	DEMANDDNA_DEBUG("Calibrated over {} trial days: traffic {:.4f}, conversion rate {:.6f}, order value {:.4f}",
	                rows.size(), constants.base_traffic, constants.base_conversion_rate, constants.base_order_value);
	return constants;
}

} // namespace demanddna::calibration
