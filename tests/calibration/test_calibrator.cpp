#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/demand_fixtures.hpp"
#include "demand-dna/calibration/calibrator.hpp"

using namespace demanddna;
using namespace tests::fixtures;

TEST_CASE("Calibration reproduces the observed trial traffic", "[calibration][round_trip]") {
	core::YearFrame frame(kProjectionYear);
	auto &pre_trial = frame.layer(core::Layer::PreTrial);
	const DateRange trial(CivilDate(2025, 3, 1), CivilDate(2025, 3, 10));

	double index_sum = 0.0;
	for (const auto row : frame.rowsIn(trial)) {
		pre_trial.traffic[row] = 0.5 + 0.1 * static_cast<double>(row % 7);
		index_sum += pre_trial.traffic[row];
	}

	const auto constants = calibration::calibrate(frame, trial, totals(1234.0, 37.0, 4321.0));
	REQUIRE(constants.has_value());
	REQUIRE(constants->base_traffic * index_sum == Catch::Approx(1234.0));
	REQUIRE(constants->base_conversion_rate == Catch::Approx(37.0 / 1234.0));
	REQUIRE(constants->base_order_value == Catch::Approx(4321.0 / 37.0));
}

TEST_CASE("Calibration normalizes ratios by the mean pre-trial index", "[calibration]") {
	core::YearFrame frame(kProjectionYear);
	auto &pre_trial = frame.layer(core::Layer::PreTrial);
	const auto trial = januaryTrial();
	for (const auto row : frame.rowsIn(trial.window)) {
		pre_trial.conversion_rate[row] = 2.0;
		pre_trial.order_value[row] = 0.5;
	}

	const auto constants = calibration::calibrate(frame, trial.window, trial.observed);
	REQUIRE(constants.has_value());
	REQUIRE(constants->base_traffic == Catch::Approx(100.0));
	REQUIRE(constants->base_conversion_rate == Catch::Approx(0.01));
	REQUIRE(constants->base_order_value == Catch::Approx(200.0));
}

TEST_CASE("Calibration fails for a window outside the year", "[calibration][error]") {
	const core::YearFrame frame(kProjectionYear);
	const DateRange trial(CivilDate(2024, 1, 1), CivilDate(2024, 1, 30));
	REQUIRE_FALSE(calibration::calibrate(frame, trial, totals(3000, 60, 6000)).has_value());
}

TEST_CASE("Calibration fails when the traffic index sums to zero", "[calibration][error]") {
	core::YearFrame frame(kProjectionYear);
	const auto trial = januaryTrial();
	for (const auto row : frame.rowsIn(trial.window)) {
		frame.layer(core::Layer::PreTrial).traffic[row] = 0.0;
	}
	REQUIRE_FALSE(calibration::calibrate(frame, trial.window, trial.observed).has_value());
}

TEST_CASE("Calibration degrades zero denominators to zero ratios", "[calibration][edge]") {
	const core::YearFrame frame(kProjectionYear);
	const auto constants = calibration::calibrate(frame, januaryTrial().window, totals(3000, 0, 500));
	REQUIRE(constants.has_value());
	REQUIRE(constants->base_conversion_rate == 0.0);
	REQUIRE(constants->base_order_value == 0.0);
}

TEST_CASE("Trial adjustments strip a known distortion", "[calibration][adjustment]") {
	calibration::TrialObservation trial = januaryTrial();
	trial.observed = totals(1100.0, 50.0, 800.0);
	trial.adjustment_pct = totals(10.0, 0.0, -100.0);

	const auto adjusted = trial.adjusted();
	REQUIRE(adjusted.sessions == Catch::Approx(1000.0));
	REQUIRE(adjusted.conversions == Catch::Approx(50.0));
	// A -100% adjustment has no defined inverse and keeps the raw value.
	REQUIRE(adjusted.revenue == Catch::Approx(800.0));

	trial.adjustment_pct = totals(-20.0, 0.0, 0.0);
	REQUIRE(trial.adjusted().sessions == Catch::Approx(1375.0));
}

TEST_CASE("Calibration keeps the trial ratios when the index mean is zero", "[calibration][edge]") {
	core::YearFrame frame(kProjectionYear);
	auto &pre_trial = frame.layer(core::Layer::PreTrial);
	const auto trial = januaryTrial();
	for (const auto row : frame.rowsIn(trial.window)) {
		pre_trial.conversion_rate[row] = 0.0;
		pre_trial.order_value[row] = 0.0;
	}

	const auto constants = calibration::calibrate(frame, trial.window, trial.observed);
	REQUIRE(constants.has_value());
	REQUIRE(constants->base_traffic == Catch::Approx(100.0));
	REQUIRE(constants->base_conversion_rate == Catch::Approx(60.0 / 3000.0));
	REQUIRE(constants->base_order_value == Catch::Approx(6000.0 / 60.0));
}
