#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-dna/events/shock_engine.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace demanddna::events;
using demanddna::core::CivilDate;
using demanddna::core::DateRange;
using demanddna::core::MetricTotals;
using demanddna::core::YearFrame;

TEST_CASE("Shape weights at the window boundaries", "[events][shock][shape]") {
	for (int elapsed = 0; elapsed <= 10; ++elapsed) {
		REQUIRE(shapeWeight(CampaignShape::Step, elapsed, 10) == 1.0);
	}
	REQUIRE(shapeWeight(CampaignShape::LinearFade, 0, 10) == Catch::Approx(1.0));
	REQUIRE(shapeWeight(CampaignShape::LinearFade, 5, 10) == Catch::Approx(0.5));
	REQUIRE(shapeWeight(CampaignShape::LinearFade, 10, 10) == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(shapeWeight(CampaignShape::FrontLoaded, 0, 10) == Catch::Approx(1.0));
	REQUIRE(shapeWeight(CampaignShape::FrontLoaded, 10, 10) == Catch::Approx(std::exp(-3.0)));
	REQUIRE(shapeWeight(CampaignShape::FrontLoaded, 100, 100) < 0.05);
}

TEST_CASE("Front-loaded weights decay monotonically", "[events][shock][shape]") {
	for (int elapsed = 1; elapsed < 20; ++elapsed) {
		REQUIRE(shapeWeight(CampaignShape::FrontLoaded, elapsed, 20) <
		        shapeWeight(CampaignShape::FrontLoaded, elapsed - 1, 20));
	}
}

TEST_CASE("Delayed peak is maximal at 40 percent and symmetric around it", "[events][shock][shape]") {
	REQUIRE(shapeWeight(CampaignShape::DelayedPeak, 4, 10) == Catch::Approx(1.0));
	for (int k = 1; k <= 4; ++k) {
		const double before = shapeWeight(CampaignShape::DelayedPeak, 4 - k, 10);
		const double after = shapeWeight(CampaignShape::DelayedPeak, 4 + k, 10);
		REQUIRE(before == Catch::Approx(after));
		REQUIRE(before < 1.0);
	}
}

TEST_CASE("Shape weights need a positive duration", "[events][shock][error]") {
	REQUIRE_THROWS_AS(shapeWeight(CampaignShape::Step, 0, 0), std::invalid_argument);
}

TEST_CASE("Overlapping shock lifts add up", "[events][shock]") {
	const ShockEvent first {DateRange(CivilDate(2025, 3, 1), CivilDate(2025, 3, 10)), CampaignShape::Step, 0.2};
	const ShockEvent second {DateRange(CivilDate(2025, 3, 5), CivilDate(2025, 3, 14)), CampaignShape::Step, 0.3};
	EventLog log({first, second});

	REQUIRE(shockLift(first, CivilDate(2025, 2, 28)) == 0.0);
	REQUIRE(shockMultiplier(CivilDate(2025, 3, 2), log) == Catch::Approx(0.2));
	REQUIRE(shockMultiplier(CivilDate(2025, 3, 7), log) == Catch::Approx(0.5));
	REQUIRE(shockMultiplier(CivilDate(2025, 3, 14), log) == Catch::Approx(0.3));
	REQUIRE(shockMultiplier(CivilDate(2025, 3, 15), log) == 0.0);

	const ShockEvent fade {DateRange::ofLength(CivilDate(2025, 4, 1), 4), CampaignShape::LinearFade, -0.4};
	REQUIRE(shockLift(fade, CivilDate(2025, 4, 3)) == Catch::Approx(-0.2));
}

TEST_CASE("Injections align signature days to the frame and drop overflow", "[events][shock][injection]") {
	ReappliedShockEvent absolute;
	absolute.signature_name = "year end";
	absolute.new_start = CivilDate(2025, 12, 30);
	absolute.duration = 3;
	absolute.absolute_deltas = {MetricTotals {10, 1, 100}, MetricTotals {20, 2, 200}, MetricTotals {30, 3, 300}};
	absolute.relative_fractions.assign(3, MetricTotals {0.5, 0.5, 0.5});

	ReappliedShockEvent relative = absolute;
	relative.mode = InjectionMode::Relative;
	relative.new_start = CivilDate(2025, 12, 31);

	const YearFrame frame(2025);
	const auto series = buildInjections(frame, EventLog({absolute, relative}));
	REQUIRE(series.absolute.size() == 365);
	REQUIRE(series.absolute[363].sessions == 10.0);
	REQUIRE(series.absolute[364].sessions == 20.0);
	REQUIRE(series.absolute[362].sessions == 0.0);
	REQUIRE(series.relative[364].revenue == 0.5);
	REQUIRE(series.relative[363].revenue == 0.0);
}

TEST_CASE("Injections starting before the year keep their day offsets", "[events][shock][injection]") {
	ReappliedShockEvent carried;
	carried.signature_name = "new year";
	carried.new_start = CivilDate(2024, 12, 30);
	carried.duration = 4;
	carried.absolute_deltas = {MetricTotals {10, 1, 100}, MetricTotals {20, 2, 200}, MetricTotals {30, 3, 300},
	                           MetricTotals {40, 4, 400}};
	carried.relative_fractions.assign(4, MetricTotals {});

	const YearFrame frame(2025);
	const auto series = buildInjections(frame, EventLog(std::vector<Event> {carried}));
	REQUIRE(series.absolute[0].sessions == 30.0);
	REQUIRE(series.absolute[1].conversions == 4.0);
	REQUIRE(series.absolute[2].revenue == 0.0);
}
