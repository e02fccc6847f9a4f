#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/demand_fixtures.hpp"
#include "demand-dna/engine/forecaster.hpp"
#include "demand-dna/engine/pipeline.hpp"

using namespace demanddna;
using namespace tests::fixtures;

namespace {

profile::HistoricalProfile flatHistory() {
	auto daily = constantDaily("Shop", DateRange(CivilDate(2023, 1, 1), CivilDate(2023, 12, 31)), totals(100, 2, 200));
	const auto later = constantDaily("Shop", DateRange(CivilDate(2024, 1, 1), CivilDate(2024, 12, 31)), totals(120, 2, 200));
	daily.insert(daily.end(), later.begin(), later.end());
	return profile::buildProfiles(daily);
}

} // namespace

TEST_CASE("runProjection calibrates against the adjusted trial", "[engine][pipeline]") {
	auto trial = januaryTrial();
	trial.adjustment_pct = totals(20.0, 0.0, 0.0);
	const auto context = engine::SimulationContext::builder().withEntities({"shop"}).withTrial(trial).build();

	const auto result = engine::runProjection(dna::PureDna::flat(), context, events::EventLog());
	REQUIRE(result.has_value());
	REQUIRE(result->constants().base_traffic == Catch::Approx(2500.0 / 30.0));
	REQUIRE(result->baselineTotals(trial.window).sessions == Catch::Approx(2500.0));
}

TEST_CASE("runProjection reports an uncalibratable trial", "[engine][pipeline][error]") {
	events::EventLog log;
	log.append(events::CustomDragEvent {core::Granularity::Monthly, 1, 0.0, events::Scope::PreTrial});
	REQUIRE_FALSE(engine::runProjection(dna::PureDna::flat(), januaryContext(), log).has_value());

	const auto totals_window =
	    engine::evaluateWindow(dna::PureDna::flat(), januaryContext(), log, januaryTrial().window);
	REQUIRE(totals_window.simulation.revenue == 0.0);
	REQUIRE(totals_window.baseline.sessions == 0.0);
}

TEST_CASE("Forecaster derives weights and DNA once from history", "[engine][forecaster]") {
	const engine::DemandDnaForecaster forecaster(flatHistory(), januaryContext({"SHOP"}));

	REQUIRE(forecaster.weights().size() == 2);
	REQUIRE(forecaster.weights().at(2023) > forecaster.weights().at(2024));
	REQUIRE(forecaster.weights().at(2023) + forecaster.weights().at(2024) == Catch::Approx(1.0));
	REQUIRE(forecaster.pureDna().months().size() == 12);
	REQUIRE(forecaster.pureDna().month(1)->traffic == Catch::Approx(1.0));
	// Shorter months carry less traffic.
	REQUIRE(forecaster.pureDna().month(2)->traffic < 1.0);
	REQUIRE(forecaster.context().projectionYear() == kProjectionYear);
}

TEST_CASE("Forecaster projections reproduce the trial", "[engine][forecaster]") {
	const engine::DemandDnaForecaster forecaster(flatHistory(), januaryContext());
	const auto result = forecaster.project(events::EventLog());
	REQUIRE(result.has_value());
	expectTotalsApprox(result->baselineTotals(januaryTrial().window), totals(3000, 60, 6000), 1e-6);
}

TEST_CASE("Forecaster answers attribution and target questions", "[engine][forecaster]") {
	const engine::DemandDnaForecaster forecaster(flatHistory(), januaryContext());
	events::EventLog log;
	log.append(events::ShockEvent {DateRange::ofLength(CivilDate(2025, 9, 1), 14), events::CampaignShape::FrontLoaded, 0.4});

	goal::TargetSpec target;
	target.metric = goal::TargetMetric::Conversions;
	target.value = 80.0;
	target.window = DateRange(CivilDate(2025, 9, 1), CivilDate(2025, 9, 30));

	const auto report = forecaster.attribute(log, target);
	REQUIRE(report.has_value());
	REQUIRE(report->rows.size() == 1);
	REQUIRE(report->rows[0].contribution > 0.0);
	REQUIRE(report->totalContribution() == Catch::Approx(report->full_log - report->organic));

	const auto plan = forecaster.translateTarget(log, target);
	REQUIRE(plan.has_value());
	REQUIRE(plan->needed.totals.conversions == Catch::Approx(80.0));
	REQUIRE(plan->after.totals.conversions > plan->before.totals.conversions);
}

TEST_CASE("Forecaster extracts signatures with the configured floor and context", "[engine][forecaster][signature]") {
	const DateRange window(CivilDate(2024, 6, 1), CivilDate(2024, 6, 10));
	// Flat 100 sessions a day, ramping 100, 110, ..., 190 inside the window.
	auto daily = constantDaily("Shop", DateRange(CivilDate(2024, 5, 25), CivilDate(2024, 6, 15)), totals(100, 2, 200));
	for (auto &row : daily) {
		const auto offset = window.start.daysUntil(row.date);
		if (offset >= 0 && offset < 10) {
			row.totals.sessions = 100.0 + 10.0 * static_cast<double>(offset);
		}
	}

	const engine::DemandDnaForecaster defaults(flatHistory(), januaryContext());
	const auto standard = defaults.extractSignature(daily, window, "ramp");
	REQUIRE(standard.has_value());
	REQUIRE(standard->name == "ramp");
	REQUIRE(standard->floor.sessions == Catch::Approx(109.0));
	REQUIRE(standard->context.size() == 22);

	engine::EngineConfig config;
	config.floor_quantile = 0.5;
	config.context_days = 2;
	const auto context = engine::SimulationContext::builder()
	                         .withProjectionYear(kProjectionYear)
	                         .withEntities({"shop"})
	                         .withTrial(januaryTrial())
	                         .withConfig(config)
	                         .build();
	const engine::DemandDnaForecaster tuned(flatHistory(), context);
	const auto median_floor = tuned.extractSignature(daily, window);
	REQUIRE(median_floor.has_value());
	REQUIRE(median_floor->floor.sessions == Catch::Approx(145.0));
	REQUIRE(median_floor->total_excess.sessions == Catch::Approx(5.0 + 15.0 + 25.0 + 35.0 + 45.0));
	REQUIRE(median_floor->context.size() == 14);
}
