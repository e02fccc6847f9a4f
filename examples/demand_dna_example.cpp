#include "demand-dna/engine/forecaster.hpp"
#include "demand-dna/settings/campaign_defaults.hpp"
#include "demand-dna/signature/signature_library.hpp"
#include "demand-dna/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <vector>

using namespace demanddna;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<profile::DailyRecord> synthesizeHistory(const std::string &entity, int first_year, int last_year) {
	std::mt19937 rng(11);
	std::normal_distribution<double> noise(0.0, 0.05);

	std::vector<profile::DailyRecord> daily;
	const core::DateRange range(core::CivilDate(first_year, 1, 1), core::CivilDate(last_year, 12, 31));
	for (const auto &day : range.days()) {
		const double season = 1.0 + 0.3 * std::sin(2.0 * kPi * (day.dayOfYear() - 80) / 365.0);
		const double weekend = day.isoWeekday() >= 6 ? 1.15 : 1.0;
		const double growth = 1.0 + 0.08 * (day.year() - first_year);
		double sessions = 1200.0 * season * weekend * growth * (1.0 + noise(rng));
		double rate = 0.025 * (1.0 + 0.1 * std::cos(2.0 * kPi * day.month() / 12.0));
		double order_value = 80.0 + 10.0 * (day.month() == 12);

		// Black Friday week
		if (day.month() == 11 && day.day() >= 24 && day.day() <= 28) {
			sessions *= 2.2;
			rate *= 1.3;
		}
		const double conversions = sessions * rate;
		daily.push_back(profile::DailyRecord {entity, day, core::MetricTotals {sessions, conversions, conversions * order_value}});
	}
	return daily;
}

void printTotals(const std::string &label, const core::MetricTotals &totals) {
	std::cout << "  " << std::setw(12) << std::left << label << std::right << std::fixed << std::setprecision(0)
	          << std::setw(12) << totals.sessions << std::setw(10) << totals.conversions << std::setw(14)
	          << totals.revenue << '\n';
}

void printMonthly(const projection::ProjectionResult &result) {
	std::map<int, std::pair<core::MetricTotals, core::MetricTotals>> months;
	for (const auto &row : result.rows()) {
		auto &entry = months[row.date.month()];
		entry.first += row.baseline;
		entry.second += row.simulation;
	}
	std::cout << "  Month     Base sessions  Sim sessions   Base revenue    Sim revenue\n";
	for (const auto &entry : months) {
		std::cout << "  " << std::setw(5) << entry.first << std::fixed << std::setprecision(0) << std::setw(16)
		          << entry.second.first.sessions << std::setw(14) << entry.second.second.sessions << std::setw(15)
		          << entry.second.first.revenue << std::setw(15) << entry.second.second.revenue << '\n';
	}
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto daily = synthesizeHistory("Demo Store", 2022, 2024);
	const auto history = profile::buildProfiles(daily);

	calibration::TrialObservation trial;
	trial.window = core::DateRange(core::CivilDate(2025, 1, 6), core::CivilDate(2025, 2, 2));
	trial.observed = core::MetricTotals {33000.0, 700.0, 56000.0};

	const auto context =
	    engine::SimulationContext::builder().withEntities({"demo store"}).withTrial(trial).withProjectionYear(2025).build();
	const engine::DemandDnaForecaster forecaster(history, context);

	std::cout << "=== Demand DNA Scenario ===\n";
	std::cout << "Similarity weights\n";
	for (const auto &entry : forecaster.weights()) {
		std::cout << "  " << entry.first << ": " << std::fixed << std::setprecision(3) << entry.second << '\n';
	}

	signature::SignatureLibrary library;
	const core::DateRange black_friday_window(core::CivilDate(2024, 11, 20), core::CivilDate(2024, 12, 2));
	if (const auto extracted = forecaster.extractSignature(daily, black_friday_window, "Black Friday 2024")) {
		library.add(*extracted);
		std::cout << "\nExtracted '" << extracted->name << "': +" << std::setprecision(0)
		          << extracted->total_excess.sessions << " sessions, conversion rate delta " << std::setprecision(4)
		          << extracted->conversion_rate_delta << '\n';
	}

	const settings::CampaignDefaults defaults;
	const auto shape = events::campaignShapeFromName("Product Launch");

	events::EventLog log;
	log.append(events::CustomDragEvent {core::Granularity::Monthly, 1, 0.9, events::Scope::PreTrial});
	log.append(events::ShockEvent {core::DateRange(core::CivilDate(2025, 5, 5), core::CivilDate(2025, 5, 25)), shape,
	                               defaults.lift(settings::CampaignDefaults::keyFor(context.entities()), shape)});
	log.append(events::SwapEvent::periods(core::Granularity::Monthly, 7, 8));
	if (const auto black_friday = library.find("Black Friday 2024")) {
		log.append(signature::reapplySignature(*black_friday, core::CivilDate(2025, 11, 19),
		                                       events::InjectionMode::Relative));
	}

	const auto result = forecaster.project(log);
	if (!result) {
		std::cout << "Trial could not be calibrated; widen the trial period.\n";
		return 1;
	}

	std::cout << "\nCalibration: traffic " << std::setprecision(2) << result->constants().base_traffic
	          << ", conversion rate " << std::setprecision(4) << result->constants().base_conversion_rate
	          << ", order value " << std::setprecision(2) << result->constants().base_order_value << "\n\n";
	printMonthly(*result);

	std::cout << "\nYear totals        sessions  conversions     revenue\n";
	printTotals("Baseline", result->baselineTotals());
	printTotals("Simulation", result->simulationTotals());

	goal::TargetSpec target;
	target.metric = goal::TargetMetric::Revenue;
	target.value = goal::targetFromGrowth(result->baselineTotals().revenue, 12.0);
	target.window = core::DateRange(core::CivilDate(2025, 1, 1), core::CivilDate(2025, 12, 31));

	if (const auto report = forecaster.attribute(log, target)) {
		std::cout << "\nGap attribution (" << core::toString(report->metric) << ", gap " << std::setprecision(0)
		          << report->total_gap << ")\n";
		for (const auto &row : report->rows) {
			std::cout << "  #" << row.index << " " << std::setw(16) << std::left << row.kind << std::right
			          << std::setw(12) << std::setprecision(0) << row.contribution << std::setw(8)
			          << std::setprecision(1) << row.gap_coverage_pct << "%  " << row.description << '\n';
		}
	}

	if (const auto plan = forecaster.translateTarget(log, target)) {
		std::cout << "\nTarget needs\n";
		printTotals("Needed", plan->needed.totals);
		printTotals("Before", plan->before.totals);
		printTotals("After", plan->after.totals);
	}

	return 0;
}
