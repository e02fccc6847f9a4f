#include "demand-dna/signature/signature_extractor.hpp"
#include "demand-dna/utils/logging.hpp"
#include "demand-dna/utils/statistics.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace demanddna::signature {

namespace {

double relativeTo(double excess, double floor) {
	return floor > 0.0 ? excess / floor : 0.0;
}

} // namespace

std::vector<DailyTotals> aggregateDaily(const std::vector<profile::DailyRecord> &daily,
                                        const std::vector<std::string> &entities, const core::DateRange &range) {
	std::set<std::string> wanted;
	for (const auto &name : entities) {
		wanted.insert(profile::normalizeEntity(name));
	}
	std::map<std::int64_t, core::MetricTotals> by_day;
	for (const auto &record : daily) {
		if (!range.contains(record.date)) {
			continue;
		}
		if (!wanted.empty() && wanted.find(profile::normalizeEntity(record.entity)) == wanted.end()) {
			continue;
		}
		by_day[record.date.dayKey()] += record.totals;
	}
	std::vector<DailyTotals> result;
	result.reserve(by_day.size());
	for (const auto &entry : by_day) {
		result.push_back(DailyTotals {core::CivilDate::fromDayKey(entry.first), entry.second});
	}
	return result;
}

std::optional<ShockSignature> extractSignature(const std::vector<profile::DailyRecord> &daily,
                                               const ExtractionRequest &request) {
	const auto context = aggregateDaily(daily, request.entities, request.window.widened(request.context_days));

	std::vector<DailyTotals> window_days;
	std::copy_if(context.begin(), context.end(), std::back_inserter(window_days),
	             [&request](const DailyTotals &day) { return request.window.contains(day.date); });
	if (window_days.empty()) {
		DEMANDDNA_WARN("No data inside the shock window {} to {}.", request.window.start.toString(),
		               request.window.end.toString());
		return std::nullopt;
	}

	std::vector<double> sessions;
	std::vector<double> conversions;
	std::vector<double> revenue;
	for (const auto &day : window_days) {
		sessions.push_back(day.totals.sessions);
		conversions.push_back(day.totals.conversions);
		revenue.push_back(day.totals.revenue);
	}

	ShockSignature signature {request.name, request.window};
	signature.duration = request.window.dayCount();
	signature.floor = core::MetricTotals {utils::stats::quantile(sessions, request.floor_quantile),
	                                      utils::stats::quantile(conversions, request.floor_quantile),
	                                      utils::stats::quantile(revenue, request.floor_quantile)};
	signature.daily_excess.assign(static_cast<std::size_t>(signature.duration), core::MetricTotals {});
	signature.daily_relative.assign(static_cast<std::size_t>(signature.duration), core::MetricTotals {});

	for (const auto &day : window_days) {
		const auto offset = static_cast<std::size_t>(request.window.start.daysUntil(day.date));
		core::MetricTotals excess {std::max(0.0, day.totals.sessions - signature.floor.sessions),
		                           std::max(0.0, day.totals.conversions - signature.floor.conversions),
		                           std::max(0.0, day.totals.revenue - signature.floor.revenue)};
		signature.daily_excess[offset] = excess;
		signature.daily_relative[offset] = core::MetricTotals {relativeTo(excess.sessions, signature.floor.sessions),
		                                                       relativeTo(excess.conversions, signature.floor.conversions),
		                                                       relativeTo(excess.revenue, signature.floor.revenue)};
		signature.total_excess += excess;
	}

	if (signature.total_excess.sessions <= 0.0) {
		DEMANDDNA_WARN("No significant shock above the organic floor in {} to {}.", request.window.start.toString(),
		               request.window.end.toString());
		return std::nullopt;
	}

	signature.organic_conversion_rate = signature.floor.conversionRate();
	signature.event_conversion_rate = signature.total_excess.conversionRate();
	signature.conversion_rate_delta = signature.event_conversion_rate - signature.organic_conversion_rate;
	if (signature.name.empty()) {
		signature.name = "Shock " + request.window.start.toString() + "->" + request.window.end.toString();
	}
	signature.context = context;

	DEMANDDNA_INFO("Extracted signature '{}': {} days, +{:.0f} sessions, +{:.0f} conversions, +{:.2f} revenue.",
	               signature.name, signature.duration, signature.total_excess.sessions,
	               signature.total_excess.conversions, signature.total_excess.revenue);
	return signature;
}

events::ReappliedShockEvent reapplySignature(const ShockSignature &signature, const core::CivilDate &new_start,
                                             events::InjectionMode mode) {
	events::ReappliedShockEvent event {signature.name, mode, new_start};
	event.duration = signature.duration;
	event.absolute_deltas = signature.daily_excess;
	event.relative_fractions = signature.daily_relative;
	return event;
}

} // namespace demanddna::signature
