#include "demand-dna/profile/historical_profile.hpp"
#include "demand-dna/utils/logging.hpp"
#include "demand-dna/utils/statistics.hpp"

#include <map>
#include <utility>

namespace demanddna::profile {

namespace {

using PeriodSums = std::map<int, core::MetricTotals>;

constexpr core::Granularity kGranularities[] = {core::Granularity::Monthly, core::Granularity::Weekly,
                                                 core::Granularity::Daily};

// Divides every value by the median, or yields 1.0 throughout when the median is not positive.
std::vector<double> normalizeToMedian(const std::vector<double> &values) {
	const double med = utils::stats::median(values);
	std::vector<double> result(values.size(), 1.0);
	if (med <= 0.0) {
		return result;
	}
	for (std::size_t i = 0; i < values.size(); ++i) {
		result[i] = values[i] / med;
	}
	return result;
}

void appendGroup(const std::string &entity, std::optional<int> year, core::Granularity granularity,
                 const PeriodSums &sums, std::vector<HistoricalIndexRecord> &out) {
	std::vector<double> sessions;
	std::vector<double> rates;
	std::vector<double> order_values;
	sessions.reserve(sums.size());
	rates.reserve(sums.size());
	order_values.reserve(sums.size());
	for (const auto &entry : sums) {
		sessions.push_back(entry.second.sessions);
		rates.push_back(entry.second.conversionRate());
		order_values.push_back(entry.second.orderValue());
	}
	const auto idx_sessions = normalizeToMedian(sessions);
	const auto idx_rates = normalizeToMedian(rates);
	const auto idx_order_values = normalizeToMedian(order_values);

	std::size_t i = 0;
	for (const auto &entry : sums) {
		HistoricalIndexRecord record;
		record.entity = entity;
		record.year = year;
		record.granularity = granularity;
		record.period = entry.first;
		record.raw = entry.second;
		record.conversion_rate = rates[i];
		record.order_value = order_values[i];
		record.index = core::IndexTriple {idx_sessions[i], idx_rates[i], idx_order_values[i]};
		out.push_back(std::move(record));
		++i;
	}
}

} // namespace

HistoricalProfile buildProfiles(const std::vector<DailyRecord> &daily) {
	// entity -> year (nullopt = overall) -> granularity -> period -> sums
	std::map<std::string, std::map<std::optional<int>, std::map<int, PeriodSums>>> groups;
	for (const auto &row : daily) {
		const auto entity = normalizeEntity(row.entity);
		auto &by_year = groups[entity];
		for (const std::optional<int> year : {std::optional<int>(), std::optional<int>(row.date.year())}) {
			auto &by_granularity = by_year[year];
			for (const auto granularity : kGranularities) {
				by_granularity[static_cast<int>(granularity)][core::periodOf(row.date, granularity)] += row.totals;
			}
		}
	}

	std::vector<HistoricalIndexRecord> records;
	for (const auto &entity_entry : groups) {
		for (const auto &year_entry : entity_entry.second) {
			for (const auto granularity : kGranularities) {
				const auto it = year_entry.second.find(static_cast<int>(granularity));
				if (it == year_entry.second.end()) {
					continue;
				}
				appendGroup(entity_entry.first, year_entry.first, granularity, it->second, records);
			}
		}
	}
	DEMANDDNA_DEBUG("Built {} profile records for {} entities from {} daily rows.", records.size(), groups.size(),
	                daily.size());
	return HistoricalProfile(std::move(records));
}

std::vector<YearlyKpi> buildYearlyKpis(const std::vector<DailyRecord> &daily) {
	std::map<std::pair<std::string, int>, core::MetricTotals> totals;
	for (const auto &row : daily) {
		totals[{normalizeEntity(row.entity), row.date.year()}] += row.totals;
	}
	std::vector<YearlyKpi> result;
	result.reserve(totals.size());
	for (const auto &entry : totals) {
		YearlyKpi kpi;
		kpi.entity = entry.first.first;
		kpi.year = entry.first.second;
		kpi.totals = entry.second;
		kpi.conversion_rate = entry.second.conversionRate();
		kpi.order_value = entry.second.orderValue();
		result.push_back(std::move(kpi));
	}
	return result;
}

} // namespace demanddna::profile
