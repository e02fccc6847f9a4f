#include "demand-dna/dna/blender.hpp"
#include "demand-dna/utils/logging.hpp"
#include "demand-dna/utils/statistics.hpp"

#include <stdexcept>
#include <utility>

namespace demanddna::dna {

namespace {

struct IndexSamples {
	std::vector<double> traffic;
	std::vector<double> conversion_rate;
	std::vector<double> order_value;

	void add(const core::IndexTriple &value) {
		traffic.push_back(value.traffic);
		conversion_rate.push_back(value.conversion_rate);
		order_value.push_back(value.order_value);
	}

	core::IndexTriple medians() const {
		return core::IndexTriple {utils::stats::median(traffic), utils::stats::median(conversion_rate),
		                          utils::stats::median(order_value)};
	}
};

} // namespace

PureDna::PureDna(std::map<int, core::IndexTriple> months) : months_(std::move(months)) {
	for (const auto &entry : months_) {
		if (entry.first < 1 || entry.first > 12) {
			throw std::invalid_argument("PureDna month keys must be in [1, 12].");
		}
	}
}

PureDna PureDna::flat(const core::IndexTriple &value) {
	std::map<int, core::IndexTriple> months;
	for (int m = 1; m <= 12; ++m) {
		months[m] = value;
	}
	return PureDna(std::move(months));
}

std::optional<core::IndexTriple> PureDna::month(int month) const {
	const auto it = months_.find(month);
	if (it == months_.end()) {
		return std::nullopt;
	}
	return it->second;
}

core::IndexTriple PureDna::monthOrNeutral(int month) const {
	return this->month(month).value_or(core::IndexTriple::neutral());
}

PureDna blendPureDna(const profile::HistoricalProfile &profile, const std::vector<std::string> &entities,
                     const SimilarityWeights &weights, double overall_share) {
	if (overall_share < 0.0 || overall_share > 1.0) {
		throw std::invalid_argument("Overall share must lie in [0, 1].");
	}
	std::map<int, IndexSamples> overall_samples;
	std::map<int, std::map<int, IndexSamples>> yearly_samples;
	for (const auto &record : profile.select(entities, core::Granularity::Monthly)) {
		if (record.isOverall()) {
			overall_samples[record.period].add(record.index);
		} else {
			yearly_samples[*record.year][record.period].add(record.index);
		}
	}

	const double historical_share = 1.0 - overall_share;
	std::map<int, core::IndexTriple> months;
	for (const auto &overall_entry : overall_samples) {
		const int month = overall_entry.first;
		const auto overall = overall_entry.second.medians();

		core::IndexTriple blended {overall.traffic * overall_share, overall.conversion_rate * overall_share,
		                           overall.order_value * overall_share};
		for (const auto &weight_entry : weights) {
			core::IndexTriple contribution = overall;
			const auto year_it = yearly_samples.find(weight_entry.first);
			if (year_it != yearly_samples.end()) {
				const auto month_it = year_it->second.find(month);
				if (month_it != year_it->second.end()) {
					contribution = month_it->second.medians();
				}
			}
			const double w = historical_share * weight_entry.second;
			blended.traffic += contribution.traffic * w;
			blended.conversion_rate += contribution.conversion_rate * w;
			blended.order_value += contribution.order_value * w;
		}
		months[month] = blended;
	}
	if (months.size() < 12) {
		DEMANDDNA_WARN("Pure DNA covers {} of 12 months; unmapped months stay neutral.", months.size());
	}
	DEMANDDNA_DEBUG("Blended pure DNA from {} weighted years.", weights.size());
	return PureDna(std::move(months));
}

} // namespace demanddna::dna
