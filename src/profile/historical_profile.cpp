#include "demand-dna/profile/historical_profile.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace demanddna::profile {

std::string normalizeEntity(const std::string &name) {
	auto first = std::find_if_not(name.begin(), name.end(), [](unsigned char c) { return std::isspace(c); });
	auto last = std::find_if_not(name.rbegin(), name.rend(), [](unsigned char c) { return std::isspace(c); }).base();
	std::string result = first < last ? std::string(first, last) : std::string();
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

HistoricalProfile::HistoricalProfile(std::vector<HistoricalIndexRecord> records) : records_(std::move(records)) {
	for (auto &record : records_) {
		record.entity = normalizeEntity(record.entity);
	}
}

std::vector<std::string> HistoricalProfile::entities() const {
	std::set<std::string> names;
	for (const auto &record : records_) {
		names.insert(record.entity);
	}
	return std::vector<std::string>(names.begin(), names.end());
}

std::vector<int> HistoricalProfile::years() const {
	std::set<int> years;
	for (const auto &record : records_) {
		if (record.year) {
			years.insert(*record.year);
		}
	}
	return std::vector<int>(years.begin(), years.end());
}

std::vector<HistoricalIndexRecord> HistoricalProfile::select(const std::vector<std::string> &entities,
                                                             core::Granularity granularity) const {
	std::set<std::string> wanted;
	for (const auto &name : entities) {
		wanted.insert(normalizeEntity(name));
	}
	std::vector<HistoricalIndexRecord> result;
	for (const auto &record : records_) {
		if (record.granularity != granularity) {
			continue;
		}
		if (!wanted.empty() && wanted.find(record.entity) == wanted.end()) {
			continue;
		}
		result.push_back(record);
	}
	return result;
}

} // namespace demanddna::profile
