#include "demand-dna/settings/campaign_defaults.hpp"
#include "demand-dna/profile/historical_profile.hpp"

#include <stdexcept>

namespace demanddna::settings {

namespace {

std::string entryKey(const std::string &entity) {
	return entity == CampaignDefaults::kGlobalKey ? entity : profile::normalizeEntity(entity);
}

} // namespace

CampaignDefaults::CampaignDefaults() {
	auto &global = entries_[kGlobalKey];
	for (const auto shape : {events::CampaignShape::FrontLoaded, events::CampaignShape::LinearFade,
	                         events::CampaignShape::DelayedPeak, events::CampaignShape::Step}) {
		global[shape] = kBuiltinLiftPct;
	}
}

double CampaignDefaults::liftPercent(const std::string &entity, events::CampaignShape shape) const {
	const auto entity_it = entries_.find(entryKey(entity));
	if (entity_it != entries_.end()) {
		const auto it = entity_it->second.find(shape);
		if (it != entity_it->second.end()) {
			return it->second;
		}
	}
	const auto &global = entries_.at(kGlobalKey);
	const auto it = global.find(shape);
	return it != global.end() ? it->second : kBuiltinLiftPct;
}

void CampaignDefaults::set(const std::string &entity, events::CampaignShape shape, double lift_pct) {
	const auto key = entryKey(entity);
	if (key.empty()) {
		throw std::invalid_argument("Campaign defaults need a non-empty entity.");
	}
	if (lift_pct < -100.0) {
		throw std::invalid_argument("A campaign cannot remove more than all traffic.");
	}
	entries_[key][shape] = lift_pct;
}

bool CampaignDefaults::reset(const std::string &entity) {
	const auto key = entryKey(entity);
	if (key == kGlobalKey) {
		return false;
	}
	return entries_.erase(key) > 0;
}

std::vector<std::string> CampaignDefaults::entities() const {
	std::vector<std::string> names;
	for (const auto &entry : entries_) {
		if (entry.first != kGlobalKey) {
			names.push_back(entry.first);
		}
	}
	return names;
}

std::string CampaignDefaults::keyFor(const std::vector<std::string> &selected_entities) {
	return selected_entities.size() == 1 ? profile::normalizeEntity(selected_entities.front()) : kGlobalKey;
}

} // namespace demanddna::settings
