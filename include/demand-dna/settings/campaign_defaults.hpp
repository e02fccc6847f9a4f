#pragma once

#include "demand-dna/events/event.hpp"

#include <map>
#include <string>
#include <vector>

namespace demanddna::settings {

/**
 * @class CampaignDefaults
 * @brief Default traffic lift (in percent) per entity and campaign shape.
 *
 * Entity entries override the global entry; shapes without any entry use
 * kBuiltinLiftPct. Entity keys are normalized like profile entities.
 */
class CampaignDefaults {
public:
	static constexpr const char *kGlobalKey = "__all__";
	static constexpr double kBuiltinLiftPct = 25.0;

	/// Global entry set to the built-in lift for every shape.
	CampaignDefaults();

	/// Lift percentage used to pre-populate a new Shock for @p entity.
	double liftPercent(const std::string &entity, events::CampaignShape shape) const;

	/// liftPercent() as a lift fraction (25% -> 0.25).
	double lift(const std::string &entity, events::CampaignShape shape) const {
		return liftPercent(entity, shape) / 100.0;
	}

	/// Stores a default; @p entity may be kGlobalKey.
	void set(const std::string &entity, events::CampaignShape shape, double lift_pct);

	/// Drops the overrides of @p entity. The global entry cannot be removed.
	bool reset(const std::string &entity);

	/// Entities with their own entries, excluding the global key.
	std::vector<std::string> entities() const;

	/// Key to read defaults for: the entity itself when exactly one is selected, else the global key.
	static std::string keyFor(const std::vector<std::string> &selected_entities);

private:
	std::map<std::string, std::map<events::CampaignShape, double>> entries_;
};

} // namespace demanddna::settings
