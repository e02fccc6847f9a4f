#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace demanddna::profile {

/**
 * @struct HistoricalIndexRecord
 * @brief Seasonal profile of one entity for one period of one year (or of the
 * "overall" pseudo-year spanning all years).
 */
struct HistoricalIndexRecord {
	std::string entity;
	/// Calendar year, or nothing for the "overall" pseudo-year.
	std::optional<int> year;
	core::Granularity granularity = core::Granularity::Monthly;
	int period = 0;

	core::MetricTotals raw;
	double conversion_rate = 0.0;
	double order_value = 0.0;

	core::IndexTriple index;

	bool isOverall() const noexcept {
		return !year.has_value();
	}
};

/**
 * @struct DailyRecord
 * @brief Raw daily traffic, conversions and revenue of one entity.
 */
struct DailyRecord {
	std::string entity;
	core::CivilDate date;
	core::MetricTotals totals;
};

/// Trims surrounding whitespace and lower-cases an entity name.
std::string normalizeEntity(const std::string &name);

/**
 * @class HistoricalProfile
 * @brief Immutable store of historical index records.
 *
 * Entity names are normalized on insertion so that queries are insensitive
 * to case and surrounding whitespace.
 */
class HistoricalProfile {
public:
	HistoricalProfile() = default;
	explicit HistoricalProfile(std::vector<HistoricalIndexRecord> records);

	const std::vector<HistoricalIndexRecord> &records() const noexcept {
		return records_;
	}

	bool empty() const noexcept {
		return records_.empty();
	}

	std::size_t size() const noexcept {
		return records_.size();
	}

	/// Sorted distinct entity names.
	std::vector<std::string> entities() const;

	/// Sorted distinct calendar years (the overall pseudo-year excluded).
	std::vector<int> years() const;

	/**
	 * @brief Records of the selected entities at one granularity.
	 * @param entities Entity names; an empty selection matches every entity.
	 */
	std::vector<HistoricalIndexRecord> select(const std::vector<std::string> &entities,
	                                          core::Granularity granularity) const;

private:
	std::vector<HistoricalIndexRecord> records_;
};

/**
 * @struct YearlyKpi
 * @brief Annual totals of one entity, used to derive growth targets.
 */
struct YearlyKpi {
	std::string entity;
	int year = 0;
	core::MetricTotals totals;
	double conversion_rate = 0.0;
	double order_value = 0.0;
};

/**
 * @brief Builds monthly, weekly and daily index records from raw daily data.
 *
 * For each entity the "overall" pseudo-year and every calendar year are
 * grouped by period and summed; each index is the period value divided by
 * the median over periods, or 1.0 throughout when that median is not positive.
 */
HistoricalProfile buildProfiles(const std::vector<DailyRecord> &daily);

/// Annual totals per entity and year, sorted by entity then year.
std::vector<YearlyKpi> buildYearlyKpis(const std::vector<DailyRecord> &daily);

} // namespace demanddna::profile
