#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace demanddna::core {

/// Successive states of the seasonal index after scoped structural events.
enum class Layer {
	Pure,
	PreTrial,
	Work
};

/**
 * @struct IndexColumns
 * @brief Column-major index values of one layer, one entry per calendar day.
 */
struct IndexColumns {
	std::vector<double> traffic;
	std::vector<double> conversion_rate;
	std::vector<double> order_value;

	IndexTriple at(std::size_t row) const {
		return IndexTriple {traffic[row], conversion_rate[row], order_value[row]};
	}

	void set(std::size_t row, const IndexTriple &value) {
		traffic[row] = value.traffic;
		conversion_rate[row] = value.conversion_rate;
		order_value[row] = value.order_value;
	}

	/// The three columns, in traffic / conversion-rate / order-value order.
	std::array<std::vector<double> *, 3> all() {
		return {&traffic, &conversion_rate, &order_value};
	}
};

/**
 * @class YearFrame
 * @brief One row per calendar day of a projection year with its period keys
 * and the pure / pre-trial / work index layers.
 *
 * A frame is built from scratch for every evaluation; the layer compiler is
 * the only writer of the index layers.
 */
class YearFrame {
public:
	/**
	 * @brief Materializes every day of @p year with month, ISO week and
	 * day-of-year keys; all layers start at the neutral index 1.0.
	 */
	explicit YearFrame(int year);

	int year() const noexcept {
		return year_;
	}

	std::size_t size() const noexcept {
		return dates_.size();
	}

	const std::vector<CivilDate> &dates() const noexcept {
		return dates_;
	}

	const CivilDate &date(std::size_t row) const {
		return dates_.at(row);
	}

	int month(std::size_t row) const {
		return months_.at(row);
	}

	int week(std::size_t row) const {
		return weeks_.at(row);
	}

	int dayOfYear(std::size_t row) const {
		return days_of_year_.at(row);
	}

	/// Period key of a row at the given granularity.
	int period(std::size_t row, Granularity granularity) const;

	/// Row holding @p date, or nothing when the date lies outside the year.
	std::optional<std::size_t> rowOf(const CivilDate &date) const;

	/// Rows whose dates fall within @p range, in calendar order.
	std::vector<std::size_t> rowsIn(const DateRange &range) const;

	/// Rows whose period key at @p granularity equals @p period.
	std::vector<std::size_t> rowsForPeriod(Granularity granularity, int period) const;

	IndexColumns &layer(Layer layer) {
		return layers_[static_cast<std::size_t>(layer)];
	}

	const IndexColumns &layer(Layer layer) const {
		return layers_[static_cast<std::size_t>(layer)];
	}

private:
	int year_;
	std::int64_t first_day_key_;
	std::vector<CivilDate> dates_;
	std::vector<int> months_;
	std::vector<int> weeks_;
	std::vector<int> days_of_year_;
	std::array<IndexColumns, 3> layers_;
};

} // namespace demanddna::core
