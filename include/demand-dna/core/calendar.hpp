#pragma once

#include "demand-dna/core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace demanddna::core {

/**
 * @class CivilDate
 * @brief A proleptic Gregorian calendar date without time-of-day.
 *
 * Dates are validated on construction and convert to and from a day key
 * (days since 1970-01-01) so that day arithmetic and range membership are
 * plain integer operations.
 */
class CivilDate {
public:
	/// 1970-01-01
	CivilDate() : year_(1970), month_(1), day_(1) {}

	/**
	 * @brief Constructs a date.
	 * @throws std::invalid_argument if the month or day is out of range.
	 */
	CivilDate(int year, int month, int day);

	/**
	 * @brief Parses an ISO-8601 calendar date ("YYYY-MM-DD").
	 * @throws std::invalid_argument on malformed input.
	 */
	static CivilDate parse(const std::string &text);

	/// Builds a date from a day key (days since 1970-01-01).
	static CivilDate fromDayKey(std::int64_t day_key);

	int year() const noexcept {
		return year_;
	}
	int month() const noexcept {
		return month_;
	}
	int day() const noexcept {
		return day_;
	}

	/// Days since 1970-01-01.
	std::int64_t dayKey() const noexcept;

	/// 1-based day within the year.
	int dayOfYear() const noexcept;

	/// ISO-8601 week number (1..53); early-January days may belong to the previous ISO year.
	int isoWeek() const noexcept;

	/// ISO weekday, Monday = 1 .. Sunday = 7.
	int isoWeekday() const noexcept;

	CivilDate addDays(std::int64_t days) const;

	/// Signed number of days from this date to @p other.
	std::int64_t daysUntil(const CivilDate &other) const noexcept {
		return other.dayKey() - dayKey();
	}

	std::string toString() const;

	static bool isLeapYear(int year) noexcept;
	static int daysInMonth(int year, int month);
	static int daysInYear(int year) noexcept {
		return isLeapYear(year) ? 366 : 365;
	}

	friend bool operator==(const CivilDate &a, const CivilDate &b) noexcept {
		return a.year_ == b.year_ && a.month_ == b.month_ && a.day_ == b.day_;
	}
	friend bool operator!=(const CivilDate &a, const CivilDate &b) noexcept {
		return !(a == b);
	}
	friend bool operator<(const CivilDate &a, const CivilDate &b) noexcept {
		return a.dayKey() < b.dayKey();
	}
	friend bool operator<=(const CivilDate &a, const CivilDate &b) noexcept {
		return !(b < a);
	}
	friend bool operator>(const CivilDate &a, const CivilDate &b) noexcept {
		return b < a;
	}
	friend bool operator>=(const CivilDate &a, const CivilDate &b) noexcept {
		return !(a < b);
	}

private:
	int year_;
	int month_;
	int day_;
};

/**
 * @struct DateRange
 * @brief An inclusive range of calendar days.
 */
struct DateRange {
	CivilDate start;
	CivilDate end;

	/// Single-day range at the default date.
	DateRange() = default;

	/**
	 * @brief Constructs an inclusive range.
	 * @throws std::invalid_argument if end precedes start.
	 */
	DateRange(CivilDate start_date, CivilDate end_date);

	/// Range covering @p days consecutive days from @p start_date.
	static DateRange ofLength(CivilDate start_date, int days);

	bool contains(const CivilDate &date) const noexcept {
		return start <= date && date <= end;
	}

	/// Inclusive number of days.
	int dayCount() const noexcept {
		return static_cast<int>(start.daysUntil(end)) + 1;
	}

	std::vector<CivilDate> days() const;

	/// Sorted unique period indices (month, ISO week or day of year) covered by the range.
	std::vector<int> periodsCovered(Granularity granularity) const;

	/// Same window widened by @p days on either side.
	DateRange widened(int days) const;
};

/// Period index of a date at the given granularity.
int periodOf(const CivilDate &date, Granularity granularity);

} // namespace demanddna::core
