#include "demand-dna/core/calendar.hpp"

#include <cstdio>
#include <set>
#include <stdexcept>

namespace demanddna::core {

namespace {

// Civil-from-days and days-from-civil conversions on the proleptic Gregorian
// calendar, using 400-year eras starting on March 1st.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int &year, int &month, int &day) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	year = static_cast<int>(y + (m <= 2 ? 1 : 0));
	month = static_cast<int>(m);
	day = static_cast<int>(d);
}

int isoWeeksInYear(int year) {
	const CivilDate jan_first(year, 1, 1);
	const int weekday = jan_first.isoWeekday();
	if (weekday == 4) {
		return 53;
	}
	if (weekday == 3 && CivilDate::isLeapYear(year)) {
		return 53;
	}
	return 52;
}

} // namespace

CivilDate::CivilDate(int year, int month, int day) : year_(year), month_(month), day_(day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12], got " + std::to_string(month) + ".");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day " + std::to_string(day) + " is out of range for " +
		                            std::to_string(year) + "-" + std::to_string(month) + ".");
	}
}

CivilDate CivilDate::parse(const std::string &text) {
	int y = 0;
	int m = 0;
	int d = 0;
	char trailing = '\0';
	if (std::sscanf(text.c_str(), "%d-%d-%d%c", &y, &m, &d, &trailing) != 3) {
		throw std::invalid_argument("Expected a date formatted as YYYY-MM-DD, got '" + text + "'.");
	}
	return CivilDate(y, m, d);
}

CivilDate CivilDate::fromDayKey(std::int64_t day_key) {
	int y = 0;
	int m = 0;
	int d = 0;
	civilFromDays(day_key, y, m, d);
	return CivilDate(y, m, d);
}

std::int64_t CivilDate::dayKey() const noexcept {
	return daysFromCivil(year_, static_cast<unsigned>(month_), static_cast<unsigned>(day_));
}

int CivilDate::dayOfYear() const noexcept {
	return static_cast<int>(dayKey() - daysFromCivil(year_, 1, 1)) + 1;
}

int CivilDate::isoWeekday() const noexcept {
	// 1970-01-01 was a Thursday.
	const std::int64_t shifted = (dayKey() + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted) + 1;
}

int CivilDate::isoWeek() const noexcept {
	const int week = (dayOfYear() - isoWeekday() + 10) / 7;
	if (week < 1) {
		return isoWeeksInYear(year_ - 1);
	}
	if (week > isoWeeksInYear(year_)) {
		return 1;
	}
	return week;
}

CivilDate CivilDate::addDays(std::int64_t days) const {
	return fromDayKey(dayKey() + days);
}

std::string CivilDate::toString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year_, month_, day_);
	return std::string(buffer);
}

bool CivilDate::isLeapYear(int year) noexcept {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CivilDate::daysInMonth(int year, int month) {
	static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

DateRange::DateRange(CivilDate start_date, CivilDate end_date) : start(start_date), end(end_date) {
	if (end < start) {
		throw std::invalid_argument("Date range end " + end.toString() + " precedes start " + start.toString() + ".");
	}
}

DateRange DateRange::ofLength(CivilDate start_date, int days) {
	if (days < 1) {
		throw std::invalid_argument("Date range length must be at least one day.");
	}
	return DateRange(start_date, start_date.addDays(days - 1));
}

std::vector<CivilDate> DateRange::days() const {
	std::vector<CivilDate> result;
	result.reserve(static_cast<std::size_t>(dayCount()));
	for (auto key = start.dayKey(); key <= end.dayKey(); ++key) {
		result.push_back(CivilDate::fromDayKey(key));
	}
	return result;
}

std::vector<int> DateRange::periodsCovered(Granularity granularity) const {
	std::set<int> periods;
	for (auto key = start.dayKey(); key <= end.dayKey(); ++key) {
		periods.insert(periodOf(CivilDate::fromDayKey(key), granularity));
	}
	return std::vector<int>(periods.begin(), periods.end());
}

DateRange DateRange::widened(int days) const {
	return DateRange(start.addDays(-days), end.addDays(days));
}

int periodOf(const CivilDate &date, Granularity granularity) {
	switch (granularity) {
	case Granularity::Monthly:
		return date.month();
	case Granularity::Weekly:
		return date.isoWeek();
	case Granularity::Daily:
		return date.dayOfYear();
	}
	throw std::invalid_argument("Unknown granularity.");
}

} // namespace demanddna::core
