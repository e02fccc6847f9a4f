#include <catch2/catch_test_macros.hpp>

#include "demand-dna/core/calendar.hpp"

#include <stdexcept>
#include <vector>

using namespace demanddna::core;

TEST_CASE("CivilDate validates its fields", "[core][calendar][error]") {
	REQUIRE_NOTHROW(CivilDate(2024, 2, 29));
	REQUIRE_THROWS_AS(CivilDate(2023, 2, 29), std::invalid_argument);
	REQUIRE_THROWS_AS(CivilDate(2025, 13, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(CivilDate(2025, 4, 31), std::invalid_argument);
}

TEST_CASE("CivilDate parses and formats ISO dates", "[core][calendar]") {
	const auto date = CivilDate::parse("2025-03-07");
	REQUIRE(date.year() == 2025);
	REQUIRE(date.month() == 3);
	REQUIRE(date.day() == 7);
	REQUIRE(date.toString() == "2025-03-07");

	REQUIRE_THROWS_AS(CivilDate::parse("07/03/2025"), std::invalid_argument);
	REQUIRE_THROWS_AS(CivilDate::parse("2025-02-30"), std::invalid_argument);
}

TEST_CASE("CivilDate day keys count from the Unix epoch", "[core][calendar]") {
	REQUIRE(CivilDate(1970, 1, 1).dayKey() == 0);
	REQUIRE(CivilDate(2024, 1, 1).dayKey() == 19723);
	REQUIRE(CivilDate::fromDayKey(19723) == CivilDate(2024, 1, 1));
	REQUIRE(CivilDate(2024, 12, 31).addDays(1) == CivilDate(2025, 1, 1));
	REQUIRE(CivilDate(2025, 3, 1).addDays(-1) == CivilDate(2025, 2, 28));
	REQUIRE(CivilDate(2024, 2, 1).daysUntil(CivilDate(2024, 3, 1)) == 29);
}

TEST_CASE("CivilDate day of year and leap years", "[core][calendar]") {
	REQUIRE(CivilDate::isLeapYear(2024));
	REQUIRE_FALSE(CivilDate::isLeapYear(2100));
	REQUIRE(CivilDate::isLeapYear(2000));
	REQUIRE(CivilDate::daysInYear(2025) == 365);
	REQUIRE(CivilDate::daysInMonth(2024, 2) == 29);
	REQUIRE(CivilDate(2024, 12, 31).dayOfYear() == 366);
	REQUIRE(CivilDate(2025, 3, 1).dayOfYear() == 60);
}

TEST_CASE("CivilDate ISO weeks cross year boundaries", "[core][calendar]") {
	REQUIRE(CivilDate(2025, 1, 1).isoWeekday() == 3);
	REQUIRE(CivilDate(2025, 1, 1).isoWeek() == 1);
	REQUIRE(CivilDate(2021, 1, 1).isoWeek() == 53);
	REQUIRE(CivilDate(2024, 12, 30).isoWeek() == 1);
	REQUIRE(CivilDate(2020, 12, 31).isoWeek() == 53);
	REQUIRE(CivilDate(2025, 6, 15).isoWeekday() == 7);
}

TEST_CASE("DateRange is inclusive and ordered", "[core][calendar]") {
	const DateRange range(CivilDate(2025, 1, 20), CivilDate(2025, 3, 5));
	REQUIRE(range.dayCount() == 45);
	REQUIRE(range.contains(CivilDate(2025, 1, 20)));
	REQUIRE(range.contains(CivilDate(2025, 3, 5)));
	REQUIRE_FALSE(range.contains(CivilDate(2025, 3, 6)));
	REQUIRE(range.days().size() == 45);
	REQUIRE(range.periodsCovered(Granularity::Monthly) == std::vector<int> {1, 2, 3});

	const auto wide = range.widened(14);
	REQUIRE(wide.start == CivilDate(2025, 1, 6));
	REQUIRE(wide.end == CivilDate(2025, 3, 19));

	REQUIRE_THROWS_AS(DateRange(CivilDate(2025, 2, 1), CivilDate(2025, 1, 31)), std::invalid_argument);
	REQUIRE_THROWS_AS(DateRange::ofLength(CivilDate(2025, 2, 1), 0), std::invalid_argument);
	REQUIRE(DateRange::ofLength(CivilDate(2025, 1, 1), 10).end == CivilDate(2025, 1, 10));
}

TEST_CASE("periodOf keys dates by month, ISO week or day of year", "[core][calendar]") {
	const CivilDate date(2025, 2, 10);
	REQUIRE(periodOf(date, Granularity::Monthly) == 2);
	REQUIRE(periodOf(date, Granularity::Weekly) == 7);
	REQUIRE(periodOf(date, Granularity::Daily) == 41);
}
