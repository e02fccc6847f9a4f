#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "demand-dna/dna/blender.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace demanddna;

namespace {

profile::HistoricalIndexRecord monthRecord(const std::string &entity, std::optional<int> year, int month,
                                           double traffic, double rate = 1.0, double order_value = 1.0) {
	profile::HistoricalIndexRecord record;
	record.entity = entity;
	record.year = year;
	record.granularity = core::Granularity::Monthly;
	record.period = month;
	record.index = core::IndexTriple {traffic, rate, order_value};
	return record;
}

} // namespace

TEST_CASE("PureDna blends the overall shape with one weighted year", "[dna][blender]") {
	const profile::HistoricalProfile history({monthRecord("a", std::nullopt, 1, 1.2, 0.9, 1.1),
	                                          monthRecord("a", 2023, 1, 0.8, 1.1, 1.0)});
	const auto pure = dna::blendPureDna(history, {"a"}, {{2023, 1.0}});

	const auto january = pure.month(1);
	REQUIRE(january.has_value());
	REQUIRE(january->traffic == Catch::Approx(0.35 * 1.2 + 0.65 * 0.8));
	REQUIRE(january->conversion_rate == Catch::Approx(0.35 * 0.9 + 0.65 * 1.1));
	REQUIRE(january->order_value == Catch::Approx(0.35 * 1.1 + 0.65 * 1.0));
}

TEST_CASE("PureDna takes medians across entities", "[dna][blender]") {
	const profile::HistoricalProfile history({monthRecord("a", std::nullopt, 6, 1.2), monthRecord("b", std::nullopt, 6, 1.0),
	                                          monthRecord("a", 2023, 6, 2.0), monthRecord("b", 2023, 6, 1.0)});
	const auto pure = dna::blendPureDna(history, {}, {{2023, 1.0}});
	REQUIRE(pure.month(6)->traffic == Catch::Approx(0.35 * 1.1 + 0.65 * 1.5));

	const auto only_b = dna::blendPureDna(history, {"B"}, {{2023, 1.0}});
	REQUIRE(only_b.month(6)->traffic == Catch::Approx(1.0));
}

TEST_CASE("PureDna substitutes the overall shape for a missing year-month", "[dna][blender][edge]") {
	const profile::HistoricalProfile history(
	    {monthRecord("a", std::nullopt, 3, 1.4), monthRecord("a", 2023, 3, 0.6), monthRecord("a", 2022, 4, 5.0)});
	const auto pure = dna::blendPureDna(history, {"a"}, {{2023, 0.5}, {2022, 0.5}});
	REQUIRE(pure.month(3)->traffic == Catch::Approx(0.35 * 1.4 + 0.65 * (0.5 * 0.6 + 0.5 * 1.4)));
}

TEST_CASE("PureDna covers only the months of the overall pseudo-year", "[dna][blender][edge]") {
	const profile::HistoricalProfile history({monthRecord("a", std::nullopt, 2, 1.0), monthRecord("a", 2023, 5, 3.0)});
	const auto pure = dna::blendPureDna(history, {"a"}, {{2023, 1.0}});
	REQUIRE(pure.months().size() == 1);
	REQUIRE_FALSE(pure.month(5).has_value());
	REQUIRE(pure.monthOrNeutral(5).traffic == 1.0);
}

TEST_CASE("PureDna honours a custom overall share and validates inputs", "[dna][blender][error]") {
	const profile::HistoricalProfile history({monthRecord("a", std::nullopt, 1, 2.0), monthRecord("a", 2023, 1, 1.0)});
	REQUIRE(dna::blendPureDna(history, {"a"}, {{2023, 1.0}}, 1.0).month(1)->traffic == Catch::Approx(2.0));
	REQUIRE_THROWS_AS(dna::blendPureDna(history, {"a"}, {{2023, 1.0}}, 1.5), std::invalid_argument);
	std::map<int, core::IndexTriple> bad_months;
	bad_months[13] = core::IndexTriple::neutral();
	REQUIRE_THROWS_AS(dna::PureDna(bad_months), std::invalid_argument);

	const auto flat = dna::PureDna::flat(core::IndexTriple {2.0, 1.0, 1.0});
	REQUIRE(flat.months().size() == 12);
	REQUIRE(flat.month(12)->traffic == 2.0);
}
