#include <catch2/catch_test_macros.hpp>

#include "demand-dna/events/event_log.hpp"

#include <stdexcept>
#include <variant>

using namespace demanddna::events;
using demanddna::core::CivilDate;
using demanddna::core::DateRange;
using demanddna::core::Granularity;

namespace {

ShockEvent juneShock() {
	return ShockEvent {DateRange(CivilDate(2025, 6, 1), CivilDate(2025, 6, 10)), CampaignShape::FrontLoaded, 0.3};
}

} // namespace

TEST_CASE("EventLog appends, removes and keeps order", "[events][log]") {
	EventLog log;
	REQUIRE(log.empty());
	log.append(juneShock());
	log.append(CustomDragEvent {Granularity::Monthly, 7, 0.9});
	log.append(SwapEvent::periods(Granularity::Monthly, 1, 2));
	REQUIRE(log.size() == 3);
	REQUIRE(std::holds_alternative<CustomDragEvent>(log.at(1)));

	log.remove(1);
	REQUIRE(log.size() == 2);
	REQUIRE(std::holds_alternative<SwapEvent>(log.at(1)));

	REQUIRE_THROWS_AS(log.remove(5), std::out_of_range);
	REQUIRE_THROWS_AS(log.append(CustomDragEvent {Granularity::Monthly, 0, 1.0}), std::invalid_argument);
	REQUIRE(log.size() == 2);

	log.clear();
	REQUIRE(log.empty());
}

TEST_CASE("EventLog shifts a shock and keeps its length", "[events][log]") {
	EventLog log({juneShock(), CustomDragEvent {Granularity::Monthly, 7, 0.9}});
	log.shiftShock(0, CivilDate(2025, 8, 25));

	const auto &moved = std::get<ShockEvent>(log.at(0));
	REQUIRE(moved.window.start == CivilDate(2025, 8, 25));
	REQUIRE(moved.window.end == CivilDate(2025, 9, 3));
	REQUIRE(moved.window.dayCount() == 10);
	REQUIRE(moved.shape == CampaignShape::FrontLoaded);

	REQUIRE_THROWS_AS(log.shiftShock(1, CivilDate(2025, 1, 1)), std::logic_error);
	REQUIRE_THROWS_AS(log.shiftShock(2, CivilDate(2025, 1, 1)), std::out_of_range);
}

TEST_CASE("EventLog prefixes are independent copies", "[events][log]") {
	EventLog log({juneShock(), CustomDragEvent {Granularity::Monthly, 7, 0.9}});
	auto head = log.prefix(1);
	REQUIRE(head.size() == 1);
	REQUIRE(log.prefix(0).empty());
	REQUIRE(log.prefix(10).size() == 2);

	head.shiftShock(0, CivilDate(2025, 7, 1));
	REQUIRE(std::get<ShockEvent>(log.at(0)).window.start == CivilDate(2025, 6, 1));
}

TEST_CASE("EventLog construction validates every event", "[events][log][error]") {
	REQUIRE_THROWS_AS(EventLog({juneShock(), CustomDragEvent {Granularity::Daily, 400, 1.0}}), std::invalid_argument);
}
