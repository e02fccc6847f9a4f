#include <catch2/catch_test_macros.hpp>

#include "common/demand_fixtures.hpp"
#include "demand-dna/engine/config.hpp"

#include <stdexcept>

using namespace demanddna;
using namespace tests::fixtures;

TEST_CASE("EngineConfig defaults", "[engine][config]") {
	const engine::EngineConfig config;
	REQUIRE(config.overall_share == 0.35);
	REQUIRE(config.similarity_epsilon == 0.01);
	REQUIRE(config.margin_fraction == 0.15);
	REQUIRE(config.floor_quantile == 0.10);
	REQUIRE(config.context_days == 14);
	REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("EngineConfig rejects constants outside their domain", "[engine][config][error]") {
	engine::EngineConfig config;
	config.overall_share = 1.2;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = engine::EngineConfig();
	config.similarity_epsilon = 0.0;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = engine::EngineConfig();
	config.context_days = -1;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}

TEST_CASE("SimulationContext builder defaults the projection year to the trial year", "[engine][context]") {
	const auto context = engine::SimulationContext::builder().withEntities({"shop"}).withTrial(januaryTrial()).build();
	REQUIRE(context.projectionYear() == 2025);
	REQUIRE(context.entities().size() == 1);
	REQUIRE(context.trial().observed.sessions == 3000.0);
	REQUIRE(context.config().margin_fraction == 0.15);

	const auto explicit_year = engine::SimulationContext::builder().withProjectionYear(2026).withTrial(januaryTrial()).build();
	REQUIRE(explicit_year.projectionYear() == 2026);
}

TEST_CASE("SimulationContext builder validates its inputs", "[engine][context][error]") {
	REQUIRE_THROWS_AS(engine::SimulationContext::builder().withProjectionYear(2025).build(), std::invalid_argument);

	engine::EngineConfig config;
	config.margin_fraction = -0.1;
	REQUIRE_THROWS_AS(engine::SimulationContext::builder().withTrial(januaryTrial()).withConfig(config).build(),
	                  std::invalid_argument);
}
