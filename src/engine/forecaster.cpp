#include "demand-dna/engine/forecaster.hpp"
#include "demand-dna/engine/pipeline.hpp"
#include "demand-dna/utils/logging.hpp"

#include <utility>

namespace demanddna::engine {

DemandDnaForecaster::DemandDnaForecaster(const profile::HistoricalProfile &profile, SimulationContext context)
    : context_(std::move(context)) {
	dna::SimilarityRequest request;
	request.entities = context_.entities();
	request.projection_year = context_.projectionYear();
	request.trial = context_.trial().window;
	request.observed = context_.trial().observed;
	request.epsilon = context_.config().similarity_epsilon;

	weights_ = dna::computeSimilarityWeights(profile, request);
	pure_dna_ = dna::blendPureDna(profile, context_.entities(), weights_, context_.config().overall_share);
	DEMANDDNA_INFO("Forecaster ready for {}: {} weighted years, {} DNA months.", context_.projectionYear(),
	               weights_.size(), pure_dna_.months().size());
}

std::optional<projection::ProjectionResult> DemandDnaForecaster::project(const events::EventLog &log) const {
	return runProjection(pure_dna_, context_, log);
}

std::optional<attribution::AttributionReport> DemandDnaForecaster::attribute(const events::EventLog &log,
                                                                             const goal::TargetSpec &target) const {
	return attribution::attribute(pure_dna_, context_, log, target);
}

std::optional<goal::GoalPlan> DemandDnaForecaster::translateTarget(const events::EventLog &log,
                                                                   const goal::TargetSpec &target) const {
	const auto result = project(log);
	if (!result) {
		return std::nullopt;
	}
	return goal::translateTarget(*result, target);
}

std::optional<signature::ShockSignature>
DemandDnaForecaster::extractSignature(const std::vector<profile::DailyRecord> &daily, const core::DateRange &window,
                                      std::string name) const {
	signature::ExtractionRequest request;
	request.window = window;
	request.entities = context_.entities();
	request.name = std::move(name);
	request.context_days = context_.config().context_days;
	request.floor_quantile = context_.config().floor_quantile;
	return signature::extractSignature(daily, request);
}

} // namespace demanddna::engine
