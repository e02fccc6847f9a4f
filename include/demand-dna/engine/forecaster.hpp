#pragma once

#include "demand-dna/attribution/attribution.hpp"
#include "demand-dna/dna/blender.hpp"
#include "demand-dna/dna/similarity.hpp"
#include "demand-dna/engine/config.hpp"
#include "demand-dna/events/event_log.hpp"
#include "demand-dna/goal/target_translation.hpp"
#include "demand-dna/profile/historical_profile.hpp"
#include "demand-dna/projection/projection_builder.hpp"
#include "demand-dna/signature/signature_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demanddna::engine {

/**
 * @class DemandDnaForecaster
 * @brief Entry point tying the pure DNA of a context to projections of event logs.
 *
 * Similarity weights and the pure DNA are derived once on construction;
 * every projection rebuilds the layers from them.
 */
class DemandDnaForecaster {
public:
	DemandDnaForecaster(const profile::HistoricalProfile &profile, SimulationContext context);

	const SimulationContext &context() const noexcept {
		return context_;
	}

	const dna::SimilarityWeights &weights() const noexcept {
		return weights_;
	}

	const dna::PureDna &pureDna() const noexcept {
		return pure_dna_;
	}

	/// Projection of the context year; nothing when the trial cannot be calibrated.
	std::optional<projection::ProjectionResult> project(const events::EventLog &log) const;

	/// Per-event attribution of the target gap; nothing for an empty target window.
	std::optional<attribution::AttributionReport> attribute(const events::EventLog &log,
	                                                        const goal::TargetSpec &target) const;

	/// Needed volumes for @p target; nothing when uncalibratable or for an empty window.
	std::optional<goal::GoalPlan> translateTarget(const events::EventLog &log, const goal::TargetSpec &target) const;

	/**
	 * @brief Extracts the signature of @p window for the context's entities.
	 *
	 * The floor quantile and the context days come from the context's EngineConfig.
	 */
	std::optional<signature::ShockSignature> extractSignature(const std::vector<profile::DailyRecord> &daily,
	                                                          const core::DateRange &window,
	                                                          std::string name = std::string()) const;

private:
	SimulationContext context_;
	dna::SimilarityWeights weights_;
	dna::PureDna pure_dna_;
};

} // namespace demanddna::engine
