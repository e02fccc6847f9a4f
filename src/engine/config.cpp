#include "demand-dna/engine/config.hpp"
#include "demand-dna/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace demanddna::engine {

void EngineConfig::validate() const {
	if (overall_share < 0.0 || overall_share > 1.0) {
		throw std::invalid_argument("overall_share must lie in [0, 1].");
	}
	if (similarity_epsilon <= 0.0) {
		throw std::invalid_argument("similarity_epsilon must be positive.");
	}
	if (margin_fraction < 0.0 || margin_fraction > 1.0) {
		throw std::invalid_argument("margin_fraction must lie in [0, 1].");
	}
	if (floor_quantile < 0.0 || floor_quantile > 1.0) {
		throw std::invalid_argument("floor_quantile must lie in [0, 1].");
	}
	if (context_days < 0) {
		throw std::invalid_argument("context_days must be non-negative.");
	}
}

SimulationContext::SimulationContext(int projection_year, std::vector<std::string> entities,
                                     calibration::TrialObservation trial, EngineConfig config)
    : projection_year_(projection_year), entities_(std::move(entities)), trial_(std::move(trial)), config_(config) {}

SimulationContext::Builder SimulationContext::builder() {
	return Builder();
}

SimulationContext::Builder &SimulationContext::Builder::withProjectionYear(int year) {
	projection_year_ = year;
	return *this;
}

SimulationContext::Builder &SimulationContext::Builder::withEntities(std::vector<std::string> names) {
	entities_ = std::move(names);
	return *this;
}

SimulationContext::Builder &SimulationContext::Builder::withTrial(calibration::TrialObservation observation) {
	trial_ = std::move(observation);
	return *this;
}

SimulationContext::Builder &SimulationContext::Builder::withConfig(EngineConfig value) {
	config_ = value;
	return *this;
}

SimulationContext SimulationContext::Builder::build() const {
	if (!trial_) {
		throw std::invalid_argument("A simulation context needs a trial observation.");
	}
	config_.validate();
	const int year = projection_year_.value_or(trial_->window.start.year());
	DEMANDDNA_DEBUG("Simulation context for {} with {} entities, trial {} to {}.", year, entities_.size(),
	                trial_->window.start.toString(), trial_->window.end.toString());
	return SimulationContext(year, entities_, *trial_, config_);
}

} // namespace demanddna::engine
