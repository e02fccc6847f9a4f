#pragma once

#include "demand-dna/calibration/calibrator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace demanddna::engine {

/**
 * @struct EngineConfig
 * @brief Constants of the blending, weighting, banding and extraction stages.
 */
struct EngineConfig {
	double overall_share = 0.35;      // Share of the all-time shape in the pure DNA
	double similarity_epsilon = 0.01; // Added to the mean relative error before inversion
	double margin_fraction = 0.15;    // Half-width of the projection bands
	double floor_quantile = 0.10;     // Organic floor of extracted signatures
	int context_days = 14;            // Days shown around an extraction window

	/// @throws std::invalid_argument if a constant is outside its domain.
	void validate() const;
};

/**
 * @class SimulationContext
 * @brief Everything a projection needs besides the pure DNA and the event log.
 *
 * Built once per analyst session state and passed explicitly to the
 * calibration, projection and attribution calls.
 */
class SimulationContext {
public:
	class Builder {
	public:
		Builder &withProjectionYear(int year);
		Builder &withEntities(std::vector<std::string> names);
		Builder &withTrial(calibration::TrialObservation observation);
		Builder &withConfig(EngineConfig value);

		/**
		 * @brief Creates the context; the projection year defaults to the trial start year.
		 * @throws std::invalid_argument if no trial was given or the config is invalid.
		 */
		SimulationContext build() const;

	private:
		std::optional<int> projection_year_;
		std::vector<std::string> entities_;
		std::optional<calibration::TrialObservation> trial_;
		EngineConfig config_;
	};

	static Builder builder();

	int projectionYear() const noexcept {
		return projection_year_;
	}

	const std::vector<std::string> &entities() const noexcept {
		return entities_;
	}

	const calibration::TrialObservation &trial() const noexcept {
		return trial_;
	}

	const EngineConfig &config() const noexcept {
		return config_;
	}

private:
	SimulationContext(int projection_year, std::vector<std::string> entities, calibration::TrialObservation trial,
	                  EngineConfig config);

	int projection_year_;
	std::vector<std::string> entities_;
	calibration::TrialObservation trial_;
	EngineConfig config_;
};

} // namespace demanddna::engine
