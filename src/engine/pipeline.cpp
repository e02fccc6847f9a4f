#include "demand-dna/engine/pipeline.hpp"
#include "demand-dna/calibration/calibrator.hpp"
#include "demand-dna/events/layer_compiler.hpp"
#include "demand-dna/utils/logging.hpp"

#include <utility>

namespace demanddna::engine {

std::optional<projection::ProjectionResult> runProjection(const dna::PureDna &pure_dna,
                                                          const SimulationContext &context,
                                                          const events::EventLog &log) {
	auto frame = events::compileLayers(context.projectionYear(), pure_dna, log);

	const auto &trial = context.trial();
	const auto constants = calibration::calibrate(frame, trial.window, trial.adjusted());
	if (!constants) {
		DEMANDDNA_WARN("Projection for {} skipped: trial {} to {} could not be calibrated.", context.projectionYear(),
		               trial.window.start.toString(), trial.window.end.toString());
		return std::nullopt;
	}

	return projection::buildProjection(std::move(frame), *constants, log, context.config().margin_fraction);
}

WindowTotals evaluateWindow(const dna::PureDna &pure_dna, const SimulationContext &context,
                            const events::EventLog &log, const core::DateRange &window) {
	const auto result = runProjection(pure_dna, context, log);
	if (!result) {
		return {};
	}
	return {result->baselineTotals(window), result->simulationTotals(window)};
}

} // namespace demanddna::engine
