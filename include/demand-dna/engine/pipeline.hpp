#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/dna/blender.hpp"
#include "demand-dna/engine/config.hpp"
#include "demand-dna/events/event_log.hpp"
#include "demand-dna/projection/projection_builder.hpp"

#include <optional>

namespace demanddna::engine {

/**
 * @brief Compiles, calibrates and projects the context year under @p log.
 *
 * The trial is calibrated with its adjusted totals against the pre-trial layer.
 *
 * @return Nothing when the trial cannot be calibrated.
 */
std::optional<projection::ProjectionResult> runProjection(const dna::PureDna &pure_dna,
                                                          const SimulationContext &context,
                                                          const events::EventLog &log);

/// Baseline and simulation totals of one evaluation window.
struct WindowTotals {
	core::MetricTotals baseline;
	core::MetricTotals simulation;
};

/**
 * @brief Projects the year under @p log and sums both series over @p window.
 *
 * A log under which the trial cannot be calibrated evaluates to zero totals.
 */
WindowTotals evaluateWindow(const dna::PureDna &pure_dna, const SimulationContext &context,
                            const events::EventLog &log, const core::DateRange &window);

} // namespace demanddna::engine
