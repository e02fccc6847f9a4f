#pragma once

#include "demand-dna/core/types.hpp"
#include "demand-dna/dna/blender.hpp"
#include "demand-dna/engine/config.hpp"
#include "demand-dna/events/event_log.hpp"
#include "demand-dna/goal/target_translation.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demanddna::attribution {

/**
 * @struct AttributionRow
 * @brief Marginal effect of one logged event on the gap metric.
 */
struct AttributionRow {
	std::size_t index = 0;
	std::string kind;
	std::string description;
	std::string scope;
	/// metric(first index+1 events) - metric(first index events)
	double contribution = 0.0;
	/// contribution / total_gap * 100
	double gap_coverage_pct = 0.0;
};

/**
 * @struct AttributionReport
 * @brief Sequential attribution of a target gap to the events of a log.
 */
struct AttributionReport {
	core::Metric metric = core::Metric::Revenue;
	/// Simulation total with an empty log.
	double organic = 0.0;
	double needed = 0.0;
	/// needed - organic, or 1 when that is exactly zero.
	double total_gap = 0.0;
	/// Simulation total with the full log.
	double full_log = 0.0;
	std::vector<AttributionRow> rows;

	/// Sum of the row contributions; equals full_log - organic.
	double totalContribution() const;
};

/**
 * @brief Attributes the gap between the organic projection and a target to each event.
 *
 * Every prefix of the log (0..N events) is projected once from the
 * unmodified pure DNA; event i is credited with the change of the gap metric
 * over the target window between prefixes i and i+1. The result depends on
 * log order, while the contributions always telescope to full_log - organic.
 * Ratio targets are attributed on revenue, with the full-log baseline revenue
 * over the window as the needed value.
 *
 * @return Nothing when the target window has no days in the projection year.
 */
std::optional<AttributionReport> attribute(const dna::PureDna &pure_dna, const engine::SimulationContext &context,
                                           const events::EventLog &log, const goal::TargetSpec &target);

} // namespace demanddna::attribution
