#include "demand-dna/attribution/attribution.hpp"
#include "demand-dna/core/year_frame.hpp"
#include "demand-dna/engine/pipeline.hpp"
#include "demand-dna/utils/logging.hpp"

#include <utility>

namespace demanddna::attribution {

double AttributionReport::totalContribution() const {
	double total = 0.0;
	for (const auto &row : rows) {
		total += row.contribution;
	}
	return total;
}

std::optional<AttributionReport> attribute(const dna::PureDna &pure_dna, const engine::SimulationContext &context,
                                           const events::EventLog &log, const goal::TargetSpec &target) {
	const core::YearFrame calendar(context.projectionYear());
	if (calendar.rowsIn(target.window).empty()) {
		DEMANDDNA_WARN("Target window {} to {} has no days in {}; nothing to attribute.",
		               target.window.start.toString(), target.window.end.toString(), context.projectionYear());
		return std::nullopt;
	}

	const auto metric = goal::gapMetric(target.metric);

	// prefix_totals[i] holds the window totals with the first i events.
	std::vector<engine::WindowTotals> prefix_totals;
	prefix_totals.reserve(log.size() + 1);
	for (std::size_t count = 0; count <= log.size(); ++count) {
		prefix_totals.push_back(engine::evaluateWindow(pure_dna, context, log.prefix(count), target.window));
	}

	AttributionReport report;
	report.metric = metric;
	report.organic = prefix_totals.front().simulation.get(metric);
	report.full_log = prefix_totals.back().simulation.get(metric);

	const bool ratio_target =
	    target.metric == goal::TargetMetric::ConversionRate || target.metric == goal::TargetMetric::OrderValue;
	report.needed = ratio_target ? prefix_totals.back().baseline.get(metric) : target.value;

	const double gap = report.needed - report.organic;
	report.total_gap = gap == 0.0 ? 1.0 : gap;

	report.rows.reserve(log.size());
	for (std::size_t i = 0; i < log.size(); ++i) {
		const auto &event = log.at(i);
		AttributionRow row;
		row.index = i;
		row.kind = events::kindLabel(event);
		row.description = events::describe(event);
		row.scope = events::toString(events::scopeOf(event));
		row.contribution = prefix_totals[i + 1].simulation.get(metric) - prefix_totals[i].simulation.get(metric);
		row.gap_coverage_pct = row.contribution / report.total_gap * 100.0;
		report.rows.push_back(std::move(row));
	}

	DEMANDDNA_DEBUG("Attributed {} events on {}: organic {:.2f}, needed {:.2f}, full log {:.2f}.", log.size(),
	                core::toString(metric), report.organic, report.needed, report.full_log);
	return report;
}

} // namespace demanddna::attribution
