#include "demand-dna/events/layer_compiler.hpp"
#include "demand-dna/utils/logging.hpp"

#include <vector>

namespace demanddna::events {

namespace {

double meanOver(const std::vector<double> &column, const std::vector<std::size_t> &rows) {
	double total = 0.0;
	for (const auto row : rows) {
		total += column[row];
	}
	return total / static_cast<double>(rows.size());
}

void applyDrag(core::YearFrame &frame, core::Layer layer, const CustomDragEvent &event) {
	const auto rows = frame.rowsForPeriod(event.granularity, event.target);
	for (auto *column : frame.layer(layer).all()) {
		for (const auto row : rows) {
			(*column)[row] *= event.multiplier;
		}
	}
}

void exchangePeriods(core::YearFrame &frame, core::Layer layer, core::Granularity granularity, int period_a,
                     int period_b) {
	const auto rows_a = frame.rowsForPeriod(granularity, period_a);
	const auto rows_b = frame.rowsForPeriod(granularity, period_b);
	if (rows_a.empty() || rows_b.empty()) {
		DEMANDDNA_DEBUG("Swap {} <-> {} skipped: period not present in {}.", period_a, period_b, frame.year());
		return;
	}
	for (auto *column_ptr : frame.layer(layer).all()) {
		auto &column = *column_ptr;
		const double mean_a = meanOver(column, rows_a);
		const double mean_b = meanOver(column, rows_b);
		for (const auto row : rows_a) {
			column[row] = mean_a > 0.0 ? column[row] * (mean_b / mean_a) : mean_b;
		}
		for (const auto row : rows_b) {
			column[row] = mean_b > 0.0 ? column[row] * (mean_a / mean_b) : mean_a;
		}
	}
}

void applySwap(core::YearFrame &frame, core::Layer layer, const SwapEvent &event) {
	for (const auto &pair : event.pairs()) {
		exchangePeriods(frame, layer, event.granularity, pair.first, pair.second);
	}
}

} // namespace

void applyStructuralEvent(core::YearFrame &frame, core::Layer layer, const Event &event) {
	if (const auto *drag = std::get_if<CustomDragEvent>(&event)) {
		applyDrag(frame, layer, *drag);
	} else if (const auto *swap = std::get_if<SwapEvent>(&event)) {
		applySwap(frame, layer, *swap);
	}
}

core::YearFrame compileLayers(int year, const dna::PureDna &pure_dna, const EventLog &log) {
	core::YearFrame frame(year);

	auto &pure = frame.layer(core::Layer::Pure);
	for (std::size_t row = 0; row < frame.size(); ++row) {
		pure.set(row, pure_dna.monthOrNeutral(frame.month(row)));
	}
	frame.layer(core::Layer::PreTrial) = pure;

	std::size_t pre_trial_count = 0;
	for (const auto &event : log) {
		if (isStructural(event) && scopeOf(event) == Scope::PreTrial) {
			applyStructuralEvent(frame, core::Layer::PreTrial, event);
			++pre_trial_count;
		}
	}

	frame.layer(core::Layer::Work) = frame.layer(core::Layer::PreTrial);

	std::size_t post_trial_count = 0;
	for (const auto &event : log) {
		if (isStructural(event) && scopeOf(event) == Scope::PostTrial) {
			applyStructuralEvent(frame, core::Layer::Work, event);
			++post_trial_count;
		}
	}
	DEMANDDNA_DEBUG("Compiled layers for {}: {} pre-trial and {} post-trial structural events.", year,
	                pre_trial_count, post_trial_count);
	return frame;
}

} // namespace demanddna::events
