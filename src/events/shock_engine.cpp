#include "demand-dna/events/shock_engine.hpp"

#include <cmath>
#include <stdexcept>

namespace demanddna::events {

double shapeWeight(CampaignShape shape, int elapsed, int duration) {
	if (duration <= 0) {
		throw std::invalid_argument("Campaign duration must be positive.");
	}
	const double t = static_cast<double>(elapsed);
	const double d = static_cast<double>(duration);
	const double p = t / d;
	switch (shape) {
	case CampaignShape::Step:
		return 1.0;
	case CampaignShape::LinearFade:
		return 1.0 - p;
	case CampaignShape::FrontLoaded:
		return std::exp(-3.0 * p);
	case CampaignShape::DelayedPeak: {
		const double centre = 0.4 * d;
		const double sigma = 0.3 * d;
		return std::exp(-((t - centre) * (t - centre)) / (2.0 * sigma * sigma));
	}
	}
	throw std::invalid_argument("Unknown campaign shape.");
}

double shockLift(const ShockEvent &shock, const core::CivilDate &day) {
	if (!shock.window.contains(day)) {
		return 0.0;
	}
	const auto elapsed = static_cast<int>(shock.window.start.daysUntil(day));
	return shock.lift * shapeWeight(shock.shape, elapsed, shock.window.dayCount());
}

double shockMultiplier(const core::CivilDate &day, const EventLog &log) {
	double total = 0.0;
	for (const auto &event : log) {
		if (const auto *shock = std::get_if<ShockEvent>(&event)) {
			total += shockLift(*shock, day);
		}
	}
	return total;
}

InjectionSeries buildInjections(const core::YearFrame &frame, const EventLog &log) {
	InjectionSeries series;
	series.absolute.assign(frame.size(), core::MetricTotals {});
	series.relative.assign(frame.size(), core::MetricTotals {});

	for (const auto &event : log) {
		const auto *reapplied = std::get_if<ReappliedShockEvent>(&event);
		if (reapplied == nullptr) {
			continue;
		}
		const bool absolute = reapplied->mode == InjectionMode::Absolute;
		const auto &deltas = absolute ? reapplied->absolute_deltas : reapplied->relative_fractions;
		auto &target = absolute ? series.absolute : series.relative;
		for (const auto row : frame.rowsIn(reapplied->window())) {
			const auto offset = static_cast<std::size_t>(reapplied->new_start.daysUntil(frame.date(row)));
			if (offset < deltas.size()) {
				target[row] += deltas[offset];
			}
		}
	}
	return series;
}

} // namespace demanddna::events
