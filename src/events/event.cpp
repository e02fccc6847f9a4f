#include "demand-dna/events/event.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace demanddna::events {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

int maxPeriod(core::Granularity granularity) {
	switch (granularity) {
	case core::Granularity::Monthly:
		return 12;
	case core::Granularity::Weekly:
		return 53;
	case core::Granularity::Daily:
		return 366;
	}
	throw std::invalid_argument("Unknown granularity.");
}

void validatePeriod(core::Granularity granularity, int period) {
	if (period < 1 || period > maxPeriod(granularity)) {
		throw std::invalid_argument(core::toString(granularity) + " period " + std::to_string(period) +
		                            " is out of range.");
	}
}

std::string scopeTitle(Scope scope) {
	return scope == Scope::PreTrial ? "Pre-Trial" : "Post-Trial";
}

} // namespace

std::string toString(CampaignShape shape) {
	switch (shape) {
	case CampaignShape::FrontLoaded:
		return "Front-Loaded";
	case CampaignShape::LinearFade:
		return "Linear Fade";
	case CampaignShape::DelayedPeak:
		return "Delayed Peak";
	case CampaignShape::Step:
		return "Step";
	}
	throw std::invalid_argument("Unknown campaign shape.");
}

std::string toString(Scope scope) {
	return scope == Scope::PreTrial ? "pre_trial" : "post_trial";
}

std::string toString(InjectionMode mode) {
	return mode == InjectionMode::Absolute ? "Absolute Volume" : "Relative";
}

CampaignShape campaignShapeFromName(const std::string &name) {
	if (name == "Email Campaign" || name == "Front-Loaded") {
		return CampaignShape::FrontLoaded;
	}
	if (name == "Flash Sale" || name == "Linear Fade") {
		return CampaignShape::LinearFade;
	}
	if (name == "Product Launch" || name == "Delayed Peak") {
		return CampaignShape::DelayedPeak;
	}
	return CampaignShape::Step;
}

const std::vector<std::string> &campaignNames() {
	static const std::vector<std::string> names {"Email Campaign", "Flash Sale", "Product Launch",
	                                             "Awareness Drive"};
	return names;
}

SwapEvent SwapEvent::periods(core::Granularity granularity, int a, int b, Scope scope) {
	SwapEvent event;
	event.granularity = granularity;
	event.period_a = a;
	event.period_b = b;
	event.scope = scope;
	return event;
}

SwapEvent SwapEvent::ranges(core::Granularity granularity, core::DateRange a, core::DateRange b, Scope scope) {
	SwapEvent event;
	event.granularity = granularity;
	event.range_a = a;
	event.range_b = b;
	event.scope = scope;
	return event;
}

std::vector<std::pair<int, int>> SwapEvent::pairs() const {
	if (!isRangeSwap()) {
		return {{period_a, period_b}};
	}
	const auto a_periods = range_a->periodsCovered(granularity);
	const auto b_periods = range_b->periodsCovered(granularity);
	std::vector<std::pair<int, int>> result;
	const std::size_t count = std::min(a_periods.size(), b_periods.size());
	result.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		result.emplace_back(a_periods[i], b_periods[i]);
	}
	return result;
}

Scope scopeOf(const Event &event) {
	return std::visit(Overloaded {[](const CustomDragEvent &e) { return e.scope; },
	                              [](const SwapEvent &e) { return e.scope; },
	                              [](const ShockEvent &) { return Scope::PostTrial; },
	                              [](const ReappliedShockEvent &) { return Scope::PostTrial; }},
	                  event);
}

bool isStructural(const Event &event) {
	return std::holds_alternative<CustomDragEvent>(event) || std::holds_alternative<SwapEvent>(event);
}

std::string kindLabel(const Event &event) {
	return std::visit(Overloaded {[](const ShockEvent &) { return std::string("Shock"); },
	                              [](const CustomDragEvent &) { return std::string("Custom Drag"); },
	                              [](const SwapEvent &) { return std::string("Swap"); },
	                              [](const ReappliedShockEvent &) { return std::string("Reapplied Shock"); }},
	                  event);
}

std::string describe(const Event &event) {
	std::ostringstream oss;
	std::visit(Overloaded {[&oss](const ShockEvent &e) {
		                       oss << toString(e.shape) << " | " << std::fixed << std::setprecision(0) << e.lift * 100.0
		                           << "% | " << e.window.start.toString() << " -> " << e.window.end.toString();
	                       },
	                       [&oss](const CustomDragEvent &e) {
		                       oss << core::toString(e.granularity) << " " << e.target << " x " << std::fixed
		                           << std::setprecision(2) << e.multiplier;
	                       },
	                       [&oss](const SwapEvent &e) {
		                       oss << core::toString(e.granularity) << " ";
		                       if (e.isRangeSwap()) {
			                       oss << e.range_a->start.toString() << "-" << e.range_a->end.toString() << " <-> "
			                           << e.range_b->start.toString() << "-" << e.range_b->end.toString();
		                       } else {
			                       oss << e.period_a << " <-> " << e.period_b;
		                       }
	                       },
	                       [&oss](const ReappliedShockEvent &e) {
		                       oss << e.signature_name << " | " << toString(e.mode) << " | from "
		                           << e.new_start.toString();
	                       }},
	           event);
	oss << " (" << scopeTitle(scopeOf(event)) << ")";
	return oss.str();
}

void validate(const Event &event) {
	std::visit(Overloaded {[](const ShockEvent &) {},
	                       [](const CustomDragEvent &e) {
		                       validatePeriod(e.granularity, e.target);
		                       if (e.multiplier < 0.0) {
			                       throw std::invalid_argument("Custom drag multiplier must be non-negative.");
		                       }
	                       },
	                       [](const SwapEvent &e) {
		                       if (e.range_a.has_value() != e.range_b.has_value()) {
			                       throw std::invalid_argument("Range swaps need both ranges.");
		                       }
		                       if (!e.isRangeSwap()) {
			                       validatePeriod(e.granularity, e.period_a);
			                       validatePeriod(e.granularity, e.period_b);
		                       }
	                       },
	                       [](const ReappliedShockEvent &e) {
		                       if (e.duration < 1) {
			                       throw std::invalid_argument("Reapplied shock duration must be at least one day.");
		                       }
		                       const auto expected = static_cast<std::size_t>(e.duration);
		                       if (e.absolute_deltas.size() != expected || e.relative_fractions.size() != expected) {
			                       throw std::invalid_argument("Signature '" + e.signature_name +
			                                                   "' must carry one delta per day of its duration.");
		                       }
	                       }},
	           event);
}

} // namespace demanddna::events
