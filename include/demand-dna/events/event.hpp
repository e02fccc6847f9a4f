#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace demanddna::events {

/// Daily response curve of a time-bound campaign.
enum class CampaignShape {
	FrontLoaded,
	LinearFade,
	DelayedPeak,
	Step
};

/// Whether a structural event reshapes the calibration layer or only the projection.
enum class Scope {
	PreTrial,
	PostTrial
};

/// How a re-applied signature adds its excess to the simulation.
enum class InjectionMode {
	Absolute,
	Relative
};

std::string toString(CampaignShape shape);
std::string toString(Scope scope);
std::string toString(InjectionMode mode);

/**
 * @brief Maps a campaign display name onto its response shape.
 *
 * "Email Campaign" is front-loaded, "Flash Sale" fades linearly,
 * "Product Launch" peaks late and "Awareness Drive" is a step. Shape names
 * themselves are accepted too; anything else falls back to a step.
 */
CampaignShape campaignShapeFromName(const std::string &name);

/// Campaign display names in presentation order.
const std::vector<std::string> &campaignNames();

/**
 * @struct ShockEvent
 * @brief Time-bound campaign lifting traffic by a shape-weighted fraction.
 */
struct ShockEvent {
	core::DateRange window;
	CampaignShape shape = CampaignShape::Step;
	/// Signed lift fraction (0.25 = +25% at full shape weight).
	double lift = 0.0;
};

/**
 * @struct CustomDragEvent
 * @brief Multiplies every index of one period.
 */
struct CustomDragEvent {
	core::Granularity granularity = core::Granularity::Monthly;
	int target = 1;
	double multiplier = 1.0;
	Scope scope = Scope::PostTrial;
};

/**
 * @struct SwapEvent
 * @brief Exchanges the mean index levels of two periods, or of two date
 * ranges paired period by period.
 */
struct SwapEvent {
	core::Granularity granularity = core::Granularity::Monthly;
	std::optional<core::DateRange> range_a;
	std::optional<core::DateRange> range_b;
	int period_a = 0;
	int period_b = 0;
	Scope scope = Scope::PostTrial;

	static SwapEvent periods(core::Granularity granularity, int a, int b, Scope scope = Scope::PostTrial);
	static SwapEvent ranges(core::Granularity granularity, core::DateRange a, core::DateRange b,
	                        Scope scope = Scope::PostTrial);

	bool isRangeSwap() const noexcept {
		return range_a.has_value() && range_b.has_value();
	}

	/**
	 * @brief Period pairs to exchange.
	 *
	 * For range swaps the sorted periods covered by each range are paired
	 * positionally; trailing periods of the longer range are left out.
	 */
	std::vector<std::pair<int, int>> pairs() const;
};

/**
 * @struct ReappliedShockEvent
 * @brief Re-injects a previously extracted shock signature at a new start date.
 */
struct ReappliedShockEvent {
	std::string signature_name;
	InjectionMode mode = InjectionMode::Absolute;
	core::CivilDate new_start;
	int duration = 1;
	/// Per-day excess volumes, one entry per day from new_start.
	std::vector<core::MetricTotals> absolute_deltas;
	/// Per-day excess as a fraction of the organic floor.
	std::vector<core::MetricTotals> relative_fractions;

	core::DateRange window() const {
		return core::DateRange::ofLength(new_start, duration);
	}
};

/// Closed set of events the simulation understands.
using Event = std::variant<ShockEvent, CustomDragEvent, SwapEvent, ReappliedShockEvent>;

/// Scope of a structural event; time-bound events always act after the trial.
Scope scopeOf(const Event &event);

/// True for CustomDrag and Swap events, which reshape index layers.
bool isStructural(const Event &event);

/// Kind label ("Shock", "Custom Drag", "Swap", "Reapplied Shock").
std::string kindLabel(const Event &event);

/// One-line human readable summary used in audit and attribution rows.
std::string describe(const Event &event);

/**
 * @brief Validates an event's fields.
 * @throws std::invalid_argument on non-positive durations, negative multipliers,
 * period keys outside the granularity's range or signature vectors whose length
 * differs from the duration.
 */
void validate(const Event &event);

} // namespace demanddna::events
