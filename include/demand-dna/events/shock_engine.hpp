#pragma once

#include "demand-dna/core/calendar.hpp"
#include "demand-dna/core/types.hpp"
#include "demand-dna/core/year_frame.hpp"
#include "demand-dna/events/event_log.hpp"

#include <vector>

namespace demanddna::events {

/**
 * @brief Weight of a campaign shape on one day of its window.
 *
 * With p = elapsed / duration:
 *   - Step:         1
 *   - LinearFade:   1 - p
 *   - FrontLoaded:  exp(-3p)
 *   - DelayedPeak:  exp(-(elapsed - 0.4 duration)^2 / (2 (0.3 duration)^2))
 *
 * @param elapsed Days since the campaign start (0 on the first day).
 * @param duration Inclusive length of the campaign in days.
 * @throws std::invalid_argument if duration is not positive.
 */
double shapeWeight(CampaignShape shape, int elapsed, int duration);

/// Lift contributed by one shock on @p day (0 outside its window).
double shockLift(const ShockEvent &shock, const core::CivilDate &day);

/// Sum of the lifts of every Shock event in @p log active on @p day.
double shockMultiplier(const core::CivilDate &day, const EventLog &log);

/**
 * @struct InjectionSeries
 * @brief Per-day additions from re-applied signatures, aligned to a YearFrame.
 *
 * `absolute` volumes are added to the simulation as they are; `relative`
 * fractions are multiplied by the baseline of the same day first.
 */
struct InjectionSeries {
	std::vector<core::MetricTotals> absolute;
	std::vector<core::MetricTotals> relative;
};

/**
 * @brief Accumulates every ReappliedShock event of @p log onto the days of @p frame.
 *
 * Day d of the re-applied window receives the signature's d-th entry; days
 * outside the projection year are dropped. Alignment is by offset from
 * new_start at both ends: a window starting before 1 January loses its
 * leading entries instead of replaying entry 0 on 1 January. Overlapping
 * signatures add up independently per metric and per channel.
 */
InjectionSeries buildInjections(const core::YearFrame &frame, const EventLog &log);

} // namespace demanddna::events
