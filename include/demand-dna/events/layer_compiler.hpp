#pragma once

#include "demand-dna/core/year_frame.hpp"
#include "demand-dna/dna/blender.hpp"
#include "demand-dna/events/event_log.hpp"

namespace demanddna::events {

/**
 * @brief Applies one structural event to a single layer of @p frame.
 *
 * CustomDrag multiplies all three indices of the rows in the target period.
 * Swap rescales each period of a pair by the other period's mean over its
 * own mean; when a mean is zero the other mean is written instead. Periods
 * with no rows in the frame leave the layer untouched. Non-structural events
 * are ignored.
 */
void applyStructuralEvent(core::YearFrame &frame, core::Layer layer, const Event &event);

/**
 * @brief Builds the pure / pre-trial / work layers of a projection year.
 *
 * 1. The monthly pure DNA is broadcast onto every day of its month (unmapped
 *    months are neutral) and copied into all three layers.
 * 2. Pre-trial structural events are applied in log order to the pre-trial layer.
 * 3. The pre-trial layer is copied into the work layer.
 * 4. Post-trial structural events are applied in log order to the work layer.
 */
core::YearFrame compileLayers(int year, const dna::PureDna &pure_dna, const EventLog &log);

} // namespace demanddna::events
