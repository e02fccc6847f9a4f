#include "demand-dna/events/event_log.hpp"
#include "demand-dna/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace demanddna::events {

EventLog::EventLog(std::vector<Event> events) {
	events_.reserve(events.size());
	for (auto &event : events) {
		append(std::move(event));
	}
}

void EventLog::append(Event event) {
	validate(event);
	DEMANDDNA_DEBUG("Event #{} appended: {} {}", events_.size(), kindLabel(event), describe(event));
	events_.push_back(std::move(event));
}

void EventLog::remove(std::size_t index) {
	if (index >= events_.size()) {
		throw std::out_of_range("Event index " + std::to_string(index) + " is past the end of the log.");
	}
	events_.erase(events_.begin() + static_cast<std::ptrdiff_t>(index));
}

void EventLog::shiftShock(std::size_t index, const core::CivilDate &new_start) {
	if (index >= events_.size()) {
		throw std::out_of_range("Event index " + std::to_string(index) + " is past the end of the log.");
	}
	auto *shock = std::get_if<ShockEvent>(&events_[index]);
	if (shock == nullptr) {
		throw std::logic_error("Only Shock events can be shifted.");
	}
	const auto length = shock->window.start.daysUntil(shock->window.end);
	shock->window = core::DateRange(new_start, new_start.addDays(length));
}

EventLog EventLog::prefix(std::size_t count) const {
	EventLog result;
	const auto n = std::min(count, events_.size());
	result.events_.assign(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(n));
	return result;
}

} // namespace demanddna::events
