#pragma once

#include "demand-dna/events/event.hpp"

#include <cstddef>
#include <vector>

namespace demanddna::events {

/**
 * @class EventLog
 * @brief Ordered list of simulation events.
 *
 * The log is a value: every projection is a fold over a log (or one of its
 * prefixes) starting from the unmodified pure DNA, so copies can be
 * evaluated independently. Order matters for attribution only.
 */
class EventLog {
public:
	using const_iterator = std::vector<Event>::const_iterator;

	EventLog() = default;
	explicit EventLog(std::vector<Event> events);

	/**
	 * @brief Appends an event after validating it.
	 * @throws std::invalid_argument if the event is malformed.
	 */
	void append(Event event);

	/**
	 * @brief Removes the event at @p index.
	 * @throws std::out_of_range if the index is past the end.
	 */
	void remove(std::size_t index);

	/**
	 * @brief Moves a Shock event to a new start date, keeping its length.
	 * @throws std::out_of_range if the index is past the end.
	 * @throws std::logic_error if the event at @p index is not a Shock.
	 */
	void shiftShock(std::size_t index, const core::CivilDate &new_start);

	void clear() noexcept {
		events_.clear();
	}

	/// Copy holding the first @p count events (all of them if count exceeds the size).
	EventLog prefix(std::size_t count) const;

	const Event &at(std::size_t index) const {
		return events_.at(index);
	}

	const std::vector<Event> &events() const noexcept {
		return events_;
	}

	std::size_t size() const noexcept {
		return events_.size();
	}

	bool empty() const noexcept {
		return events_.empty();
	}

	const_iterator begin() const noexcept {
		return events_.begin();
	}

	const_iterator end() const noexcept {
		return events_.end();
	}

private:
	std::vector<Event> events_;
};

} // namespace demanddna::events
