#include "demand-dna/core/year_frame.hpp"

#include <algorithm>
#include <stdexcept>

namespace demanddna::core {

YearFrame::YearFrame(int year) : year_(year), first_day_key_(CivilDate(year, 1, 1).dayKey()) {
	const auto length = static_cast<std::size_t>(CivilDate::daysInYear(year));
	dates_.reserve(length);
	months_.reserve(length);
	weeks_.reserve(length);
	days_of_year_.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		const auto date = CivilDate::fromDayKey(first_day_key_ + static_cast<std::int64_t>(i));
		dates_.push_back(date);
		months_.push_back(date.month());
		weeks_.push_back(date.isoWeek());
		days_of_year_.push_back(date.dayOfYear());
	}
	for (auto &columns : layers_) {
		columns.traffic.assign(length, 1.0);
		columns.conversion_rate.assign(length, 1.0);
		columns.order_value.assign(length, 1.0);
	}
}

int YearFrame::period(std::size_t row, Granularity granularity) const {
	switch (granularity) {
	case Granularity::Monthly:
		return month(row);
	case Granularity::Weekly:
		return week(row);
	case Granularity::Daily:
		return dayOfYear(row);
	}
	throw std::invalid_argument("Unknown granularity.");
}

std::optional<std::size_t> YearFrame::rowOf(const CivilDate &date) const {
	const auto offset = date.dayKey() - first_day_key_;
	if (offset < 0 || offset >= static_cast<std::int64_t>(dates_.size())) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(offset);
}

std::vector<std::size_t> YearFrame::rowsIn(const DateRange &range) const {
	std::vector<std::size_t> rows;
	const auto last = static_cast<std::int64_t>(dates_.size()) - 1;
	auto lo = std::max<std::int64_t>(range.start.dayKey() - first_day_key_, 0);
	auto hi = std::min<std::int64_t>(range.end.dayKey() - first_day_key_, last);
	for (auto offset = lo; offset <= hi; ++offset) {
		rows.push_back(static_cast<std::size_t>(offset));
	}
	return rows;
}

std::vector<std::size_t> YearFrame::rowsForPeriod(Granularity granularity, int period_key) const {
	std::vector<std::size_t> rows;
	for (std::size_t row = 0; row < dates_.size(); ++row) {
		if (period(row, granularity) == period_key) {
			rows.push_back(row);
		}
	}
	return rows;
}

} // namespace demanddna::core
