#pragma once

#include <stdexcept>
#include <string>

namespace demanddna::core {

/// Period resolution used by profiles, structural events and goal tracking.
enum class Granularity {
	Monthly,
	Weekly,
	Daily
};

/// Absolute-unit volume metrics produced by the projection.
enum class Metric {
	Sessions,
	Conversions,
	Revenue
};

inline std::string toString(Granularity granularity) {
	switch (granularity) {
	case Granularity::Monthly:
		return "Monthly";
	case Granularity::Weekly:
		return "Weekly";
	case Granularity::Daily:
		return "Daily";
	}
	throw std::invalid_argument("Unknown granularity.");
}

inline std::string toString(Metric metric) {
	switch (metric) {
	case Metric::Sessions:
		return "Sessions";
	case Metric::Conversions:
		return "Conversions";
	case Metric::Revenue:
		return "Revenue";
	}
	throw std::invalid_argument("Unknown metric.");
}

/**
 * @struct MetricTotals
 * @brief Sessions, conversions and revenue for one day or one aggregated window.
 */
struct MetricTotals {
	double sessions = 0.0;
	double conversions = 0.0;
	double revenue = 0.0;

	double get(Metric metric) const {
		switch (metric) {
		case Metric::Sessions:
			return sessions;
		case Metric::Conversions:
			return conversions;
		case Metric::Revenue:
			return revenue;
		}
		throw std::invalid_argument("Unknown metric.");
	}

	double &get(Metric metric) {
		switch (metric) {
		case Metric::Sessions:
			return sessions;
		case Metric::Conversions:
			return conversions;
		case Metric::Revenue:
			return revenue;
		}
		throw std::invalid_argument("Unknown metric.");
	}

	/// Conversions per session, 0 when there are no sessions.
	double conversionRate() const {
		return sessions > 0.0 ? conversions / sessions : 0.0;
	}

	/// Revenue per conversion, 0 when there are no conversions.
	double orderValue() const {
		return conversions > 0.0 ? revenue / conversions : 0.0;
	}

	MetricTotals &operator+=(const MetricTotals &other) {
		sessions += other.sessions;
		conversions += other.conversions;
		revenue += other.revenue;
		return *this;
	}

	MetricTotals scaled(double factor) const {
		return MetricTotals {sessions * factor, conversions * factor, revenue * factor};
	}
};

/**
 * @struct IndexTriple
 * @brief Normalized seasonal indices (median = 1.0) for the three demand drivers.
 */
struct IndexTriple {
	double traffic = 1.0;
	double conversion_rate = 1.0;
	double order_value = 1.0;

	static IndexTriple neutral() {
		return IndexTriple {};
	}
};

} // namespace demanddna::core
