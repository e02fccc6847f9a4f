#include "demand-dna/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace demanddna::utils::stats {

double sum(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0);
}

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return sum(values) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return 0.0;
	}
	const std::size_t n = values.size();
	const std::size_t mid = n / 2;
	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	const double upper = values[mid];
	if (n % 2 == 1) {
		return upper;
	}
	const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
	return 0.5 * (lower + upper);
}

double quantile(std::vector<double> values, double q) {
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile must lie in [0, 1].");
	}
	if (values.empty()) {
		return 0.0;
	}
	std::sort(values.begin(), values.end());
	const double position = q * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, values.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return values[lower] + (values[upper] - values[lower]) * fraction;
}

} // namespace demanddna::utils::stats
