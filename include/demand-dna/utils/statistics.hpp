#pragma once

#include <vector>

namespace demanddna::utils {

/**
 * @brief Order statistics and averages shared by the profile, DNA and
 * signature stages.
 *
 * Every function accepts an empty input and returns 0.0 for it, so callers
 * can treat "no observations" as a degenerate value rather than an error.
 */
namespace stats {

double sum(const std::vector<double> &values);

double mean(const std::vector<double> &values);

/**
 * @brief Median of the values; the mean of the two middle elements for even sizes.
 */
double median(std::vector<double> values);

/**
 * @brief Quantile with linear interpolation between closest ranks.
 * @param values Sample values (any order).
 * @param q Quantile in [0, 1].
 * @throws std::invalid_argument if q is outside [0, 1].
 */
double quantile(std::vector<double> values, double q);

} // namespace stats
} // namespace demanddna::utils
