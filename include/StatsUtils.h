#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {
// Arithmetic mean of values[first, last); 0 for an empty range.
double rangeMean(const std::vector<double>& values, size_t first, size_t last);
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Equal-frequency bin edges over ascending values.
 * @details Returns binCount + 1 interpolated quantiles, then drops every edge that is not
 *          more than 1e-8 above the previously kept one. A constant input keeps two equal edges.
 * @pre sorted is ascending and non-empty; binCount >= 1.
 */
std::vector<double> quantileBinEdges(const std::vector<double>& sorted, size_t binCount);
}
