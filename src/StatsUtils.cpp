#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace StatsUtils {
namespace {
constexpr double kEdgeCollapseWidth = 1e-8;
}

double rangeMean(const std::vector<double>& values, size_t first, size_t last) {
    last = std::min(last, values.size());
    if (first >= last) return 0.0;
    const long double sum = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(first),
                                            values.begin() + static_cast<std::ptrdiff_t>(last),
                                            0.0L);
    return static_cast<double>(sum / static_cast<long double>(last - first));
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

std::vector<double> quantileBinEdges(const std::vector<double>& sorted, size_t binCount) {
    if (sorted.empty() || binCount == 0) return {};
    if (sorted.front() == sorted.back()) return {sorted.front(), sorted.back()};

    std::vector<double> edges;
    edges.reserve(binCount + 1);
    for (size_t i = 0; i <= binCount; ++i) {
        const double q = static_cast<double>(i) / static_cast<double>(binCount);
        const double edge = percentileSorted(sorted, q);
        if (!edges.empty() && !(edge - edges.back() > kEdgeCollapseWidth)) continue;
        edges.push_back(edge);
    }
    // A collapsed upper edge still has to cover the maximum.
    if (edges.size() < 2) {
        edges.push_back(sorted.back());
    } else {
        edges.back() = std::max(edges.back(), sorted.back());
    }
    return edges;
}
}
