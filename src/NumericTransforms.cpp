#include "NumericTransforms.h"
#include "CommonUtils.h"
#include "KanonExceptions.h"
#include "StatsUtils.h"
#include <algorithm>

namespace NumericTransforms {
namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

const NumVec& numericValues(const TypedColumn& col, const char* operation) {
    if (col.type != ColumnType::NUMERIC || !std::holds_alternative<NumVec>(col.values)) {
        throw Kanon::DatasetException(std::string(operation) + " requires a numeric column: " + col.name);
    }
    return std::get<NumVec>(col.values);
}

std::vector<size_t> presentRows(const TypedColumn& col, size_t n) {
    std::vector<size_t> rows;
    rows.reserve(n);
    for (size_t r = 0; r < n; ++r) {
        if (!col.isMissing(r)) rows.push_back(r);
    }
    return rows;
}
}

std::string rangeLabel(double low, double high) {
    return CommonUtils::formatFixed2(low) + "-" + CommonUtils::formatFixed2(high);
}

TypedColumn discretizeQuantile(const TypedColumn& col, size_t binCount, std::vector<double>* edgesOut) {
    const NumVec& values = numericValues(col, "Quantile binning");
    const size_t n = values.size();
    if (binCount == 0) binCount = 1;

    const std::vector<size_t> rows = presentRows(col, n);
    NumVec sorted;
    sorted.reserve(rows.size());
    for (size_t r : rows) sorted.push_back(values[r]);
    std::sort(sorted.begin(), sorted.end());

    const NumVec edges = StatsUtils::quantileBinEdges(sorted, binCount);
    if (edgesOut) *edgesOut = edges;

    StrVec labels;
    const size_t bins = edges.size() >= 2 ? edges.size() - 1 : 0;
    labels.reserve(bins);
    for (size_t b = 0; b < bins; ++b) labels.push_back(rangeLabel(edges[b], edges[b + 1]));

    StrVec out(n);
    MissingMask missing = col.missing;
    missing.resize(n, static_cast<uint8_t>(0));
    for (size_t r : rows) {
        // Inner edges are edges[1 .. bins-1]; values at or above an inner edge move right.
        const auto innerBegin = edges.begin() + 1;
        const auto innerEnd = edges.end() - 1;
        size_t bin = static_cast<size_t>(std::upper_bound(innerBegin, innerEnd, values[r]) - innerBegin);
        bin = std::min(bin, bins - 1);
        out[r] = labels[bin];
    }

    return TypedColumn::categorical(col.name, std::move(out), std::move(missing));
}

TypedColumn microaggregate(const TypedColumn& col, size_t groupSize) {
    const NumVec& values = numericValues(col, "Microaggregation");
    const size_t n = values.size();
    if (groupSize == 0) groupSize = 1;

    std::vector<size_t> order = presentRows(col, n);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return values[a] < values[b]; });

    NumVec sorted;
    sorted.reserve(order.size());
    for (size_t r : order) sorted.push_back(values[r]);

    NumVec out = values;
    for (size_t start = 0; start < sorted.size(); start += groupSize) {
        const size_t end = std::min(start + groupSize, sorted.size());
        const double mean = StatsUtils::rangeMean(sorted, start, end);
        for (size_t i = start; i < end; ++i) out[order[i]] = mean;
    }

    MissingMask missing = col.missing;
    missing.resize(n, static_cast<uint8_t>(0));
    return TypedColumn::numeric(col.name, std::move(out), std::move(missing));
}

} // namespace NumericTransforms
