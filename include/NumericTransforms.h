#pragma once
#include "TypedTable.h"
#include <cstddef>
#include <string>
#include <vector>

namespace NumericTransforms {

/**
 * @brief Equal-frequency discretization of a numeric column into range labels.
 * @details Edges are interpolated quantiles of the non-null values; edges closer than 1e-8 collapse,
 *          so skewed columns produce fewer than binCount labels. Each value lands in the bin found by
 *          upper_bound over the inner edges (last bin closed) and is labelled "<low>-<high>" with two
 *          decimals. Null cells stay null.
 * @param edgesOut optional; receives the edges actually used (non-decreasing).
 * @pre col.type == NUMERIC, binCount >= 1.
 * @post Returned column is CATEGORICAL with the same name and row count.
 * @throws Kanon::DatasetException when col is not numeric.
 */
TypedColumn discretizeQuantile(const TypedColumn& col, size_t binCount, std::vector<double>* edgesOut = nullptr);

std::string rangeLabel(double low, double high);

/**
 * @brief Replaces values by the mean of consecutive groups of groupSize in ascending order.
 * @details Non-null rows are stable-sorted by value and cut into groups of groupSize; the final group
 *          holds the remainder and is kept even when smaller than groupSize. Null cells stay null.
 * @pre col.type == NUMERIC, groupSize >= 1.
 * @post Returned column is NUMERIC with the same name and row count.
 * @throws Kanon::DatasetException when col is not numeric.
 */
TypedColumn microaggregate(const TypedColumn& col, size_t groupSize);

} // namespace NumericTransforms
