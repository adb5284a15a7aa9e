#pragma once
#include "TypedTable.h"
#include <cstddef>
#include <string>
#include <unordered_map>

namespace CategoricalTransforms {

// Frequency of every distinct non-null value.
std::unordered_map<std::string, size_t> valueCounts(const TypedColumn& col);

/**
 * @brief Replaces every value seen fewer than k times with label; frequent values and nulls are kept.
 * @throws Kanon::DatasetException when col is not categorical.
 */
TypedColumn generalizeRare(const TypedColumn& col, size_t k, const std::string& label);

/**
 * @brief Nulls every value seen fewer than k times; frequent values and nulls are kept.
 * @throws Kanon::DatasetException when col is not categorical.
 */
TypedColumn suppressRare(const TypedColumn& col, size_t k);

} // namespace CategoricalTransforms
