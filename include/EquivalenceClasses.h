#pragma once
#include "TypedTable.h"
#include <cstddef>
#include <vector>

namespace EquivalenceClasses {

// Row indices sharing one quasi-identifier tuple, ascending.
using ClassRows = std::vector<size_t>;

/**
 * @brief Groups rows by their values across the given columns.
 * @details A null cell is a value of its own: two nulls in the same column compare equal.
 *          Classes are returned in order of their first row. Column order does not change the grouping.
 * @pre every index is a valid column of a row-aligned table.
 */
std::vector<ClassRows> build(const TypedTable& table, const std::vector<size_t>& columnIndices);

// Smallest class size; 0 for an empty table.
size_t minClassSize(const std::vector<ClassRows>& classes) noexcept;

/**
 * @brief True iff every equivalence class over columnIndices has at least k rows.
 * @details An empty table is compliant.
 */
bool isKAnonymous(const TypedTable& table, const std::vector<size_t>& columnIndices, size_t k);

/**
 * @brief Nulls every column in columnIndices for each row whose class has fewer than k rows.
 * @details One pass over freshly computed classes; the merged all-null class is not re-checked.
 * @param undersizedClassesOut optional; receives the number of classes that were suppressed.
 * @return number of rows suppressed.
 */
size_t suppressUndersized(TypedTable& table, const std::vector<size_t>& columnIndices, size_t k,
                          size_t* undersizedClassesOut = nullptr);

} // namespace EquivalenceClasses
