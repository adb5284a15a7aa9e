#include "EquivalenceClasses.h"
#include <algorithm>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>

namespace EquivalenceClasses {
namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

// Code 0 is reserved for the null marker; values get 1.. in first-seen order.
std::vector<size_t> encodeColumn(const TypedColumn& col, size_t rows) {
    std::vector<size_t> codes(rows, 0);
    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<NumVec>(col.values);
        std::map<double, size_t> dict;
        for (size_t r = 0; r < rows; ++r) {
            if (col.isMissing(r)) continue;
            auto it = dict.emplace(values[r], dict.size() + 1).first;
            codes[r] = it->second;
        }
    } else {
        const auto& values = std::get<StrVec>(col.values);
        std::unordered_map<std::string, size_t> dict;
        dict.reserve(rows);
        for (size_t r = 0; r < rows; ++r) {
            if (col.isMissing(r)) continue;
            auto it = dict.emplace(values[r], dict.size() + 1).first;
            codes[r] = it->second;
        }
    }
    return codes;
}
}

std::vector<ClassRows> build(const TypedTable& table, const std::vector<size_t>& columnIndices) {
    const size_t rows = table.rowCount();
    std::vector<size_t> sortedColumns = columnIndices;
    std::sort(sortedColumns.begin(), sortedColumns.end());
    sortedColumns.erase(std::unique(sortedColumns.begin(), sortedColumns.end()), sortedColumns.end());

    std::vector<std::vector<size_t>> encoded;
    encoded.reserve(sortedColumns.size());
    for (size_t idx : sortedColumns) encoded.push_back(encodeColumn(table.column(idx), rows));

    std::map<std::vector<size_t>, size_t> classByKey;
    std::vector<ClassRows> classes;
    std::vector<size_t> key(encoded.size());
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < encoded.size(); ++c) key[c] = encoded[c][r];
        auto [it, inserted] = classByKey.emplace(key, classes.size());
        if (inserted) classes.emplace_back();
        classes[it->second].push_back(r);
    }
    return classes;
}

size_t minClassSize(const std::vector<ClassRows>& classes) noexcept {
    if (classes.empty()) return 0;
    size_t smallest = std::numeric_limits<size_t>::max();
    for (const auto& cls : classes) smallest = std::min(smallest, cls.size());
    return smallest;
}

bool isKAnonymous(const TypedTable& table, const std::vector<size_t>& columnIndices, size_t k) {
    const auto classes = build(table, columnIndices);
    if (classes.empty()) return true;
    return minClassSize(classes) >= k;
}

size_t suppressUndersized(TypedTable& table, const std::vector<size_t>& columnIndices, size_t k,
                          size_t* undersizedClassesOut) {
    const auto classes = build(table, columnIndices);
    size_t suppressedRows = 0;
    size_t undersized = 0;
    for (const auto& cls : classes) {
        if (cls.size() >= k) continue;
        ++undersized;
        for (size_t r : cls) {
            for (size_t idx : columnIndices) table.column(idx).setMissing(r);
            ++suppressedRows;
        }
    }
    if (undersizedClassesOut) *undersizedClassesOut = undersized;
    return suppressedRows;
}

} // namespace EquivalenceClasses
