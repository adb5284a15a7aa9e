#include "TypedTable.h"
#include "KanonExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace {
// Non-finite numbers carry no value; they are stored as nulls.
void flagNonFinite(const std::vector<double>& values, MissingMask& missing) {
    for (size_t r = 0; r < values.size() && r < missing.size(); ++r) {
        if (!std::isfinite(values[r])) missing[r] = static_cast<uint8_t>(1);
    }
}

bool hasUnflaggedNonFinite(const TypedColumn& col) {
    if (col.type != ColumnType::NUMERIC) return false;
    const auto& values = std::get<std::vector<double>>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!std::isfinite(values[r]) && !col.isMissing(r)) return true;
    }
    return false;
}
}

const char* columnTypeName(ColumnType type) noexcept {
    return type == ColumnType::NUMERIC ? "numeric" : "categorical";
}

TypedColumn TypedColumn::numeric(std::string name, std::vector<double> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    if (missing.empty()) missing.assign(values.size(), static_cast<uint8_t>(0));
    flagNonFinite(values, missing);
    col.values = std::move(values);
    col.missing = std::move(missing);
    return col;
}

TypedColumn TypedColumn::categorical(std::string name, std::vector<std::string> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    if (missing.empty()) missing.assign(values.size(), static_cast<uint8_t>(0));
    col.values = std::move(values);
    col.missing = std::move(missing);
    return col;
}

size_t TypedColumn::size() const noexcept {
    return std::visit([](const auto& vec) { return vec.size(); }, values);
}

size_t TypedColumn::missingCount() const noexcept {
    return static_cast<size_t>(std::count_if(missing.begin(), missing.end(), [](uint8_t m) { return m != 0; }));
}

void TypedColumn::setMissing(size_t row) {
    if (row >= missing.size()) {
        throw Kanon::DatasetException("Row " + std::to_string(row) + " out of range for column '" + name + "'");
    }
    missing[row] = static_cast<uint8_t>(1);
    if (type == ColumnType::NUMERIC) {
        std::get<std::vector<double>>(values)[row] = std::numeric_limits<double>::quiet_NaN();
    } else {
        std::get<std::vector<std::string>>(values)[row].clear();
    }
}

TypedTable::TypedTable(std::vector<TypedColumn> columns) {
    columns_.reserve(columns.size());
    for (auto& col : columns) addColumn(std::move(col));
}

void TypedTable::addColumn(TypedColumn column) {
    const bool storageMatchesType =
        (column.type == ColumnType::NUMERIC) == std::holds_alternative<std::vector<double>>(column.values);
    if (!storageMatchesType) {
        throw Kanon::DatasetException("Column '" + column.name + "' storage does not match its " +
                                      columnTypeName(column.type) + " type tag");
    }
    if (findColumnIndex(column.name) >= 0) {
        throw Kanon::DatasetException("Duplicate column name: " + column.name);
    }
    const size_t n = column.size();
    if (column.missing.empty() && n > 0) column.missing.assign(n, static_cast<uint8_t>(0));
    if (column.missing.size() != n) {
        throw Kanon::DatasetException("Missing mask size mismatch for column '" + column.name + "'");
    }
    if (column.type == ColumnType::NUMERIC) {
        flagNonFinite(std::get<std::vector<double>>(column.values), column.missing);
    }
    if (!columns_.empty() && n != rowCount_) {
        throw Kanon::DatasetException("Column '" + column.name + "' has " + std::to_string(n) +
                                      " rows, expected " + std::to_string(rowCount_));
    }
    if (columns_.empty()) rowCount_ = n;
    columns_.push_back(std::move(column));
}

std::vector<std::string> TypedTable::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

std::vector<size_t> TypedTable::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    }
    return out;
}

std::vector<size_t> TypedTable::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    }
    return out;
}

int TypedTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

bool TypedTable::isRowAligned() const {
    std::unordered_set<std::string> seen;
    for (const auto& col : columns_) {
        const bool storageMatchesType =
            (col.type == ColumnType::NUMERIC) == std::holds_alternative<std::vector<double>>(col.values);
        if (!storageMatchesType) return false;
        if (col.size() != rowCount_ || col.missing.size() != rowCount_) return false;
        if (!seen.insert(col.name).second) return false;
        if (hasUnflaggedNonFinite(col)) return false;
    }
    return true;
}
