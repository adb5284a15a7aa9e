#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

const char* columnTypeName(ColumnType type) noexcept;

/**
 * @brief One named column with an explicit type tag and a per-row null mask.
 * @details NUMERIC columns store std::vector<double>, CATEGORICAL columns std::vector<std::string>.
 *          missing[r] != 0 is the null marker; the stored value at a null row is unspecified.
 *          numeric() and TypedTable::addColumn flag NaN and infinite values as null.
 */
struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    static TypedColumn numeric(std::string name, std::vector<double> values, MissingMask missing = {});
    static TypedColumn categorical(std::string name, std::vector<std::string> values, MissingMask missing = {});

    size_t size() const noexcept;
    bool isMissing(size_t row) const noexcept { return row < missing.size() && missing[row] != 0; }
    size_t missingCount() const noexcept;

    // Nulls the cell; numeric storage is set to NaN, categorical storage to "".
    void setMissing(size_t row);
};

/**
 * @brief Row-aligned, column-ordered in-memory table.
 * @details Column types are fixed by whoever builds the table (usually CsvTableReader);
 *          the anonymization engine reads the tag and never re-infers it.
 */
class TypedTable {
public:
    TypedTable() = default;

    /**
     * @throws Kanon::DatasetException when column lengths differ, a mask does not match its
     *         values, or a column name repeats.
     */
    explicit TypedTable(std::vector<TypedColumn> columns);

    /**
     * @brief Appends a column at the end of the column order.
     * @throws Kanon::DatasetException on a length mismatch or a duplicate name.
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const TypedColumn& column(size_t idx) const { return columns_.at(idx); }
    TypedColumn& column(size_t idx) { return columns_.at(idx); }
    std::vector<std::string> columnNames() const;

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief True when every column holds rowCount() values and a rowCount()-sized missing mask,
     *        and no numeric cell holds an unflagged NaN or infinity.
     * @details Mutable column access can break alignment; the engine checks this before transforming.
     */
    bool isRowAligned() const;

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
