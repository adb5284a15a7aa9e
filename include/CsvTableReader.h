#pragma once
#include "TypedTable.h"
#include <istream>
#include <string>
#include <unordered_map>

/**
 * @brief Loads a delimited text file into a TypedTable and fixes each column's type once.
 * @details A column is NUMERIC when every non-missing cell parses as a finite double, otherwise
 *          CATEGORICAL. Missing tokens ("", na, n/a, null, none, nan, missing) become nulls.
 */
class CsvTableReader {
public:
    explicit CsvTableReader(char delimiter = ',') : delimiter_(delimiter) {}

    // Keys are column names as they appear in the (normalized) header.
    void setColumnTypeOverride(std::string columnName, ColumnType type) { overrides_[std::move(columnName)] = type; }
    void setColumnTypeOverrides(std::unordered_map<std::string, ColumnType> overrides) { overrides_ = std::move(overrides); }

    /**
     * @throws Kanon::IOException when the file cannot be opened.
     * @throws Kanon::DatasetException on a malformed header/record, a record wider than the header,
     *         or a NUMERIC override on a column holding non-numeric cells.
     */
    TypedTable readFile(const std::string& path) const;
    TypedTable read(std::istream& in) const;

    static bool parseNumber(const std::string& token, double& out);

private:
    char delimiter_;
    std::unordered_map<std::string, ColumnType> overrides_;
};
