#pragma once
#include "TypedTable.h"
#include <ostream>
#include <string>

namespace TableExporter {

// Shortest round-trip text for a finite double; "" for NaN/inf.
std::string formatNumber(double value);

/**
 * @brief Writes header plus rows; nulls become empty fields.
 * @return false with errorOut set when the stream fails.
 */
bool writeCsv(const TypedTable& table, std::ostream& out, char delimiter, std::string& errorOut);
bool writeCsvFile(const TypedTable& table, const std::string& path, char delimiter, std::string& errorOut);

/**
 * @brief Writes an Arrow table (float64 / utf8, nullable) as Parquet.
 * @details Only functional in builds with KANON_USE_NATIVE_PARQUET; otherwise returns false
 *          and explains in errorOut.
 */
bool writeParquetFile(const TypedTable& table, const std::string& path, std::string& errorOut);

bool nativeParquetAvailable() noexcept;

} // namespace TableExporter
