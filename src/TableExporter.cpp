#include "TableExporter.h"
#include "CSVUtils.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#ifdef KANON_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace TableExporter {
namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

std::string cellText(const TypedColumn& col, size_t row) {
    if (col.isMissing(row)) return std::string();
    if (col.type == ColumnType::NUMERIC) return formatNumber(std::get<NumVec>(col.values)[row]);
    return std::get<StrVec>(col.values)[row];
}
}

std::string formatNumber(double value) {
    if (!std::isfinite(value)) return std::string();
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return std::string();
    return std::string(buf, ptr);
}

bool writeCsv(const TypedTable& table, std::ostream& out, char delimiter, std::string& errorOut) {
    std::string chunk;
    const auto& columns = table.columns();
    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) chunk.push_back(delimiter);
        chunk += CSVUtils::escapeField(columns[c].name, delimiter);
    }
    chunk.push_back('\n');

    for (size_t r = 0; r < table.rowCount(); ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) chunk.push_back(delimiter);
            chunk += CSVUtils::escapeField(cellText(columns[c], r), delimiter);
        }
        chunk.push_back('\n');
        if (chunk.size() >= (1 << 20)) {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            chunk.clear();
        }
    }
    if (!chunk.empty()) {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    }
    out.flush();
    if (!out.good()) {
        errorOut = "Failed while writing CSV output";
        return false;
    }
    return true;
}

bool writeCsvFile(const TypedTable& table, const std::string& path, char delimiter, std::string& errorOut) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        errorOut = "Failed to open output file: " + path;
        return false;
    }
    if (!writeCsv(table, out, delimiter, errorOut)) {
        errorOut += ": " + path;
        return false;
    }
    return true;
}

bool nativeParquetAvailable() noexcept {
#ifdef KANON_USE_NATIVE_PARQUET
    return true;
#else
    return false;
#endif
}

#ifdef KANON_USE_NATIVE_PARQUET
bool writeParquetFile(const TypedTable& table, const std::string& path, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.colCount());
    arrays.reserve(table.colCount());

    for (const auto& col : table.columns()) {
        std::shared_ptr<arrow::Array> arr;
        if (col.type == ColumnType::NUMERIC) {
            arrow::DoubleBuilder builder;
            const auto& vals = std::get<NumVec>(col.values);
            for (size_t r = 0; r < table.rowCount(); ++r) {
                const bool isNull = col.isMissing(r) || !std::isfinite(vals[r]);
                const arrow::Status st = isNull ? builder.AppendNull() : builder.Append(vals[r]);
                if (!st.ok()) {
                    errorOut = "Failed to append value for numeric column '" + col.name + "': " + st.ToString();
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize numeric Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::float64(), true));
        } else {
            arrow::StringBuilder builder;
            const auto& vals = std::get<StrVec>(col.values);
            for (size_t r = 0; r < table.rowCount(); ++r) {
                const arrow::Status st = col.isMissing(r) ? builder.AppendNull() : builder.Append(vals[r]);
                if (!st.ok()) {
                    errorOut = "Failed to append value for categorical column '" + col.name + "': " + st.ToString();
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize categorical Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::utf8(), true));
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(table.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#else
bool writeParquetFile(const TypedTable&, const std::string& path, std::string& errorOut) {
    errorOut = "Parquet export requested for " + path +
               ", but this build was compiled without native parquet support. Rebuild with Arrow/Parquet libraries enabled.";
    return false;
}
#endif

} // namespace TableExporter
