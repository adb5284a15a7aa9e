/**
 * @file test_table_exporter.cpp
 * @brief CSV output of anonymized tables and the Parquet availability switch.
 */

#include <gtest/gtest.h>
#include "CsvTableReader.h"
#include "TableExporter.h"
#include <filesystem>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

static TypedTable sampleTable() {
    return TypedTable({TypedColumn::numeric("age", {22, 59.5, 0}, {0, 0, 1}),
                       TypedColumn::categorical("city", {"Berlin", "New York, NY", ""}, {0, 0, 1})});
}

TEST(TableExporterTest, FormatNumber) {
    EXPECT_EQ(TableExporter::formatNumber(22.0), "22");
    EXPECT_EQ(TableExporter::formatNumber(59.5), "59.5");
    EXPECT_EQ(TableExporter::formatNumber(0.1), "0.1");
    EXPECT_EQ(TableExporter::formatNumber(std::numeric_limits<double>::quiet_NaN()), "");
}

TEST(TableExporterTest, WritesCsvWithNullsAsEmptyFields) {
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(TableExporter::writeCsv(sampleTable(), out, ',', error)) << error;
    EXPECT_EQ(out.str(), "age,city\n22,Berlin\n59.5,\"New York, NY\"\n,\n");
}

TEST(TableExporterTest, CsvReadsBackWithSameShape) {
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(TableExporter::writeCsv(sampleTable(), out, ';', error));

    std::istringstream in(out.str());
    const TypedTable back = CsvTableReader(';').read(in);
    EXPECT_EQ(back.columnNames(), (std::vector<std::string>{"age", "city"}));
    EXPECT_EQ(back.rowCount(), 3u);
    EXPECT_EQ(back.column(0).type, ColumnType::NUMERIC);
    EXPECT_TRUE(back.column(0).isMissing(2));
    EXPECT_TRUE(back.column(1).isMissing(2));
    EXPECT_EQ(std::get<std::vector<std::string>>(back.column(1).values)[1], "New York, NY");
}

TEST(TableExporterTest, UnwritablePathReportsError) {
    std::string error;
    EXPECT_FALSE(TableExporter::writeCsvFile(sampleTable(), "/nonexistent/dir/out.csv", ',', error));
    EXPECT_NE(error.find("/nonexistent/dir/out.csv"), std::string::npos);
}

TEST(TableExporterTest, WritesCsvFile) {
    const auto path = (std::filesystem::temp_directory_path() / "kanon_exporter_test.csv").string();
    std::string error;
    ASSERT_TRUE(TableExporter::writeCsvFile(sampleTable(), path, ',', error)) << error;
    EXPECT_EQ(CsvTableReader().readFile(path).rowCount(), 3u);
    std::filesystem::remove(path);
}

TEST(TableExporterTest, ParquetFollowsBuildOption) {
    const auto path = (std::filesystem::temp_directory_path() / "kanon_exporter_test.parquet").string();
    std::string error;
    const bool ok = TableExporter::writeParquetFile(sampleTable(), path, error);
    EXPECT_EQ(ok, TableExporter::nativeParquetAvailable());
    if (!ok) EXPECT_FALSE(error.empty());
    std::filesystem::remove(path);
}
