#include "CsvTableReader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "KanonExceptions.h"
#include <charconv>
#include <cmath>
#include <fstream>

bool CsvTableReader::parseNumber(const std::string& token, double& out) {
    std::string cleaned = CommonUtils::trim(token);
    if (CommonUtils::isMissingToken(cleaned)) return false;
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

TypedTable CsvTableReader::readFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Kanon::IOException("Could not open file: " + path);
    return read(in);
}

TypedTable CsvTableReader::read(std::istream& in) const {
    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Kanon::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);
    const size_t cols = header.size();

    std::vector<std::vector<std::string>> cells(cols);
    std::vector<MissingMask> missing(cols);
    std::vector<size_t> nonNumericHits(cols, 0);

    size_t record = 1;
    while (in.peek() != EOF) {
        ++record;
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
        if (malformed) {
            throw Kanon::DatasetException("Unterminated quoted field in record " + std::to_string(record));
        }
        if (row.empty()) continue;
        if (row.size() > cols) {
            throw Kanon::DatasetException("Record " + std::to_string(record) + " has " + std::to_string(row.size()) +
                                          " fields, header has " + std::to_string(cols));
        }
        row.resize(cols);

        for (size_t c = 0; c < cols; ++c) {
            const bool isNull = CommonUtils::isMissingToken(row[c]);
            missing[c].push_back(static_cast<uint8_t>(isNull ? 1 : 0));
            double dv = 0.0;
            if (!isNull && !parseNumber(row[c], dv)) ++nonNumericHits[c];
            cells[c].push_back(isNull ? std::string() : std::move(row[c]));
        }
    }

    TypedTable table;
    for (size_t c = 0; c < cols; ++c) {
        ColumnType type = nonNumericHits[c] == 0 ? ColumnType::NUMERIC : ColumnType::CATEGORICAL;
        const auto it = overrides_.find(header[c]);
        if (it != overrides_.end()) {
            if (it->second == ColumnType::NUMERIC && nonNumericHits[c] > 0) {
                throw Kanon::DatasetException("Column '" + header[c] + "' forced numeric but holds " +
                                              std::to_string(nonNumericHits[c]) + " non-numeric values");
            }
            type = it->second;
        }

        if (type == ColumnType::NUMERIC) {
            std::vector<double> values(cells[c].size(), std::nan(""));
            for (size_t r = 0; r < values.size(); ++r) {
                if (!missing[c][r] && !parseNumber(cells[c][r], values[r])) {
                    throw Kanon::DatasetException("Unparseable numeric value '" + cells[c][r] + "' in column '" + header[c] + "'");
                }
            }
            table.addColumn(TypedColumn::numeric(header[c], std::move(values), std::move(missing[c])));
        } else {
            table.addColumn(TypedColumn::categorical(header[c], std::move(cells[c]), std::move(missing[c])));
        }
    }
    return table;
}
