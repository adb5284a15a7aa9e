#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and field quoting. No semantic typing happens here.

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span physical lines.
 * @param malformed set when the record ends inside an open quote.
 * @return fields of the record, or an empty vector at EOF / on a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

// Blank names become column_<n>; repeats get _2, _3, ... suffixes.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Quotes a field when it contains the delimiter, a quote, CR/LF, or edge whitespace.
std::string escapeField(const std::string& value, char delimiter);
}
