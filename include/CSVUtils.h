#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// CSV tokenization and field quoting. Type decisions live in DataFrameIO.

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @post *malformed is set when the record ends inside an open quote.
 * @return Empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string quoteField(const std::string& value, char delimiter);
}
