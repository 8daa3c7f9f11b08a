#pragma once

#include "DataFrame.h"

#include <iosfwd>
#include <string>

namespace DataFrameIO {

/**
 * @brief Parses CSV text into a DataFrame.
 * @details A column is stored numerically when every non-missing cell parses as
 *          a double; otherwise it is kept as text. Missing tokens: empty, na,
 *          n/a, null, none, nan, missing (case-insensitive).
 * @throws Sieve::DatasetException on an empty or malformed header.
 */
DataFrame readCsv(std::istream& in, char delimiter = ',');

/**
 * @throws Sieve::IOException when the file cannot be opened.
 */
DataFrame loadCsv(const std::string& path, char delimiter = ',');

void writeCsv(const DataFrame& data, std::ostream& out, char delimiter = ',');
void saveCsv(const DataFrame& data, const std::string& path, char delimiter = ',');

/**
 * @brief Writes the frame as a Parquet file through Apache Arrow.
 * @throws Sieve::IOException on write failure or when the build has no Arrow support.
 */
void saveParquet(const DataFrame& data, const std::string& path);

bool isMissingToken(const std::string& raw);

} // namespace DataFrameIO
