#pragma once

#include "ColumnTypes.h"
#include "DataFrame.h"

#include <string>
#include <vector>

struct NumericProjection {
    DataFrame frame;
    std::vector<std::string> numericColumns;
};

/**
 * @brief Null-free, numeric-only copy of `data`.
 * @details Numeric-typed columns are cast to double and kept in their original
 *          order, every other column is dropped, then any row with a null (or
 *          non-finite value) in a kept column is removed. `data` is not modified.
 * @throws Sieve::DataContractException when a column is missing from
 *         `columnTypes` or a numeric-typed cell cannot be cast to double.
 */
NumericProjection projectNumeric(const DataFrame& data, const ColumnTypeMap& columnTypes);
