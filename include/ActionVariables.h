#pragma once

#include "ColumnTypes.h"
#include "Suggestion.h"

#include <string>
#include <vector>

/**
 * @brief Maps each column to its ActionVariable (uuid == column name).
 * @throws Sieve::DataContractException when a column has no entry in `columnTypes`.
 */
ActionVariableMap buildActionVariables(const std::vector<std::string>& columns, const ColumnTypeMap& columnTypes);
