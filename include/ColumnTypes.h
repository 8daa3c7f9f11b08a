#pragma once

#include <map>
#include <string>

enum class ColumnType {
    CATEGORY,
    CATEGORY_HIGH_CARDINALITY,
    DATETIME,
    EMAIL,
    NUMBER,
    NUMBER_WITH_DECIMALS,
    PHONE_NUMBER,
    TEXT,
    TRUE_OR_FALSE,
    ZIP_CODE
};

using ColumnTypeMap = std::map<std::string, ColumnType>;

bool isNumericType(ColumnType type) noexcept;

/**
 * @brief Wire name of a column type ("number", "category", ...).
 */
const char* columnTypeName(ColumnType type) noexcept;

/**
 * @brief Parses a wire name; `column` names the owner for error reporting.
 * @throws Sieve::DataContractException on an unknown tag.
 */
ColumnType parseColumnType(const std::string& value, const std::string& column);

/**
 * @brief Type of `column`, required to be present.
 * @throws Sieve::DataContractException naming the column when absent.
 */
ColumnType requireColumnType(const ColumnTypeMap& types, const std::string& column);
