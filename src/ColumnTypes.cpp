#include "ColumnTypes.h"

#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <utility>

namespace {
const std::pair<ColumnType, const char*> kTypeNames[] = {
    {ColumnType::CATEGORY, "category"},
    {ColumnType::CATEGORY_HIGH_CARDINALITY, "category_high_cardinality"},
    {ColumnType::DATETIME, "datetime"},
    {ColumnType::EMAIL, "email"},
    {ColumnType::NUMBER, "number"},
    {ColumnType::NUMBER_WITH_DECIMALS, "number_with_decimals"},
    {ColumnType::PHONE_NUMBER, "phone_number"},
    {ColumnType::TEXT, "text"},
    {ColumnType::TRUE_OR_FALSE, "true_or_false"},
    {ColumnType::ZIP_CODE, "zip_code"},
};
} // namespace

bool isNumericType(ColumnType type) noexcept {
    return type == ColumnType::NUMBER || type == ColumnType::NUMBER_WITH_DECIMALS;
}

const char* columnTypeName(ColumnType type) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.first == type) return entry.second;
    }
    return "text";
}

ColumnType parseColumnType(const std::string& value, const std::string& column) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(value));
    for (const auto& entry : kTypeNames) {
        if (key == entry.second) return entry.first;
    }
    throw Sieve::DataContractException(column, "Unknown column type '" + value + "' for column '" + column + "'");
}

ColumnType requireColumnType(const ColumnTypeMap& types, const std::string& column) {
    auto it = types.find(column);
    if (it == types.end()) {
        throw Sieve::DataContractException(column, "Column '" + column + "' has no entry in column_types");
    }
    return it->second;
}
