#include "CleaningRules.h"

#include "CommonUtils.h"

#include <set>

std::vector<Suggestion> RemoveColumnsWithHighEmptyRate::evaluate() const {
    std::vector<std::string> emptyColumns;
    for (const auto& name : data_.columnNames()) {
        if (statistics_.columnNumber(name, "null_value_rate") >= tuning_.emptyRateThreshold) {
            emptyColumns.push_back(name);
        }
    }
    if (emptyColumns.empty()) return {};

    return {buildTransformerActionSuggestion(
        "Remove columns with high empty rate",
        "The following columns have high empty rate: " + CommonUtils::join(emptyColumns, ", ") +
            ". Removing them may increase your data quality.",
        "remove",
        emptyColumns,
        std::nullopt,
        {},
        buildActionVariables(emptyColumns))};
}

std::vector<Suggestion> RemoveColumnsWithSingleValue::evaluate() const {
    std::vector<std::string> constantColumns;
    for (const auto& name : data_.columnNames()) {
        if (statistics_.columnNumber(name, "count_distinct") <= 1.0) constantColumns.push_back(name);
    }
    if (constantColumns.empty()) return {};

    return {buildTransformerActionSuggestion(
        "Remove columns with single value",
        "The following columns have single value in all rows: " + CommonUtils::join(constantColumns, ", ") +
            ". Suggest to remove them.",
        "remove",
        constantColumns,
        std::nullopt,
        {},
        buildActionVariables(constantColumns))};
}

std::vector<Suggestion> CleanColumnNames::evaluate() const {
    const auto names = data_.columnNames();
    std::set<std::string> taken(names.begin(), names.end());

    std::vector<std::string> dirty;
    for (const auto& name : names) {
        const std::string clean = CommonUtils::toSnakeCase(name);
        if (clean.empty() || clean == name) continue;
        // Renaming onto an existing column would fail on replay.
        if (taken.count(clean) > 0) continue;
        taken.insert(clean);
        dirty.push_back(name);
    }
    if (dirty.empty()) return {};

    return {buildTransformerActionSuggestion(
        "Clean dirty column names",
        "The following columns have unclean naming conventions: " + CommonUtils::join(dirty, ", ") +
            ". Making these names lowercase and alphanumeric may improve ease of dataset access.",
        "clean_column_name",
        dirty,
        std::nullopt,
        {},
        buildActionVariables(dirty))};
}

std::vector<Suggestion> ImputeMissingValues::evaluate() const {
    std::vector<std::string> sparse;
    for (const auto& col : data_.columns()) {
        if (!isNumericType(columnTypes_.at(col.name))) continue;
        const double rate = statistics_.columnNumber(col.name, "null_value_rate");
        if (rate > 0.0 && rate < tuning_.emptyRateThreshold) sparse.push_back(col.name);
    }
    if (sparse.empty()) return {};

    ActionOptions options;
    options["strategy"] = JsonValue::string("median");
    return {buildTransformerActionSuggestion(
        "Fill in missing values",
        "The following numeric columns have missing values: " + CommonUtils::join(sparse, ", ") +
            ". Filling them with the column median keeps every row usable.",
        "impute",
        sparse,
        std::nullopt,
        std::move(options),
        buildActionVariables(sparse))};
}
