#include "CleaningRules.h"

#include "CommonUtils.h"
#include "FilterExpression.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

std::vector<Suggestion> RemoveDuplicateRows::evaluate() const {
    std::vector<size_t> allColumns(data_.colCount());
    std::iota(allColumns.begin(), allColumns.end(), 0);

    std::unordered_set<std::string> seen;
    seen.reserve(data_.rowCount());
    size_t duplicates = 0;
    for (size_t r = 0; r < data_.rowCount(); ++r) {
        if (!seen.insert(data_.rowKey(r, allColumns)).second) ++duplicates;
    }
    if (duplicates == 0) return {};

    return {buildTransformerActionSuggestion(
        "Remove duplicate rows",
        "There're " + std::to_string(duplicates) + " duplicate rows in the dataset. Suggest to remove them.",
        "drop_duplicate",
        {},
        std::nullopt,
        {},
        {},
        ActionAxis::ROW)};
}

std::vector<Suggestion> RemoveOutliers::evaluate() const {
    const NumericProjection projection = filterNumericTypes();
    if (projection.frame.rowCount() < std::max<size_t>(2, tuning_.outlierMinRows)) return {};

    std::vector<Suggestion> suggestions;
    for (const auto& name : projection.numericColumns) {
        const auto& values = std::get<std::vector<double>>(projection.frame.column(name).values);
        const ColumnStats stats = Statistics::calculateStats(values);
        if (!(stats.stddev > 0.0)) continue;

        const double z = tuning_.outlierZThreshold;
        bool anyOutlier = false;
        for (double v : values) {
            if (std::abs((v - stats.mean) / stats.stddev) > z) anyOutlier = true;
        }
        if (!anyOutlier) continue;

        const std::string lower = CommonUtils::numberToString(stats.mean - z * stats.stddev);
        const std::string upper = CommonUtils::numberToString(stats.mean + z * stats.stddev);
        const std::string ref = FilterExpression::quoteColumn(name);
        // Null cells are left for imputation.
        const std::string code = "(" + ref + " <= " + upper + " and " + ref + " >= " + lower + ") or " + ref + " == null";

        // Counted on the full dataset, as replay sees it.
        const MissingMask keep = FilterExpression::parse(code).evaluate(data_);
        const auto removed = static_cast<size_t>(std::count(keep.begin(), keep.end(), static_cast<uint8_t>(0)));

        suggestions.push_back(buildTransformerActionSuggestion(
            "Remove outliers in " + name,
            "Remove " + std::to_string(removed) + " outlier(s) outside [" + lower + ", " + upper + "] to reduce the amount of noise in this column.",
            "filter",
            {name},
            code,
            {},
            buildActionVariables({name}),
            ActionAxis::ROW));
    }
    return suggestions;
}
