#include "CleaningRules.h"

#include "ActionVariables.h"

CleaningRule::CleaningRule(const DataFrame& data,
                           const ColumnTypeMap& columnTypes,
                           const StatisticsSnapshot& statistics,
                           const RuleTuning& tuning)
    : data_(data), columnTypes_(columnTypes), statistics_(statistics), tuning_(tuning) {
    for (const auto& col : data_.columns()) requireColumnType(columnTypes_, col.name);
}

NumericProjection CleaningRule::filterNumericTypes() const {
    return projectNumeric(data_, columnTypes_);
}

ActionVariableMap CleaningRule::buildActionVariables(const std::vector<std::string>& columns) const {
    return ::buildActionVariables(columns, columnTypes_);
}
