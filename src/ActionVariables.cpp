#include "ActionVariables.h"

ActionVariableMap buildActionVariables(const std::vector<std::string>& columns, const ColumnTypeMap& columnTypes) {
    ActionVariableMap variableSet;
    for (const auto& columnName : columns) {
        ActionVariable variable;
        variable.columnType = requireColumnType(columnTypes, columnName);
        variable.uuid = columnName;
        variableSet.emplace(columnName, std::move(variable));
    }
    return variableSet;
}
