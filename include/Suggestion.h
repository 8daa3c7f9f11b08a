#pragma once

#include "ColumnTypes.h"
#include "JsonValue.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class SuggestionStatus { NOT_APPLIED, COMPLETED };
enum class ActionAxis { COLUMN, ROW };

const char* statusName(SuggestionStatus status) noexcept;
const char* axisName(ActionAxis axis) noexcept;

/**
 * @brief Column descriptor carried by an action so columns resolve by identity.
 * @details Wire shape: {"feature": {"column_type", "uuid"}, "type": "feature"}.
 */
struct ActionVariable {
    ColumnType columnType = ColumnType::TEXT;
    std::string uuid;
    std::string type = "feature";

    bool operator==(const ActionVariable& other) const {
        return columnType == other.columnType && uuid == other.uuid && type == other.type;
    }
};

using ActionVariableMap = std::map<std::string, ActionVariable>;
using ActionOptions = std::map<std::string, JsonValue>;

struct ActionOutput {
    std::string uuid;
    ColumnType columnType = ColumnType::TEXT;

    bool operator==(const ActionOutput& other) const {
        return uuid == other.uuid && columnType == other.columnType;
    }
};

struct ActionPayload {
    std::string actionType;
    std::vector<std::string> actionArguments;
    std::optional<std::string> actionCode;
    ActionOptions actionOptions;
    ActionVariableMap actionVariables;
    ActionAxis axis = ActionAxis::COLUMN;
    std::vector<ActionOutput> outputs;

    bool operator==(const ActionPayload& other) const;
    bool operator!=(const ActionPayload& other) const { return !(*this == other); }
};

struct Suggestion {
    std::string title;
    std::string message;
    SuggestionStatus status = SuggestionStatus::NOT_APPLIED;
    ActionPayload actionPayload;

    bool operator==(const Suggestion& other) const {
        return title == other.title && message == other.message && status == other.status &&
               actionPayload == other.actionPayload;
    }
    bool operator!=(const Suggestion& other) const { return !(*this == other); }
};

/**
 * @brief An accepted suggestion, ordered inside a pipeline and subject to replay.
 */
using Action = Suggestion;

/**
 * @brief Builds a suggestion with status NOT_APPLIED.
 * @details Every omitted argument is default-constructed for this call, so no
 *          two suggestions ever share a container.
 */
Suggestion buildTransformerActionSuggestion(std::string title,
                                            std::string message,
                                            std::string actionType,
                                            std::vector<std::string> actionArguments = {},
                                            std::optional<std::string> actionCode = std::nullopt,
                                            ActionOptions actionOptions = {},
                                            ActionVariableMap actionVariables = {},
                                            ActionAxis axis = ActionAxis::COLUMN,
                                            std::vector<ActionOutput> outputs = {});
