#include "Suggestion.h"

const char* statusName(SuggestionStatus status) noexcept {
    return status == SuggestionStatus::COMPLETED ? "completed" : "not_applied";
}

const char* axisName(ActionAxis axis) noexcept {
    return axis == ActionAxis::ROW ? "row" : "column";
}

bool ActionPayload::operator==(const ActionPayload& other) const {
    return actionType == other.actionType &&
           actionArguments == other.actionArguments &&
           actionCode == other.actionCode &&
           actionOptions == other.actionOptions &&
           actionVariables == other.actionVariables &&
           axis == other.axis &&
           outputs == other.outputs;
}

Suggestion buildTransformerActionSuggestion(std::string title,
                                            std::string message,
                                            std::string actionType,
                                            std::vector<std::string> actionArguments,
                                            std::optional<std::string> actionCode,
                                            ActionOptions actionOptions,
                                            ActionVariableMap actionVariables,
                                            ActionAxis axis,
                                            std::vector<ActionOutput> outputs) {
    Suggestion suggestion;
    suggestion.title = std::move(title);
    suggestion.message = std::move(message);
    suggestion.status = SuggestionStatus::NOT_APPLIED;

    ActionPayload& payload = suggestion.actionPayload;
    payload.actionType = std::move(actionType);
    payload.actionArguments = std::move(actionArguments);
    payload.actionCode = std::move(actionCode);
    payload.actionOptions = std::move(actionOptions);
    payload.actionVariables = std::move(actionVariables);
    payload.axis = axis;
    payload.outputs = std::move(outputs);
    return suggestion;
}
