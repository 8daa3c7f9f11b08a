#include "WireFormat.h"

#include "SieveExceptions.h"

namespace {
const JsonValue& requireField(const JsonValue& object, const std::string& key, const std::string& context) {
    const JsonValue* value = object.find(key);
    if (value == nullptr) throw Sieve::ConfigurationException(context + " is missing '" + key + "'");
    return *value;
}

void requireObject(const JsonValue& value, const std::string& context) {
    if (!value.isObject()) throw Sieve::ConfigurationException(context + " must be an object");
}

void requireArray(const JsonValue& value, const std::string& context) {
    if (!value.isArray()) throw Sieve::ConfigurationException(context + " must be an array");
}

SuggestionStatus parseStatus(const std::string& raw) {
    if (raw == "not_applied") return SuggestionStatus::NOT_APPLIED;
    if (raw == "completed") return SuggestionStatus::COMPLETED;
    throw Sieve::ConfigurationException("Unknown suggestion status '" + raw + "'");
}

ActionAxis parseAxis(const std::string& raw) {
    if (raw == "column") return ActionAxis::COLUMN;
    if (raw == "row") return ActionAxis::ROW;
    throw Sieve::ConfigurationException("Unknown action axis '" + raw + "'");
}

JsonValue variableToJson(const ActionVariable& variable) {
    JsonValue feature = JsonValue::object();
    feature.set("column_type", JsonValue::string(columnTypeName(variable.columnType)));
    feature.set("uuid", JsonValue::string(variable.uuid));

    JsonValue out = JsonValue::object();
    out.set("feature", std::move(feature));
    out.set("type", JsonValue::string(variable.type));
    return out;
}

ActionVariable variableFromJson(const std::string& column, const JsonValue& value) {
    const std::string context = "action_variables." + column;
    requireObject(value, context);
    const JsonValue& feature = requireField(value, "feature", context);
    requireObject(feature, context + ".feature");

    ActionVariable variable;
    variable.uuid = requireField(feature, "uuid", context + ".feature").asString(context + ".feature.uuid");
    variable.columnType = parseColumnType(
        requireField(feature, "column_type", context + ".feature").asString(context + ".feature.column_type"),
        variable.uuid);
    if (const JsonValue* type = value.find("type")) variable.type = type->asString(context + ".type");
    return variable;
}
} // namespace

namespace WireFormat {

JsonValue toJson(const ActionPayload& payload) {
    std::vector<JsonValue> arguments;
    for (const auto& argument : payload.actionArguments) arguments.push_back(JsonValue::string(argument));

    JsonValue options = JsonValue::object();
    for (const auto& kv : payload.actionOptions) options.set(kv.first, kv.second);

    JsonValue variables = JsonValue::object();
    for (const auto& kv : payload.actionVariables) variables.set(kv.first, variableToJson(kv.second));

    std::vector<JsonValue> outputs;
    for (const auto& output : payload.outputs) {
        JsonValue item = JsonValue::object();
        item.set("uuid", JsonValue::string(output.uuid));
        item.set("column_type", JsonValue::string(columnTypeName(output.columnType)));
        outputs.push_back(std::move(item));
    }

    JsonValue out = JsonValue::object();
    out.set("action_type", JsonValue::string(payload.actionType));
    out.set("action_arguments", JsonValue::array(std::move(arguments)));
    out.set("action_code", payload.actionCode ? JsonValue::string(*payload.actionCode) : JsonValue::null());
    out.set("action_options", std::move(options));
    out.set("action_variables", std::move(variables));
    out.set("axis", JsonValue::string(axisName(payload.axis)));
    out.set("outputs", JsonValue::array(std::move(outputs)));
    return out;
}

JsonValue toJson(const Suggestion& suggestion) {
    JsonValue out = JsonValue::object();
    out.set("title", JsonValue::string(suggestion.title));
    out.set("message", JsonValue::string(suggestion.message));
    out.set("status", JsonValue::string(statusName(suggestion.status)));
    out.set("action_payload", toJson(suggestion.actionPayload));
    return out;
}

JsonValue toJson(const std::vector<Suggestion>& suggestions) {
    std::vector<JsonValue> items;
    items.reserve(suggestions.size());
    for (const auto& suggestion : suggestions) items.push_back(toJson(suggestion));
    return JsonValue::array(std::move(items));
}

ActionPayload payloadFromJson(const JsonValue& value) {
    requireObject(value, "action_payload");

    ActionPayload payload;
    payload.actionType = requireField(value, "action_type", "action_payload").asString("action_type");

    if (const JsonValue* arguments = value.find("action_arguments")) {
        requireArray(*arguments, "action_arguments");
        for (const auto& item : arguments->arrayValue) payload.actionArguments.push_back(item.asString("action_arguments[]"));
    }
    if (const JsonValue* code = value.find("action_code")) {
        if (!code->isNull()) payload.actionCode = code->asString("action_code");
    }
    if (const JsonValue* options = value.find("action_options")) {
        requireObject(*options, "action_options");
        payload.actionOptions = ActionOptions(options->objectValue.begin(), options->objectValue.end());
    }
    if (const JsonValue* variables = value.find("action_variables")) {
        requireObject(*variables, "action_variables");
        for (const auto& kv : variables->objectValue) {
            payload.actionVariables.emplace(kv.first, variableFromJson(kv.first, kv.second));
        }
    }
    if (const JsonValue* axis = value.find("axis")) payload.axis = parseAxis(axis->asString("axis"));
    if (const JsonValue* outputs = value.find("outputs")) {
        requireArray(*outputs, "outputs");
        for (const auto& item : outputs->arrayValue) {
            requireObject(item, "outputs[]");
            ActionOutput output;
            output.uuid = requireField(item, "uuid", "outputs[]").asString("outputs[].uuid");
            if (const JsonValue* type = item.find("column_type")) {
                output.columnType = parseColumnType(type->asString("outputs[].column_type"), output.uuid);
            }
            payload.outputs.push_back(std::move(output));
        }
    }
    return payload;
}

Suggestion suggestionFromJson(const JsonValue& value) {
    requireObject(value, "action");

    const JsonValue* payload = value.find("action_payload");
    if (payload == nullptr) {
        Suggestion bare;
        bare.actionPayload = payloadFromJson(value);
        return bare;
    }

    Suggestion suggestion;
    if (const JsonValue* title = value.find("title")) suggestion.title = title->asString("title");
    if (const JsonValue* message = value.find("message")) suggestion.message = message->asString("message");
    if (const JsonValue* status = value.find("status")) suggestion.status = parseStatus(status->asString("status"));
    suggestion.actionPayload = payloadFromJson(*payload);
    return suggestion;
}

std::vector<Action> actionsFromJson(const JsonValue& value) {
    const JsonValue* list = &value;
    if (value.isObject()) list = &requireField(value, "actions", "pipeline");
    requireArray(*list, "actions");

    std::vector<Action> actions;
    actions.reserve(list->arrayValue.size());
    for (const auto& item : list->arrayValue) actions.push_back(suggestionFromJson(item));
    return actions;
}

ColumnTypeMap columnTypesFromJson(const JsonValue& value) {
    requireObject(value, "column_types");
    ColumnTypeMap types;
    for (const auto& kv : value.objectValue) {
        types.emplace(kv.first, parseColumnType(kv.second.asString("column_types." + kv.first), kv.first));
    }
    return types;
}

StatisticsSnapshot statisticsFromJson(const JsonValue& value) {
    requireObject(value, "statistics");
    StatisticsSnapshot statistics;
    for (const auto& kv : value.objectValue) {
        if (kv.second.isBool()) {
            statistics.setFlag(kv.first, kv.second.booleanValue);
        } else if (kv.second.isNull()) {
            continue;
        } else {
            statistics.set(kv.first, kv.second.asNumber("statistics." + kv.first));
        }
    }
    return statistics;
}

EvaluationMetadata metadataFromJson(const JsonValue& value) {
    requireObject(value, "metadata");
    EvaluationMetadata metadata;
    metadata.columnTypes = columnTypesFromJson(requireField(value, "column_types", "metadata"));
    if (const JsonValue* statistics = value.find("statistics")) metadata.statistics = statisticsFromJson(*statistics);
    return metadata;
}

} // namespace WireFormat
