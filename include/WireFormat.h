#pragma once

#include "ColumnTypes.h"
#include "JsonValue.h"
#include "StatisticsSnapshot.h"
#include "Suggestion.h"

#include <vector>

struct EvaluationMetadata {
    ColumnTypeMap columnTypes;
    StatisticsSnapshot statistics;
};

/**
 * @brief JSON wire records for suggestions, actions and evaluation metadata.
 * @details Field names are snake_case (action_type, action_payload, ...). A
 *          missing optional field reads as an empty container; a present field
 *          of the wrong JSON type is a configuration error.
 */
namespace WireFormat {

JsonValue toJson(const ActionPayload& payload);
JsonValue toJson(const Suggestion& suggestion);
JsonValue toJson(const std::vector<Suggestion>& suggestions);

ActionPayload payloadFromJson(const JsonValue& value);

/**
 * @brief Reads a full suggestion record, or a bare action payload (no
 *        "action_payload" key) wrapped into a NOT_APPLIED record.
 */
Suggestion suggestionFromJson(const JsonValue& value);

/**
 * @brief Accepts a JSON array of actions or an object with an "actions" array.
 */
std::vector<Action> actionsFromJson(const JsonValue& value);

ColumnTypeMap columnTypesFromJson(const JsonValue& value);
StatisticsSnapshot statisticsFromJson(const JsonValue& value);

/**
 * @brief Reads {"column_types": {...}, "statistics": {...}}.
 */
EvaluationMetadata metadataFromJson(const JsonValue& value);

} // namespace WireFormat
