#include "TransformerActions.h"

#include "CommonUtils.h"
#include "FilterExpression.h"
#include "SieveExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <numeric>
#include <optional>
#include <unordered_set>

namespace {
using Executor = void (*)(const ActionPayload&, DataFrame&);

void requireColumns(const ActionPayload& payload, const DataFrame& frame) {
    for (const auto& column : payload.actionArguments) {
        if (!frame.hasColumn(column)) {
            throw Sieve::ResolutionException(payload.actionType, column,
                                             "Action '" + payload.actionType + "' references missing column '" +
                                                 column + "'");
        }
    }
}

void removeColumns(const ActionPayload& payload, DataFrame& frame) {
    requireColumns(payload, frame);
    for (const auto& column : payload.actionArguments) {
        if (frame.hasColumn(column)) frame.dropColumn(column);
    }
}

void dropDuplicateRows(const ActionPayload& payload, DataFrame& frame) {
    requireColumns(payload, frame);
    std::vector<size_t> keyColumns;
    if (payload.actionArguments.empty()) {
        keyColumns.resize(frame.colCount());
        std::iota(keyColumns.begin(), keyColumns.end(), 0);
    } else {
        for (const auto& column : payload.actionArguments) {
            keyColumns.push_back(static_cast<size_t>(frame.findColumnIndex(column)));
        }
    }

    std::unordered_set<std::string> seen;
    MissingMask keep(frame.rowCount(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < frame.rowCount(); ++r) {
        keep[r] = seen.insert(frame.rowKey(r, keyColumns)).second ? 1 : 0;
    }
    frame.removeRows(keep);
}

void filterRows(const ActionPayload& payload, DataFrame& frame) {
    requireColumns(payload, frame);
    if (!payload.actionCode || CommonUtils::trim(*payload.actionCode).empty()) {
        throw Sieve::ResolutionException(payload.actionType, "", "Action 'filter' requires action_code");
    }
    const FilterExpression expression = FilterExpression::parse(*payload.actionCode);
    for (const auto& column : expression.referencedColumns()) {
        if (!frame.hasColumn(column)) {
            throw Sieve::ResolutionException(payload.actionType, column,
                                             "Filter expression references missing column '" + column + "'");
        }
    }
    frame.removeRows(expression.evaluate(frame));
}

void cleanColumnNames(const ActionPayload& payload, DataFrame& frame) {
    requireColumns(payload, frame);
    for (const auto& column : payload.actionArguments) {
        const std::string clean = CommonUtils::toSnakeCase(column);
        if (clean.empty() || clean == column) continue;
        if (frame.hasColumn(clean)) {
            throw Sieve::ResolutionException(payload.actionType, column,
                                             "Cleaned name '" + clean + "' of column '" + column +
                                                 "' collides with an existing column");
        }
        frame.renameColumn(column, clean);
    }
}

std::string optionString(const ActionPayload& payload, const std::string& key, const std::string& fallback) {
    auto it = payload.actionOptions.find(key);
    if (it == payload.actionOptions.end() || it->second.isNull()) return fallback;
    return it->second.asString("action_options." + key);
}

bool parseNumber(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

template <typename T>
std::vector<T> presentValues(const TypedColumn& col) {
    const auto& values = std::get<std::vector<T>>(col.values);
    std::vector<T> present;
    present.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.missing[r]) present.push_back(values[r]);
    }
    return present;
}

// Most frequent value; ties resolve to the smallest.
template <typename T>
std::optional<T> modeOf(const std::vector<T>& values) {
    std::map<T, size_t> counts;
    for (const auto& v : values) ++counts[v];
    std::optional<T> best;
    size_t bestCount = 0;
    for (const auto& kv : counts) {
        if (kv.second > bestCount) {
            best = kv.first;
            bestCount = kv.second;
        }
    }
    return best;
}

template <typename T>
void fillMissing(TypedColumn& col, const T& value) {
    auto& values = std::get<std::vector<T>>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.missing[r]) continue;
        values[r] = value;
        col.missing[r] = static_cast<uint8_t>(0);
    }
}

void imputeColumn(const ActionPayload& payload, const std::string& strategy, TypedColumn& col) {
    if (strategy == "constant") {
        auto it = payload.actionOptions.find("value");
        if (it == payload.actionOptions.end() || it->second.isNull()) {
            throw Sieve::ResolutionException(payload.actionType, col.name,
                                             "Constant imputation of column '" + col.name + "' requires option 'value'");
        }
        const JsonValue& fill = it->second;
        if (col.isNumeric()) {
            double number = 0.0;
            if (fill.isNumber()) number = fill.numberValue;
            else if (!fill.isString() || !parseNumber(fill.stringValue, number)) {
                throw Sieve::ResolutionException(payload.actionType, col.name,
                                                 "Constant for numeric column '" + col.name + "' is not a number");
            }
            fillMissing(col, number);
        } else {
            fillMissing(col, fill.isNumber() ? CommonUtils::numberToString(fill.numberValue)
                                             : fill.asString("action_options.value"));
        }
        return;
    }

    if (strategy == "mode") {
        if (col.isNumeric()) {
            if (auto mode = modeOf(presentValues<double>(col))) fillMissing(col, *mode);
        } else if (auto mode = modeOf(presentValues<std::string>(col))) {
            fillMissing(col, *mode);
        }
        return;
    }

    if (strategy != "mean" && strategy != "median") {
        throw Sieve::ResolutionException(payload.actionType, col.name, "Unknown imputation strategy '" + strategy + "'");
    }
    if (!col.isNumeric()) {
        throw Sieve::ResolutionException(payload.actionType, col.name,
                                         "Strategy '" + strategy + "' needs a numeric column, '" + col.name + "' is text");
    }

    std::vector<double> present = presentValues<double>(col);
    if (present.empty()) return;
    double fill = 0.0;
    if (strategy == "median") {
        fill = CommonUtils::medianByNth(std::move(present));
    } else {
        long double sum = 0.0L;
        for (double v : present) sum += v;
        fill = static_cast<double>(sum / static_cast<long double>(present.size()));
    }
    fillMissing(col, fill);
}

void imputeMissing(const ActionPayload& payload, DataFrame& frame) {
    requireColumns(payload, frame);
    const std::string strategy = CommonUtils::toLower(optionString(payload, "strategy", "median"));
    for (const auto& column : payload.actionArguments) imputeColumn(payload, strategy, frame.column(column));
}

const std::map<std::pair<std::string, ActionAxis>, Executor>& executors() {
    static const std::map<std::pair<std::string, ActionAxis>, Executor> table = {
        {{"remove", ActionAxis::COLUMN}, &removeColumns},
        {{"drop_duplicate", ActionAxis::ROW}, &dropDuplicateRows},
        {{"filter", ActionAxis::ROW}, &filterRows},
        {{"clean_column_name", ActionAxis::COLUMN}, &cleanColumnNames},
        {{"impute", ActionAxis::COLUMN}, &imputeMissing},
    };
    return table;
}
} // namespace

namespace TransformerActions {

bool isSupported(const std::string& actionType, ActionAxis axis) {
    return executors().count({actionType, axis}) > 0;
}

void apply(const ActionPayload& payload, DataFrame& frame) {
    auto it = executors().find({payload.actionType, payload.axis});
    if (it == executors().end()) {
        throw Sieve::ResolutionException(payload.actionType, "",
                                         "Unsupported action '" + payload.actionType + "' on axis '" +
                                             axisName(payload.axis) + "'");
    }
    it->second(payload, frame);
}

} // namespace TransformerActions
