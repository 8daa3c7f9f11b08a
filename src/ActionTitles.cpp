#include "ActionTitles.h"

#include "CommonUtils.h"

#include <cctype>

namespace {
std::string humanize(const std::string& actionType) {
    std::string out = actionType;
    for (auto& c : out) {
        if (c == '_') c = ' ';
    }
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string columnList(const std::vector<std::string>& columns) {
    return CommonUtils::join(columns, ", ");
}

std::string defaultMessage(const ActionPayload& payload) {
    if (payload.actionType == "filter" && payload.actionCode) return "Keep rows where " + *payload.actionCode;
    if (payload.actionType == "impute") {
        std::string strategy = "median";
        auto it = payload.actionOptions.find("strategy");
        if (it != payload.actionOptions.end() && it->second.isString()) strategy = it->second.stringValue;
        return "Fill missing values using the " + strategy + " strategy";
    }
    return "";
}
} // namespace

namespace ActionTitles {

std::string describe(const ActionPayload& payload) {
    const auto& args = payload.actionArguments;
    const std::string plural = args.size() == 1 ? "" : "s";

    if (payload.actionType == "remove") {
        if (payload.axis == ActionAxis::ROW) return "Remove rows";
        return "Remove column" + plural + " " + columnList(args);
    }
    if (payload.actionType == "drop_duplicate") {
        return args.empty() ? "Drop duplicate rows" : "Drop duplicate rows on " + columnList(args);
    }
    if (payload.actionType == "filter") {
        return args.empty() ? "Filter rows" : "Filter rows by " + columnList(args);
    }
    if (payload.actionType == "clean_column_name") return "Clean column name" + plural + " " + columnList(args);
    if (payload.actionType == "impute") return "Impute missing values in " + columnList(args);

    if (args.empty()) return humanize(payload.actionType);
    return humanize(payload.actionType) + " " + columnList(args);
}

std::vector<Action> fillTitles(std::vector<Action> actions) {
    for (auto& action : actions) {
        if (action.title.empty()) action.title = describe(action.actionPayload);
        if (action.message.empty()) action.message = defaultMessage(action.actionPayload);
    }
    return actions;
}

} // namespace ActionTitles
