#include "ActionPipeline.h"

#include "CommonUtils.h"
#include "SieveExceptions.h"
#include "TransformerActions.h"
#include "WireFormat.h"

#include <iostream>

size_t ActionPipeline::replaceActions(std::vector<Action> actions) {
    const size_t prevVersion = actions_.size();
    actions_.swap(actions);
    return prevVersion;
}

DataFrame ActionPipeline::transform(const DataFrame& data, bool autoApply) const {
    for (const auto& action : actions_) {
        const ActionPayload& payload = action.actionPayload;
        if (!TransformerActions::isSupported(payload.actionType, payload.axis)) {
            throw Sieve::ResolutionException(payload.actionType, "",
                                             "Unsupported action '" + payload.actionType + "' on axis '" +
                                                 axisName(payload.axis) + "'");
        }
    }

    DataFrame current = data;
    if (verbose_) {
        std::clog << "[Sieve] Replaying " << actions_.size() << " action(s) in "
                  << (autoApply ? "auto" : "curated") << " mode\n";
    }

    for (size_t i = 0; i < actions_.size(); ++i) {
        const ActionPayload& payload = actions_[i].actionPayload;
        TransformerActions::apply(payload, current);
        if (verbose_) {
            std::clog << "[Sieve]   step " << (i + 1) << "/" << actions_.size() << " " << payload.actionType;
            if (!payload.actionArguments.empty()) std::clog << " [" << CommonUtils::join(payload.actionArguments, ", ") << "]";
            std::clog << " -> " << current.rowCount() << " rows x " << current.colCount() << " cols\n";
        }
    }
    return current;
}

JsonValue ActionPipeline::toJson() const {
    JsonValue out = JsonValue::object();
    out.set("actions", WireFormat::toJson(actions_));
    out.set("version", JsonValue::number(static_cast<double>(version())));
    return out;
}

ActionPipeline ActionPipeline::fromJson(const JsonValue& value) {
    return ActionPipeline(WireFormat::actionsFromJson(value));
}
