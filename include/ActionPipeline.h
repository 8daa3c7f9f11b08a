#pragma once

#include "DataFrame.h"
#include "JsonValue.h"
#include "Suggestion.h"

#include <vector>

/**
 * @brief Ordered, versioned action list with deterministic replay.
 * @details The version is the list length. The list only changes through
 *          replaceActions(); replay never reads title or message.
 */
class ActionPipeline {
public:
    ActionPipeline() = default;
    explicit ActionPipeline(std::vector<Action> actions) : actions_(std::move(actions)) {}

    const std::vector<Action>& actions() const noexcept { return actions_; }
    size_t version() const noexcept { return actions_.size(); }

    /**
     * @brief Swaps in a complete new list.
     * @return Length of the list immediately before the replacement.
     */
    size_t replaceActions(std::vector<Action> actions);

    /**
     * @brief Folds a copy of `data` through every action in list order.
     * @param autoApply true replays the full stored history, false marks a
     *        caller-curated list. Both modes apply every action, whatever its status.
     * @details Every (action_type, axis) pair is checked before the first step runs.
     * @throws Sieve::ResolutionException when an action cannot be resolved;
     *         `data` is left untouched and no partial result is returned.
     */
    DataFrame transform(const DataFrame& data, bool autoApply = true) const;

    void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

    JsonValue toJson() const;

    /**
     * @throws Sieve::ConfigurationException on a malformed action list.
     */
    static ActionPipeline fromJson(const JsonValue& value);

private:
    std::vector<Action> actions_;
    bool verbose_ = false;
};
