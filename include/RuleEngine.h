#pragma once

#include "CleaningRules.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

using RuleFactory = std::function<std::unique_ptr<CleaningRule>(const DataFrame&,
                                                                const ColumnTypeMap&,
                                                                const StatisticsSnapshot&,
                                                                const RuleTuning&)>;

struct RuleRegistration {
    std::string name;
    RuleFactory factory;
};

/**
 * @brief Built-in rules in evaluation order.
 */
std::vector<RuleRegistration> defaultRuleRegistry();

template <typename Rule>
RuleRegistration registerRule(std::string name) {
    return {std::move(name),
            [](const DataFrame& data, const ColumnTypeMap& types, const StatisticsSnapshot& stats, const RuleTuning& tuning) {
                return std::unique_ptr<CleaningRule>(std::make_unique<Rule>(data, types, stats, tuning));
            }};
}

/**
 * @brief Runs an ordered rule registry over one dataset snapshot.
 * @details Output is the concatenation of every rule's suggestions in
 *          registration order. Each call builds fresh rule instances, so one
 *          engine may serve concurrent callers.
 */
class RuleEngine {
public:
    RuleEngine();
    explicit RuleEngine(std::vector<RuleRegistration> registry, RuleTuning tuning = RuleTuning{});

    /**
     * @throws Sieve::DataContractException when a column lacks a type or a rule
     *         needs a statistic that was not supplied.
     */
    std::vector<Suggestion> evaluate(const DataFrame& data,
                                     const ColumnTypeMap& columnTypes,
                                     const StatisticsSnapshot& statistics) const;

    std::vector<std::string> ruleNames() const;
    const RuleTuning& tuning() const noexcept { return tuning_; }

    void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

private:
    std::vector<RuleRegistration> registry_;
    RuleTuning tuning_;
    bool verbose_ = false;
};
