#include "RuleEngine.h"

#include "SieveExceptions.h"

#include <iostream>
#include <iterator>

std::vector<RuleRegistration> defaultRuleRegistry() {
    return {
        registerRule<RemoveColumnsWithHighEmptyRate>("remove_columns_with_high_empty_rate"),
        registerRule<RemoveColumnsWithSingleValue>("remove_columns_with_single_value"),
        registerRule<RemoveDuplicateRows>("remove_duplicate_rows"),
        registerRule<CleanColumnNames>("clean_column_names"),
        registerRule<RemoveCollinearColumns>("remove_collinear_columns"),
        registerRule<RemoveOutliers>("remove_outliers"),
        registerRule<ImputeMissingValues>("impute_missing_values"),
    };
}

RuleEngine::RuleEngine() : registry_(defaultRuleRegistry()) {}

RuleEngine::RuleEngine(std::vector<RuleRegistration> registry, RuleTuning tuning)
    : registry_(std::move(registry)), tuning_(tuning) {
    for (const auto& entry : registry_) {
        if (!entry.factory) throw Sieve::ConfigurationException("Rule '" + entry.name + "' has no factory");
    }
}

std::vector<Suggestion> RuleEngine::evaluate(const DataFrame& data,
                                             const ColumnTypeMap& columnTypes,
                                             const StatisticsSnapshot& statistics) const {
    std::vector<Suggestion> suggestions;
    for (const auto& entry : registry_) {
        const std::unique_ptr<CleaningRule> rule = entry.factory(data, columnTypes, statistics, tuning_);
        if (!rule) throw Sieve::ConfigurationException("Rule '" + entry.name + "' factory returned no rule");
        std::vector<Suggestion> found = rule->evaluate();
        if (verbose_) {
            std::clog << "[Sieve] Rule " << entry.name << ": " << found.size() << " suggestion(s)\n";
        }
        suggestions.insert(suggestions.end(),
                           std::make_move_iterator(found.begin()),
                           std::make_move_iterator(found.end()));
    }
    return suggestions;
}

std::vector<std::string> RuleEngine::ruleNames() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& entry : registry_) names.push_back(entry.name);
    return names;
}
