#pragma once

#include "ColumnTypes.h"
#include "DataFrame.h"
#include "NumericProjection.h"
#include "StatisticsSnapshot.h"
#include "Suggestion.h"

#include <string>
#include <vector>

struct RuleTuning {
    // Columns whose null_value_rate reaches this value are suggested for removal.
    double emptyRateThreshold = 0.8;
    // Absolute z-score above which a numeric value counts as an outlier.
    double outlierZThreshold = 3.0;
    // Variance inflation factor above which a numeric column counts as collinear.
    double collinearityVifThreshold = 5.0;
    // Minimum rows in the numeric projection before outliers are searched.
    size_t outlierMinRows = 3;
};

/**
 * @brief One cleaning heuristic evaluated over a dataset snapshot.
 * @details Rules hold references to the caller's inputs and must not outlive
 *          the evaluation call that created them. evaluate() never mutates the
 *          snapshot; "nothing found" is an empty vector.
 */
class CleaningRule {
public:
    /**
     * @throws Sieve::DataContractException when a dataset column has no entry in `columnTypes`.
     */
    CleaningRule(const DataFrame& data,
                 const ColumnTypeMap& columnTypes,
                 const StatisticsSnapshot& statistics,
                 const RuleTuning& tuning);
    virtual ~CleaningRule() = default;

    virtual std::vector<Suggestion> evaluate() const = 0;

protected:
    NumericProjection filterNumericTypes() const;
    ActionVariableMap buildActionVariables(const std::vector<std::string>& columns) const;

    const DataFrame& data_;
    const ColumnTypeMap& columnTypes_;
    const StatisticsSnapshot& statistics_;
    const RuleTuning& tuning_;
};

class RemoveColumnsWithHighEmptyRate : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

class RemoveColumnsWithSingleValue : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

class RemoveDuplicateRows : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

class CleanColumnNames : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

/**
 * @brief Iterative variance-inflation-factor elimination on the numeric projection.
 */
class RemoveCollinearColumns : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

/**
 * @brief Per-column z-score screen; one filter suggestion per affected column.
 */
class RemoveOutliers : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};

class ImputeMissingValues : public CleaningRule {
public:
    using CleaningRule::CleaningRule;
    std::vector<Suggestion> evaluate() const override;
};
