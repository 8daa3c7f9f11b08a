#include "ActionPipeline.h"
#include "CleaningRules.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace SieveTests;

namespace {
template <typename Rule>
std::vector<Suggestion> run(const DataFrame& data,
                            const ColumnTypeMap& types,
                            const StatisticsSnapshot& stats,
                            const RuleTuning& tuning = RuleTuning{}) {
    return Rule(data, types, stats, tuning).evaluate();
}

ColumnTypeMap numericTypes(const std::vector<std::string>& columns) {
    ColumnTypeMap types;
    for (const auto& c : columns) types[c] = ColumnType::NUMBER;
    return types;
}
} // namespace

TEST_CASE("High empty rate columns are suggested for removal", "[rules][builtin]") {
    StatisticsSnapshot stats = quietStatistics({"age", "city"});
    stats.set(StatisticsSnapshot::columnKey("city", "null_value_rate"), 0.9);

    const auto suggestions = run<RemoveColumnsWithHighEmptyRate>(ageCityFrame(), ageCityTypes(), stats);
    REQUIRE(suggestions.size() == 1);
    const ActionPayload& payload = suggestions[0].actionPayload;
    REQUIRE(suggestions[0].title == "Remove columns with high empty rate");
    REQUIRE(suggestions[0].status == SuggestionStatus::NOT_APPLIED);
    REQUIRE(payload.actionType == "remove");
    REQUIRE(payload.axis == ActionAxis::COLUMN);
    REQUIRE(payload.actionArguments == std::vector<std::string>{"city"});
    REQUIRE(payload.actionVariables.at("city").columnType == ColumnType::TEXT);

    REQUIRE(run<RemoveColumnsWithHighEmptyRate>(ageCityFrame(), ageCityTypes(), quietStatistics({"age", "city"})).empty());
}

TEST_CASE("Single valued columns are suggested for removal", "[rules][builtin]") {
    StatisticsSnapshot stats = quietStatistics({"age", "city"});
    stats.set(StatisticsSnapshot::columnKey("age", "count_distinct"), 1.0);

    const auto suggestions = run<RemoveColumnsWithSingleValue>(ageCityFrame(), ageCityTypes(), stats);
    REQUIRE(suggestions.size() == 1);
    REQUIRE(suggestions[0].actionPayload.actionArguments == std::vector<std::string>{"age"});
    REQUIRE(suggestions[0].actionPayload.actionVariables.at("age").columnType == ColumnType::NUMBER);
}

TEST_CASE("Duplicate rows produce one row-axis suggestion", "[rules][builtin]") {
    const DataFrame data({
        makeNumericColumn("id", {1.0, 2.0, 1.0, 1.0}),
        makeTextColumn("tag", {std::string("a"), std::string("b"), std::string("a"), std::nullopt}),
    });
    const ColumnTypeMap types = {{"id", ColumnType::NUMBER}, {"tag", ColumnType::TEXT}};

    const auto suggestions = run<RemoveDuplicateRows>(data, types, StatisticsSnapshot{});
    REQUIRE(suggestions.size() == 1);
    REQUIRE(suggestions[0].message == "There're 1 duplicate rows in the dataset. Suggest to remove them.");
    REQUIRE(suggestions[0].actionPayload.actionType == "drop_duplicate");
    REQUIRE(suggestions[0].actionPayload.axis == ActionAxis::ROW);
    REQUIRE(suggestions[0].actionPayload.actionArguments.empty());

    REQUIRE(run<RemoveDuplicateRows>(ageCityFrame(), ageCityTypes(), StatisticsSnapshot{}).empty());
}

TEST_CASE("Dirty column names are listed unless cleaning would collide", "[rules][builtin]") {
    const DataFrame data({
        makeNumericColumn("Customer ID", {1.0}),
        makeNumericColumn("Total", {2.0}),
        makeNumericColumn("total", {3.0}),
        makeNumericColumn("ok_name", {4.0}),
    });
    const auto types = numericTypes({"Customer ID", "Total", "total", "ok_name"});

    const auto suggestions = run<CleanColumnNames>(data, types, StatisticsSnapshot{});
    REQUIRE(suggestions.size() == 1);
    REQUIRE(suggestions[0].actionPayload.actionType == "clean_column_name");
    REQUIRE(suggestions[0].actionPayload.actionArguments == std::vector<std::string>{"Customer ID"});

    DataFrame cleaned = ActionPipeline(suggestions).transform(data);
    REQUIRE(cleaned.hasColumn("customer_id"));
}

TEST_CASE("Collinear numeric columns are reduced until VIF is acceptable", "[rules][builtin]") {
    const DataFrame data({
        makeNumericColumn("x", {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0}),
        makeNumericColumn("y", {2.0, 4.0, 6.0, 8.0, 10.0, 12.0, 14.0, 16.0, 18.0, 20.0}),
        makeNumericColumn("z", {3.0, 1.0, 4.0, 1.0, 5.0, 9.0, 2.0, 6.0, 5.0, 3.0}),
        makeTextColumn("label", {std::string("a"), std::string("b"), std::string("c"), std::string("d"),
                                 std::string("e"), std::string("f"), std::string("g"), std::string("h"),
                                 std::string("i"), std::string("j")}),
    });
    ColumnTypeMap types = numericTypes({"x", "y", "z"});
    types["label"] = ColumnType::TEXT;

    const auto suggestions = run<RemoveCollinearColumns>(data, types, StatisticsSnapshot{});
    REQUIRE(suggestions.size() == 1);
    const auto& removed = suggestions[0].actionPayload.actionArguments;
    REQUIRE(removed.size() == 1);
    REQUIRE((removed[0] == "x" || removed[0] == "y"));
    REQUIRE(suggestions[0].actionPayload.actionType == "remove");

    const DataFrame independent({
        makeNumericColumn("x", {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0}),
        makeNumericColumn("z", {3.0, 1.0, 4.0, 1.0, 5.0, 9.0, 2.0, 6.0, 5.0, 3.0}),
    });
    REQUIRE(run<RemoveCollinearColumns>(independent, numericTypes({"x", "z"}), StatisticsSnapshot{}).empty());
}

TEST_CASE("Outliers produce a filter that replays to drop them", "[rules][builtin]") {
    std::vector<std::optional<double>> values(19, 10.0);
    values.push_back(1000.0);
    const DataFrame data({makeNumericColumn("value", values), makeNumericColumn("flat", std::vector<std::optional<double>>(20, 1.0))});
    const auto types = numericTypes({"value", "flat"});

    const auto suggestions = run<RemoveOutliers>(data, types, StatisticsSnapshot{});
    REQUIRE(suggestions.size() == 1);
    const ActionPayload& payload = suggestions[0].actionPayload;
    REQUIRE(suggestions[0].title == "Remove outliers in value");
    REQUIRE(payload.actionType == "filter");
    REQUIRE(payload.axis == ActionAxis::ROW);
    REQUIRE(payload.actionArguments == std::vector<std::string>{"value"});
    REQUIRE(payload.actionCode.has_value());

    const DataFrame cleaned = ActionPipeline(suggestions).transform(data);
    REQUIRE(cleaned.rowCount() == 19);
    REQUIRE(numbers(cleaned, "value") == std::vector<double>(19, 10.0));

    RuleTuning loose;
    loose.outlierZThreshold = 5.0;
    REQUIRE(run<RemoveOutliers>(data, types, StatisticsSnapshot{}, loose).empty());
}

TEST_CASE("Outlier filters keep rows where the column is null", "[rules][builtin]") {
    std::vector<std::optional<double>> values(19, 10.0);
    values.push_back(1000.0);
    values.push_back(std::nullopt);
    values.push_back(std::nullopt);
    const DataFrame data({makeNumericColumn("value", values)});
    const auto types = numericTypes({"value"});

    const auto suggestions = run<RemoveOutliers>(data, types, StatisticsSnapshot{});
    REQUIRE(suggestions.size() == 1);
    REQUIRE(suggestions[0].message.rfind("Remove 1 outlier(s)", 0) == 0);

    const DataFrame cleaned = ActionPipeline(suggestions).transform(data);
    REQUIRE(cleaned.rowCount() == 21);
    REQUIRE(cleaned.missingCellCount() == 2);
}

TEST_CASE("Sparse numeric columns get a median imputation", "[rules][builtin]") {
    StatisticsSnapshot stats = quietStatistics({"age", "city"});
    stats.set(StatisticsSnapshot::columnKey("age", "null_value_rate"), 0.25);
    stats.set(StatisticsSnapshot::columnKey("city", "null_value_rate"), 0.25);

    const auto suggestions = run<ImputeMissingValues>(ageCityFrame(), ageCityTypes(), stats);
    REQUIRE(suggestions.size() == 1);
    const ActionPayload& payload = suggestions[0].actionPayload;
    REQUIRE(payload.actionType == "impute");
    REQUIRE(payload.actionArguments == std::vector<std::string>{"age"});
    REQUIRE(payload.actionOptions.at("strategy").stringValue == "median");

    const DataFrame filled = ActionPipeline(suggestions).transform(ageCityFrame());
    REQUIRE(numbers(filled, "age")[1] == 31.0);

    stats.set(StatisticsSnapshot::columnKey("age", "null_value_rate"), 0.9);
    REQUIRE(run<ImputeMissingValues>(ageCityFrame(), ageCityTypes(), stats).empty());
}
