#include "ActionPipeline.h"
#include "SieveExceptions.h"
#include "TransformerActions.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <iostream>

using namespace SieveTests;

namespace {
Action removeAction(const std::string& column) {
    return buildTransformerActionSuggestion("", "", "remove", {column});
}

Action filterAction(const std::string& code) {
    return buildTransformerActionSuggestion("", "", "filter", {}, code, {}, {}, ActionAxis::ROW);
}
} // namespace

TEST_CASE("Empty pipeline is the identity", "[pipeline]") {
    const DataFrame data = ageCityFrame();
    const ActionPipeline pipeline;
    REQUIRE(pipeline.version() == 0);
    REQUIRE(pipeline.transform(data, true) == data);
    REQUIRE(pipeline.transform(data, false) == data);
}

TEST_CASE("Actions fold in list order over successive outputs", "[pipeline]") {
    const DataFrame data = ageCityFrame();
    const Action first = filterAction("age > 28");
    const Action second = removeAction("city");

    DataFrame stepwise = data;
    TransformerActions::apply(first.actionPayload, stepwise);
    TransformerActions::apply(second.actionPayload, stepwise);

    const ActionPipeline pipeline({first, second});
    const DataFrame folded = pipeline.transform(data, true);
    REQUIRE(folded == stepwise);
    REQUIRE(folded.columnNames() == std::vector<std::string>{"age"});
    REQUIRE(numbers(folded, "age") == std::vector<double>{31.0, 45.0});
}

TEST_CASE("A later action sees the output of an earlier one", "[pipeline]") {
    const DataFrame data = ageCityFrame();
    const ActionPipeline pipeline({removeAction("city"), filterAction("city == 'Oslo'")});

    try {
        pipeline.transform(data, true);
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "filter");
        REQUIRE(ex.identifier() == "city");
    }
}

TEST_CASE("Failed replay leaves the caller's dataset untouched", "[pipeline][errors]") {
    const DataFrame data = ageCityFrame();
    const DataFrame before = data;
    const ActionPipeline pipeline({removeAction("age"), removeAction("salary")});

    try {
        pipeline.transform(data, false);
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "remove");
        REQUIRE(ex.identifier() == "salary");
        REQUIRE(ex.kind() == Sieve::ErrorKind::RESOLUTION);
    }
    REQUIRE(data == before);
}

TEST_CASE("Unknown action types are resolution errors", "[pipeline][errors]") {
    const ActionPipeline pipeline({buildTransformerActionSuggestion("", "", "explode", {"age"})});
    try {
        pipeline.transform(ageCityFrame(), true);
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "explode");
        REQUIRE(ex.identifier().empty());
    }

    const ActionPipeline wrongAxis({buildTransformerActionSuggestion("", "", "filter", {}, std::string("age > 1"))});
    REQUIRE_THROWS_AS(wrongAxis.transform(ageCityFrame(), true), Sieve::ResolutionException);
}

TEST_CASE("Unsupported actions are rejected before any step runs", "[pipeline][errors]") {
    const ActionPipeline pipeline({removeAction("salary"), buildTransformerActionSuggestion("", "", "explode", {"age"})});
    try {
        pipeline.transform(ageCityFrame(), true);
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "explode");
    }
}

TEST_CASE("Completed actions replay in both modes", "[pipeline]") {
    Action done = removeAction("city");
    done.status = SuggestionStatus::COMPLETED;
    const ActionPipeline pipeline({done});

    REQUIRE(pipeline.transform(ageCityFrame(), true).columnNames() == std::vector<std::string>{"age"});
    REQUIRE(pipeline.transform(ageCityFrame(), false).columnNames() == std::vector<std::string>{"age"});
}

TEST_CASE("Replacement reports the previous version", "[pipeline]") {
    ActionPipeline pipeline({removeAction("a"), removeAction("b")});
    REQUIRE(pipeline.version() == 2);

    REQUIRE(pipeline.replaceActions({removeAction("c")}) == 2);
    REQUIRE(pipeline.version() == 1);
    REQUIRE(pipeline.replaceActions({}) == 1);
    REQUIRE(pipeline.version() == 0);
}

TEST_CASE("Replay ignores titles and messages", "[pipeline]") {
    Action titled = removeAction("city");
    titled.title = "Something misleading";
    titled.message = "remove age";
    const DataFrame result = ActionPipeline({titled}).transform(ageCityFrame(), true);
    REQUIRE(result.columnNames() == std::vector<std::string>{"age"});
}

TEST_CASE("Pipeline JSON carries actions and version", "[pipeline][wire]") {
    const ActionPipeline pipeline({removeAction("city"), filterAction("age >= 30")});
    const JsonValue json = pipeline.toJson();
    REQUIRE(json.find("version")->numberValue == 2.0);

    const ActionPipeline restored = ActionPipeline::fromJson(parseJson(json.dump()));
    REQUIRE(restored.actions() == pipeline.actions());
}

TEST_CASE("Verbose replay logs stay off standard output", "[pipeline][logging]") {
    ActionPipeline pipeline({removeAction("city")});
    pipeline.setVerbose(true);

    StreamCapture out(std::cout);
    StreamCapture log(std::clog);
    const DataFrame result = pipeline.transform(ageCityFrame(), false);

    REQUIRE(result.colCount() == 1);
    REQUIRE(out.text().empty());
    REQUIRE(log.text().find("curated mode") != std::string::npos);
    REQUIRE(log.text().find("step 1/1 remove [city]") != std::string::npos);
}
