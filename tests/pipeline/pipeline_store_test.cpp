#include "PipelineStore.h"
#include "SieveExceptions.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace SieveTests;

namespace {
std::vector<Action> removals(std::initializer_list<const char*> columns) {
    std::vector<Action> actions;
    for (const char* c : columns) actions.push_back(buildTransformerActionSuggestion("", "", "remove", {c}));
    return actions;
}
} // namespace

TEST_CASE("Replacing a list returns the previous version and keeps history", "[pipeline][store]") {
    TempDir dir("sieve-store");
    PipelineStore store(dir.path());

    REQUIRE_FALSE(store.exists("p1"));
    REQUIRE(store.replace("p1", removals({"a", "b"})) == 0);
    REQUIRE(store.replace("p1", removals({"a", "b", "c"})) == 2);
    REQUIRE(store.replace("p1", removals({"z"})) == 3);

    REQUIRE(store.exists("p1"));
    REQUIRE(store.load("p1") == removals({"z"}));
    REQUIRE(store.loadVersion("p1", 0).empty());
    REQUIRE(store.loadVersion("p1", 2) == removals({"a", "b"}));
    REQUIRE(store.loadVersion("p1", 3) == removals({"a", "b", "c"}));
    REQUIRE(std::filesystem::is_regular_file(dir.path() / "p1" / "pipeline.json"));
    REQUIRE(std::filesystem::is_regular_file(dir.path() / "p1" / "versions" / "3.json"));
}

TEST_CASE("Store lists ids and loads arbitrary paths", "[pipeline][store]") {
    TempDir dir("sieve-store-list");
    PipelineStore store(dir.path());
    store.replace("beta", removals({"x"}));
    store.replace("alpha", {});

    REQUIRE(store.listIds() == std::vector<std::string>{"alpha", "beta"});
    REQUIRE(PipelineStore::loadPath((dir.path() / "beta" / "pipeline.json").string()) == removals({"x"}));
}

TEST_CASE("Unknown ids, versions and unsafe ids are rejected", "[pipeline][store][errors]") {
    TempDir dir("sieve-store-errors");
    PipelineStore store(dir.path());

    REQUIRE_THROWS_AS(store.load("missing"), Sieve::IOException);
    store.replace("p", removals({"a"}));
    REQUIRE_THROWS_AS(store.loadVersion("p", 7), Sieve::IOException);
    REQUIRE_THROWS_AS(store.replace("../escape", {}), Sieve::ConfigurationException);
    REQUIRE_THROWS_AS(store.load(""), Sieve::ConfigurationException);
}

TEST_CASE("Listing a store whose root does not exist is empty", "[pipeline][store]") {
    PipelineStore store("/nonexistent/sieve/store");
    REQUIRE(store.listIds().empty());
}
