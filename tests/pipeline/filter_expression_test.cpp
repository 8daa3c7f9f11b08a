#include "FilterExpression.h"
#include "SieveExceptions.h"

#include <catch2/catch_test_macros.hpp>

namespace {
DataFrame people() {
    return DataFrame({
        makeNumericColumn("age", {20.0, 35.0, std::nullopt, 50.0}),
        makeTextColumn("city", {std::string("Oslo"), std::string("Lima"), std::string("Oslo"), std::nullopt}),
        makeNumericColumn("home value", {1.0, 2.0, 3.0, 4.0}),
    });
}

MissingMask run(const std::string& code) {
    return FilterExpression::parse(code).evaluate(people());
}
} // namespace

TEST_CASE("Comparisons on numeric and text columns", "[pipeline][filter]") {
    REQUIRE(run("age >= 35") == MissingMask{0, 1, 0, 1});
    REQUIRE(run("age < 35") == MissingMask{1, 0, 0, 0});
    REQUIRE(run("city == 'Oslo'") == MissingMask{1, 0, 1, 0});
    REQUIRE(run("city != \"Oslo\"") == MissingMask{0, 1, 0, 0});
    REQUIRE(run("`home value` > 2.5") == MissingMask{0, 0, 1, 1});
}

TEST_CASE("Null cells only match null comparisons", "[pipeline][filter]") {
    REQUIRE(run("age == null") == MissingMask{0, 0, 1, 0});
    REQUIRE(run("age != null") == MissingMask{1, 1, 0, 1});
    REQUIRE(run("age != 20") == MissingMask{0, 1, 0, 1});
}

TEST_CASE("And binds tighter than or and parentheses regroup", "[pipeline][filter]") {
    REQUIRE(run("age > 30 or city == 'Oslo' and age < 30") == MissingMask{1, 1, 0, 1});
    REQUIRE(run("(age > 30 or city == 'Oslo') and age < 40") == MissingMask{1, 1, 0, 0});
    REQUIRE(run("age <= 5.5e1 AND age >= -1e-05") == MissingMask{1, 1, 0, 1});
}

TEST_CASE("Referenced columns are listed once in order", "[pipeline][filter]") {
    const FilterExpression expr = FilterExpression::parse("age > 1 and (city == 'x' or age < 3)");
    REQUIRE(expr.referencedColumns() == std::vector<std::string>{"age", "city"});
}

TEST_CASE("Column quoting round-trips through the parser", "[pipeline][filter]") {
    REQUIRE(FilterExpression::quoteColumn("age") == "age");
    REQUIRE(FilterExpression::quoteColumn("home value") == "`home value`");
    REQUIRE(FilterExpression::quoteColumn("or") == "`or`");
    REQUIRE(FilterExpression::quoteColumn("a`b") == "`a``b`");

    const DataFrame data({makeNumericColumn("a`b", {1.0, 5.0})});
    const std::string code = FilterExpression::quoteColumn("a`b") + " > 2";
    REQUIRE(FilterExpression::parse(code).evaluate(data) == MissingMask{0, 1});
}

TEST_CASE("Syntax errors and unknown columns are resolution errors", "[pipeline][filter][errors]") {
    REQUIRE_THROWS_AS(FilterExpression::parse(""), Sieve::ResolutionException);
    REQUIRE_THROWS_AS(FilterExpression::parse("age >"), Sieve::ResolutionException);
    REQUIRE_THROWS_AS(FilterExpression::parse("age = 3"), Sieve::ResolutionException);
    REQUIRE_THROWS_AS(FilterExpression::parse("(age > 3"), Sieve::ResolutionException);
    REQUIRE_THROWS_AS(FilterExpression::parse("age < null"), Sieve::ResolutionException);
    REQUIRE_THROWS_AS(FilterExpression::parse("city == 'open"), Sieve::ResolutionException);

    try {
        run("salary > 10");
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "filter");
        REQUIRE(ex.identifier() == "salary");
    }
}

TEST_CASE("Nesting depth is bounded with a resolution error", "[pipeline][filter][errors]") {
    const std::string deepParens = std::string(200000, '(') + "age > 1" + std::string(200000, ')');
    try {
        FilterExpression::parse(deepParens);
        FAIL("expected a resolution error");
    } catch (const Sieve::ResolutionException& ex) {
        REQUIRE(ex.actionType() == "filter");
        REQUIRE(ex.identifier().empty());
    }

    std::string longChain = "age > 1";
    for (int i = 0; i < 5000; ++i) longChain += " and age > 1";
    REQUIRE_THROWS_AS(FilterExpression::parse(longChain), Sieve::ResolutionException);

    const std::string moderate = std::string(100, '(') + "age > 30" + std::string(100, ')');
    REQUIRE(run(moderate) == MissingMask{0, 1, 0, 1});

    std::string shortChain = "age > 1";
    for (int i = 0; i < 100; ++i) shortChain += " and age > 1";
    REQUIRE(run(shortChain) == MissingMask{1, 1, 0, 1});
}
