#include "NumericProjection.h"
#include "SieveExceptions.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <limits>

using namespace SieveTests;

TEST_CASE("Projection keeps numeric columns and drops rows with nulls", "[core][projection]") {
    const DataFrame data = ageCityFrame();
    const NumericProjection projection = projectNumeric(data, ageCityTypes());

    REQUIRE(projection.numericColumns == std::vector<std::string>{"age"});
    REQUIRE(projection.frame.columnNames() == std::vector<std::string>{"age"});
    REQUIRE(projection.frame.rowCount() == 3);
    REQUIRE(numbers(projection.frame, "age") == std::vector<double>{31.0, 45.0, 27.0});
    REQUIRE(projection.frame.missingCellCount() == 0);
}

TEST_CASE("Projection leaves the input dataset untouched", "[core][projection]") {
    const DataFrame data = ageCityFrame();
    const DataFrame before = data;
    (void)projectNumeric(data, ageCityTypes());
    REQUIRE(data == before);
    REQUIRE(data.rowCount() == 4);
}

TEST_CASE("Projection preserves column order and casts numeric text", "[core][projection]") {
    const DataFrame data({
        makeTextColumn("score", {std::string("1.5"), std::string(" 2 "), std::string("3e1")}),
        makeTextColumn("name", {std::string("a"), std::string("b"), std::string("c")}),
        makeNumericColumn("weight", {std::nullopt, 70.0, 80.0}),
    });
    const ColumnTypeMap types = {
        {"score", ColumnType::NUMBER_WITH_DECIMALS},
        {"name", ColumnType::CATEGORY},
        {"weight", ColumnType::NUMBER},
    };

    const NumericProjection projection = projectNumeric(data, types);
    REQUIRE(projection.numericColumns == std::vector<std::string>{"score", "weight"});
    REQUIRE(projection.frame.rowCount() == 2);
    REQUIRE(numbers(projection.frame, "score") == std::vector<double>{2.0, 30.0});
    REQUIRE(numbers(projection.frame, "weight") == std::vector<double>{70.0, 80.0});
}

TEST_CASE("Projection reports uncastable numeric values and untyped columns", "[core][projection][errors]") {
    const DataFrame data({makeTextColumn("price", {std::string("12"), std::string("twelve")})});

    try {
        projectNumeric(data, {{"price", ColumnType::NUMBER}});
        FAIL("expected a data contract error");
    } catch (const Sieve::DataContractException& ex) {
        REQUIRE(ex.identifier() == "price");
        REQUIRE(ex.kind() == Sieve::ErrorKind::DATA_CONTRACT);
    }

    try {
        projectNumeric(data, {});
        FAIL("expected a data contract error");
    } catch (const Sieve::DataContractException& ex) {
        REQUIRE(ex.identifier() == "price");
    }
}

TEST_CASE("Projection of a dataset without numeric columns is empty", "[core][projection]") {
    const DataFrame data({makeTextColumn("city", {std::string("Lyon")})});
    const NumericProjection projection = projectNumeric(data, {{"city", ColumnType::TEXT}});
    REQUIRE(projection.numericColumns.empty());
    REQUIRE(projection.frame.colCount() == 0);
    REQUIRE(projection.frame.rowCount() == 0);
}

TEST_CASE("Projection treats infinite values like nulls", "[core][projection]") {
    const DataFrame data({
        makeNumericColumn("x", {1.0, std::numeric_limits<double>::infinity(), 3.0, -std::numeric_limits<double>::infinity()}),
        makeNumericColumn("y", {4.0, 5.0, 6.0, 7.0}),
    });
    const ColumnTypeMap types = {{"x", ColumnType::NUMBER}, {"y", ColumnType::NUMBER_WITH_DECIMALS}};

    const NumericProjection projection = projectNumeric(data, types);
    REQUIRE(projection.frame.rowCount() == 2);
    REQUIRE(numbers(projection.frame, "x") == std::vector<double>{1.0, 3.0});
    REQUIRE(numbers(projection.frame, "y") == std::vector<double>{4.0, 6.0});
}
