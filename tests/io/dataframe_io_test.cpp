#include "DataFrameIO.h"
#include "SieveExceptions.h"

#include "common/TestFixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace SieveTests;

TEST_CASE("CSV reader infers numeric and text columns with missing tokens", "[io][csv]") {
    std::istringstream in("\xEF\xBB\xBF" "age,city,note\n31,Lyon,\"hello, world\"\nNA,Oslo,\n45,,\"multi\nline\"\n");
    const DataFrame frame = DataFrameIO::readCsv(in);

    REQUIRE(frame.columnNames() == std::vector<std::string>{"age", "city", "note"});
    REQUIRE(frame.rowCount() == 3);
    REQUIRE(frame.column("age").isNumeric());
    REQUIRE_FALSE(frame.column("city").isNumeric());
    REQUIRE(frame.column("age").isMissing(1));
    REQUIRE(frame.column("city").isMissing(2));
    REQUIRE(texts(frame, "note")[0] == "hello, world");
    REQUIRE(texts(frame, "note")[2] == "multi\nline");
}

TEST_CASE("CSV writer output reads back to the same frame", "[io][csv]") {
    const DataFrame original = ageCityFrame();
    std::ostringstream out;
    DataFrameIO::writeCsv(original, out);

    REQUIRE(out.str() == "age,city\n31,Lyon\n,Oslo\n45,Lima\n27,\n");

    std::istringstream in(out.str());
    REQUIRE(DataFrameIO::readCsv(in) == original);
}

TEST_CASE("CSV reader rejects malformed input", "[io][csv][errors]") {
    std::istringstream tooWide("a,b\n1,2,3\n");
    REQUIRE_THROWS_AS(DataFrameIO::readCsv(tooWide), Sieve::DatasetException);

    std::istringstream unterminated("a,b\n\"1,2\n");
    REQUIRE_THROWS_AS(DataFrameIO::readCsv(unterminated), Sieve::DatasetException);

    std::istringstream empty("");
    REQUIRE_THROWS_AS(DataFrameIO::readCsv(empty), Sieve::DatasetException);
}

TEST_CASE("Loading a missing file is an IO error naming the path", "[io][csv][errors]") {
    try {
        DataFrameIO::loadCsv("/nonexistent/sieve/input.csv");
        FAIL("expected an IO error");
    } catch (const Sieve::IOException& ex) {
        REQUIRE(ex.identifier() == "/nonexistent/sieve/input.csv");
        REQUIRE(ex.kind() == Sieve::ErrorKind::IO);
    }
}
