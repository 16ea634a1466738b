#include <catch2/catch.hpp>

#include "exceptions/Exceptions.hpp"
#include "prevalence/CategoryCounts.hpp"

#include <limits>

using namespace nettrans;

const char* tag_counts = "[counts]";

TEST_CASE("Counts are aggregated per age with ages sorted", tag_counts) {
    const std::vector<CategoryCount> records = {
        {5.0, "obese", 2.0},
        {3.0, "normal", 10.0},
        {5.0, "normal", 6.0},
        {3.0, "obese", 1.0},
        {5.0, "obese", 3.0},   // same cell as the first record
        {4.0, "overweight", 0.0},
    };
    const CountTable table = aggregateCounts(records, {"normal", "overweight", "obese"});

    REQUIRE(table.numAges() == 3);
    CHECK(table.ages == std::vector<double>{3.0, 4.0, 5.0});
    CHECK(table.counts(2, 2) == Approx(5.0));
    CHECK(table.counts(0, 0) == Approx(10.0));
    CHECK(table.total() == Approx(22.0));
    CHECK(table.rowTotals()(1) == 0.0);

    const Eigen::MatrixXd props = table.observedProportions();
    CHECK(props.row(0).sum() == Approx(1.0).margin(1e-15));
    CHECK(props.row(1).sum() == 0.0);
    CHECK(props(2, 0) == Approx(6.0 / 11.0).margin(1e-15));
}

TEST_CASE("Categories are listed in order of first appearance", tag_counts) {
    const std::vector<CategoryCount> records = {
        {1.0, "b", 1.0}, {1.0, "a", 1.0}, {2.0, "b", 1.0}, {2.0, "c", 1.0}};
    REQUIRE(categoriesInOrderOfAppearance(records) == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("Inconsistent count records are rejected", tag_counts) {
    const std::vector<std::string> order = {"normal", "overweight", "obese"};

    CHECK_THROWS_AS(aggregateCounts({{1.0, "normal", 1.0}}, {"normal"}), InvalidConfigException);
    CHECK_THROWS_AS(aggregateCounts({{1.0, "normal", 1.0}}, {"normal", "normal"}), InvalidConfigException);
    CHECK_THROWS_AS(aggregateCounts({{1.0, "underweight", 1.0}}, order), InvalidConfigException);
    CHECK_THROWS_AS(aggregateCounts({{1.0, "normal", -1.0}}, order), InvalidConfigException);
    CHECK_THROWS_AS(aggregateCounts({{std::numeric_limits<double>::quiet_NaN(), "normal", 1.0}}, order),
                    InvalidConfigException);
}
