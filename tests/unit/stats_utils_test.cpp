#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "stats_utils.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace data_assistance;
using Catch::Matchers::WithinAbs;

TEST_CASE("Moments", "[stats]") {
    std::vector<double> v = {2, 4, 4, 4, 5, 5, 7, 9};
    REQUIRE_THAT(stats::mean(v), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(stats::sample_std(v), WithinAbs(std::sqrt(32.0 / 7.0), 1e-12));

    REQUIRE(std::isnan(stats::mean({})));
    REQUIRE(std::isnan(stats::sample_std({3.0})));
}

TEST_CASE("Quantiles interpolate linearly", "[stats]") {
    std::vector<double> sorted = {1, 2, 3, 4};
    REQUIRE_THAT(stats::quantile(sorted, 0.0), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(stats::quantile(sorted, 0.25), WithinAbs(1.75, 1e-12));
    REQUIRE_THAT(stats::quantile(sorted, 0.5), WithinAbs(2.5, 1e-12));
    REQUIRE_THAT(stats::quantile(sorted, 1.0), WithinAbs(4.0, 1e-12));
}

TEST_CASE("Summary of unsorted input", "[stats]") {
    auto s = stats::summarize({9, 1, 5, 3, 7});
    REQUIRE(s.count == 5);
    REQUIRE_THAT(s.min, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(s.max, WithinAbs(9.0, 1e-12));
    REQUIRE_THAT(s.median, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(s.q25, WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(s.q75, WithinAbs(7.0, 1e-12));

    auto empty = stats::summarize({});
    REQUIRE(empty.count == 0);
    REQUIRE(std::isnan(empty.min));
}

TEST_CASE("Value counts and mode", "[stats]") {
    std::vector<std::string> values = {"b", "a", "c", "a", "b", "d"};
    auto counts = stats::value_counts(values);

    REQUIRE(counts.size() == 4);
    // equal counts keep first-appearance order
    REQUIRE(counts[0] == std::make_pair(std::string("b"), std::size_t{2}));
    REQUIRE(counts[1] == std::make_pair(std::string("a"), std::size_t{2}));
    REQUIRE(counts[2].first == "c");

    REQUIRE(stats::mode(values) == std::optional<std::string>("a"));
    REQUIRE_FALSE(stats::mode({}).has_value());
    REQUIRE(stats::unique_count(values) == 4);
}

TEST_CASE("Pearson correlation", "[stats]") {
    std::vector<uint8_t> none(5, 0);

    SECTION("Perfect linear relationships") {
        std::vector<double> x = {1, 2, 3, 4, 5};
        std::vector<double> up = {2, 4, 6, 8, 10};
        std::vector<double> down = {10, 8, 6, 4, 2};
        REQUIRE_THAT(stats::pearson(x, none, up, none), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(stats::pearson(x, none, down, none), WithinAbs(-1.0, 1e-12));
    }

    SECTION("Missing rows are dropped pairwise") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        std::vector<double> x = {1, 2, nan, 4, 5};
        std::vector<uint8_t> x_missing = {0, 0, 1, 0, 0};
        std::vector<double> y = {1, 2, 100, 4, 5};
        REQUIRE_THAT(stats::pearson(x, x_missing, y, none), WithinAbs(1.0, 1e-12));
    }

    SECTION("Constant input has no correlation") {
        std::vector<double> x = {1, 2, 3, 4, 5};
        std::vector<double> flat = {3, 3, 3, 3, 3};
        REQUIRE(std::isnan(stats::pearson(x, none, flat, none)));
    }
}

TEST_CASE("Fixed formatting", "[stats]") {
    REQUIRE(stats::format_fixed(3.14159, 2) == "3.14");
    REQUIRE(stats::format_fixed(1.0, 6) == "1.000000");
    REQUIRE(stats::format_fixed(std::numeric_limits<double>::quiet_NaN(), 2) == "nan");
}
