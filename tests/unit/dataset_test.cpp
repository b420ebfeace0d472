#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "dataset.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <string>

using namespace data_assistance;
using Catch::Matchers::WithinAbs;

TEST_CASE("CSV parsing infers column types", "[dataset]") {
    auto ds = Dataset::from_csv_string(
        "age,weight,group\n"
        "34,70.5,control\n"
        "51,82.0,treatment\n"
        "47,,control\n");

    REQUIRE(ds.row_count() == 3);
    REQUIRE(ds.column_count() == 3);

    const auto& age = ds.column("age");
    REQUIRE(age.is_numeric());
    REQUIRE(age.dtype == "int64");
    REQUIRE_THAT(age.numbers[1], WithinAbs(51.0, 1e-12));

    const auto& weight = ds.column("weight");
    REQUIRE(weight.dtype == "float64");
    REQUIRE(weight.missing_count() == 1);
    REQUIRE(weight.present_numbers().size() == 2);
    REQUIRE(weight.cell_text(2) == "NaN");

    const auto& group = ds.column("group");
    REQUIRE_FALSE(group.is_numeric());
    REQUIRE(group.dtype == "object");
    REQUIRE(group.text[1] == "treatment");

    REQUIRE(ds.total_missing() == 1);
    REQUIRE(ds.numeric_column_indices().size() == 2);
    REQUIRE(ds.categorical_column_indices().size() == 1);
}

TEST_CASE("Integers beyond int64 are typed float64", "[dataset]") {
    auto ds = Dataset::from_csv_string(
        "id,v\n"
        "99999999999999999999,1\n"
        "2,3\n");

    const auto& id = ds.column("id");
    REQUIRE(id.dtype == "float64");
    REQUIRE_THAT(id.numbers[0], WithinAbs(1e20, 1e6));
    REQUIRE(id.cell_text(0).find('-') == std::string::npos);
    REQUIRE(ds.column("v").dtype == "int64");
    REQUIRE(ds.column("v").cell_text(1) == "3");

    SECTION("Smallest int64 still fits") {
        auto edge = Dataset::from_csv_string("n\n-9223372036854775808\n42\n");
        REQUIRE(edge.column("n").dtype == "int64");
        REQUIRE(edge.column("n").cell_text(0) == "-9223372036854775808");
    }

    SECTION("Programmatic columns use the same bound") {
        Dataset built;
        built.add_numeric_column("big", {1.0, 1e20});
        built.add_numeric_column("small", {1.0, -5.0});
        REQUIRE(built.column("big").dtype == "float64");
        REQUIRE(built.column("small").dtype == "int64");
        REQUIRE(built.column("small").cell_text(1) == "-5");
    }
}

TEST_CASE("CSV quoting and line endings", "[dataset]") {
    auto ds = Dataset::from_csv_string(
        "\xEF\xBB\xBFname,note\r\n"
        "\"Smith, J\",\"said \"\"hi\"\"\"\r\n"
        "\"Lee\",\"two\nlines\"\r\n");

    REQUIRE(ds.row_count() == 2);
    REQUIRE(ds.column_names() == std::vector<std::string>{"name", "note"});
    REQUIRE(ds.column("name").text[0] == "Smith, J");
    REQUIRE(ds.column("note").text[0] == "said \"hi\"");
    REQUIRE(ds.column("note").text[1] == "two\nlines");
}

TEST_CASE("Missing tokens and ragged rows", "[dataset]") {
    SECTION("Missing markers become missing cells") {
        auto ds = Dataset::from_csv_string("x,y\n1,NA\n2,null\n3,7\n");
        REQUIRE(ds.column("y").is_numeric());
        REQUIRE(ds.column("y").missing_count() == 2);
        REQUIRE(ds.column("y").dtype == "float64");
    }

    SECTION("Short rows are padded") {
        auto ds = Dataset::from_csv_string("a,b,c\n1,2\n4,5,6\n");
        REQUIRE(ds.row_count() == 2);
        REQUIRE(ds.column("c").missing_count() == 1);
    }

    SECTION("Long rows are rejected") {
        REQUIRE_THROWS_AS(Dataset::from_csv_string("a,b\n1,2,3\n"), DatasetError);
    }

    SECTION("Unterminated quote") {
        REQUIRE_THROWS_AS(Dataset::from_csv_string("a\n\"open\n"), DatasetError);
    }

    SECTION("Empty input") {
        REQUIRE_THROWS_AS(Dataset::from_csv_string(""), DatasetError);
    }
}

TEST_CASE("Header normalization", "[dataset]") {
    auto ds = Dataset::from_csv_string(",x,x\n1,2,3\n");
    REQUIRE(ds.column_names() == std::vector<std::string>{"Unnamed: 0", "x", "x.1"});
}

TEST_CASE("Programmatic construction and slicing", "[dataset]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Dataset ds;
    ds.add_numeric_column("score", {1, 2, 3, 4, nan});
    ds.add_categorical_column("label", {"a", "b", "a", "c", "b"});

    REQUIRE(ds.row_count() == 5);
    REQUIRE(ds.column("score").missing_count() == 1);
    REQUIRE(ds.column("score").dtype == "float64");
    REQUIRE_THROWS_AS(ds.column("nope"), DatasetError);
    REQUIRE(ds.find_column("label") == 1);
    REQUIRE(ds.find_column("nope") == -1);

    SECTION("Mismatched column length") {
        REQUIRE_THROWS_AS(ds.add_numeric_column("short", {1, 2}), DatasetError);
    }

    SECTION("Duplicate name") {
        REQUIRE_THROWS_AS(ds.add_categorical_column("label", {"a", "b", "c", "d", "e"}), DatasetError);
    }

    SECTION("Slices clamp to the row count") {
        auto tail = ds.slice(3, 100);
        REQUIRE(tail.row_count() == 2);
        REQUIRE(tail.column("label").text[0] == "c");
        REQUIRE(tail.column("score").missing[1] == 1);

        REQUIRE(ds.slice(10, 20).row_count() == 0);
    }
}

TEST_CASE("Upload preview", "[dataset]") {
    auto ds = Dataset::from_csv_string("age,sex\n30,F\n40,M\n50,\n");
    auto preview = ds.preview(2);

    REQUIRE(preview.at("shape") == nlohmann::json::array({3, 2}));
    REQUIRE(preview.at("head").size() == 2);
    REQUIRE(preview.at("head")[0].at("age").get<double>() == 30.0);
    REQUIRE(preview.at("dtypes").at("age") == "int64");
    REQUIRE(preview.at("null_counts").at("sex") == 1);
    REQUIRE_THAT(preview.at("describe").at("age").at("mean").get<double>(), WithinAbs(40.0, 1e-12));
    REQUIRE_FALSE(preview.at("describe").contains("sex"));
}
