#include <doctest/doctest.h>

#include "geoclean/geoclean.hpp"

#include <sstream>
#include <string>
#include <vector>

using geoclean::Cell;

namespace {
    geoclean::Table sample() {
        geoclean::Table t;
        t.setColumn("city", {Cell{std::string("New York")}, Cell{std::string("Sydney")}, Cell{std::string("Nowhere")},
                             Cell{std::string("Unknown")}});
        t.setColumn("coords", {Cell{std::string("40.7128 N, 74.0060 W")}, Cell{std::string("(-33.8688, 151.2093)")},
                               Cell{std::string("somewhere")}, Cell{std::string("NULL")}});
        return t;
    }
} // namespace

TEST_CASE("Table - Columns") {
    geoclean::Table t;
    CHECK(t.rowCount() == 0);
    CHECK(t.columnCount() == 0);

    t.setColumn("a", {Cell{1.0}, Cell{2.0}});
    CHECK(t.rowCount() == 2);
    CHECK(t.hasColumn("a"));
    CHECK_FALSE(t.hasColumn("b"));

    CHECK_THROWS_AS(t.setColumn("b", {Cell{1.0}}), std::invalid_argument);
    CHECK_THROWS_AS(t.column("b"), std::out_of_range);
    CHECK_THROWS_AS(t.at("a", 2), std::out_of_range);
    CHECK_THROWS_AS(t.dropColumn("b"), std::out_of_range);

    t.setColumn("b", {Cell{}, Cell{std::string("x")}});
    CHECK((t.columnNames() == std::vector<std::string>{"a", "b"}));
    CHECK(std::get<std::string>(t.at("b", 1)) == "x");

    t.dropColumn("a");
    CHECK((t.columnNames() == std::vector<std::string>{"b"}));
}

TEST_CASE("Table - Cleaning a column") {
    SUBCASE("Split into latitude and longitude") {
        auto t = sample();
        geoclean::CleanerOptions opts;
        opts.split = true;
        auto stats = geoclean::cleanLatLong(t, "coords", opts);

        CHECK(stats.cleaned == 2);
        CHECK(stats.unknown == 1);
        CHECK(stats.null == 1);
        REQUIRE(t.hasColumn("latitude"));
        REQUIRE(t.hasColumn("longitude"));
        CHECK(t.hasColumn("coords"));

        CHECK(std::get<double>(t.at("latitude", 0)) == doctest::Approx(40.7128));
        CHECK(std::get<double>(t.at("longitude", 0)) == doctest::Approx(-74.006));
        CHECK(std::get<double>(t.at("latitude", 1)) == doctest::Approx(-33.8688));
        CHECK(std::get<double>(t.at("longitude", 1)) == doctest::Approx(151.2093));
        CHECK(std::holds_alternative<std::monostate>(t.at("latitude", 2)));
        CHECK(std::holds_alternative<std::monostate>(t.at("longitude", 3)));
    }

    SUBCASE("Single cleaned column, in place") {
        auto t = sample();
        geoclean::CleanerOptions opts;
        opts.format = geoclean::OutputFormat::DecimalDegreesWithHemisphere;
        opts.inplace = true;
        geoclean::cleanLatLong(t, "coords", opts);

        CHECK_FALSE(t.hasColumn("coords"));
        REQUIRE(t.hasColumn("coords_clean"));
        CHECK(std::get<std::string>(t.at("coords_clean", 0)) == "40.7128° N, 74.006° W");
        CHECK(std::get<std::string>(t.at("coords_clean", 1)) == "33.8688° S, 151.2093° E");
        CHECK(std::holds_alternative<std::monostate>(t.at("coords_clean", 2)));
    }

    SUBCASE("Ignore keeps unusable text") {
        auto t = sample();
        geoclean::CleanerOptions opts;
        opts.errors = geoclean::ErrorPolicy::Ignore;
        auto stats = geoclean::cleanLatLong(t, "coords", opts);

        CHECK(stats.unknown == 1);
        CHECK(stats.null == 1);
        CHECK(std::get<std::string>(t.at("coords_clean", 2)) == "somewhere");
        CHECK(std::get<std::string>(t.at("coords_clean", 3)) == "NULL");
        CHECK(std::holds_alternative<dp::Geo>(t.at("coords_clean", 0)));
    }

    SUBCASE("Unknown column") {
        auto t = sample();
        CHECK_THROWS_AS(geoclean::cleanLatLong(t, "missing"), std::out_of_range);
    }
}

TEST_CASE("Table - Printing") {
    geoclean::Table t;
    t.setColumn("v", {Cell{std::string("12.5")}, Cell{}});
    std::ostringstream os;
    os << t;
    CHECK(os.str() == "ROWS: 2\nCOLUMNS: v\n  12.5\n  NaN\n");
}
