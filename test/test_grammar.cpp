#include <doctest/doctest.h>

#include "geoclean/geoclean.hpp"

#include <cmath>
#include <string>
#include <variant>

using geoclean::Hemisphere;

namespace {
    geoclean::ParsedCoordinate single(const std::optional<geoclean::GrammarMatch> &m) {
        REQUIRE(m.has_value());
        REQUIRE(std::holds_alternative<geoclean::ParsedCoordinate>(*m));
        return std::get<geoclean::ParsedCoordinate>(*m);
    }

    geoclean::ParsedCoordinatePair pair(const std::optional<geoclean::GrammarMatch> &m) {
        REQUIRE(m.has_value());
        REQUIRE(std::holds_alternative<geoclean::ParsedCoordinatePair>(*m));
        return std::get<geoclean::ParsedCoordinatePair>(*m);
    }
} // namespace

TEST_CASE("Grammar - normalize") {
    CHECK(geoclean::normalize("40 30' 15''") == "40 30' 15\"");
    CHECK(geoclean::normalize("''''") == "\"\"");
    CHECK(geoclean::normalize("'") == "'");
    CHECK(geoclean::normalize("40.5") == "40.5");
}

TEST_CASE("Grammar - Single decimal degrees") {
    SUBCASE("Unsigned") {
        const auto &c = single(geoclean::match("40.7128"));
        CHECK(c.degrees == doctest::Approx(40.7128));
        CHECK_FALSE(c.negative);
        CHECK(c.minutes == 0.0);
        CHECK(c.seconds == 0.0);
        CHECK_FALSE(c.hemisphere_leading.has_value());
        CHECK_FALSE(c.hemisphere_trailing.has_value());
    }

    SUBCASE("Signed") {
        const auto &c = single(geoclean::match("-40.7128"));
        CHECK(c.degrees == doctest::Approx(-40.7128));
        CHECK(c.negative);
    }

    SUBCASE("Surrounding whitespace and parentheses") {
        const auto &c = single(geoclean::match("  (12.5)  "));
        CHECK(c.degrees == doctest::Approx(12.5));
    }

    SUBCASE("Trailing hemisphere") {
        const auto &c = single(geoclean::match("90 N"));
        CHECK(c.degrees == doctest::Approx(90.0));
        REQUIRE(c.hemisphere_trailing.has_value());
        CHECK(*c.hemisphere_trailing == Hemisphere::North);
        CHECK_FALSE(c.hemisphere_leading.has_value());
    }

    SUBCASE("Leading hemisphere") {
        const auto &c = single(geoclean::match("S 33.8688"));
        REQUIRE(c.hemisphere_leading.has_value());
        CHECK(*c.hemisphere_leading == Hemisphere::South);
        CHECK(c.degrees == doctest::Approx(33.8688));
    }
}

TEST_CASE("Grammar - Degrees minutes seconds notations") {
    SUBCASE("Unicode marks") {
        const auto &c = single(geoclean::match("40° 42′ 46.08″ N"));
        CHECK(c.degrees == doctest::Approx(40.0));
        CHECK(c.minutes == doctest::Approx(42.0));
        CHECK(c.seconds == doctest::Approx(46.08));
        CHECK(*c.hemisphere_trailing == Hemisphere::North);
    }

    SUBCASE("ASCII marks with doubled apostrophe") {
        const auto &c = single(geoclean::match("40°26'46''N"));
        CHECK(c.degrees == doctest::Approx(40.0));
        CHECK(c.minutes == doctest::Approx(26.0));
        CHECK(c.seconds == doctest::Approx(46.0));
        CHECK(*c.hemisphere_trailing == Hemisphere::North);
    }

    SUBCASE("Letter marks") {
        const auto &c = single(geoclean::match("74D 0m 21.6s W"));
        CHECK(c.degrees == doctest::Approx(74.0));
        CHECK(c.minutes == doctest::Approx(0.0));
        CHECK(c.seconds == doctest::Approx(21.6));
        CHECK(*c.hemisphere_trailing == Hemisphere::West);
    }

    SUBCASE("Asterisk degree mark") {
        const auto &c = single(geoclean::match("51*30 N"));
        CHECK(c.degrees == doctest::Approx(51.0));
        CHECK(c.minutes == doctest::Approx(30.0));
    }

    SUBCASE("Space separated minutes") {
        const auto &c = single(geoclean::match("N 40 30' 15\""));
        CHECK(*c.hemisphere_leading == Hemisphere::North);
        CHECK(c.minutes == doctest::Approx(30.0));
        CHECK(c.seconds == doctest::Approx(15.0));
    }

    SUBCASE("A bare second number reads as minutes") {
        const auto &c = single(geoclean::match("40 74"));
        CHECK(c.degrees == doctest::Approx(40.0));
        CHECK(c.minutes == doctest::Approx(74.0));
    }
}

TEST_CASE("Grammar - Coordinate pairs") {
    SUBCASE("Comma with hemispheres") {
        const auto &p = pair(geoclean::match("40.7128 N, 74.0060 W"));
        CHECK(p.latitude.degrees == doctest::Approx(40.7128));
        CHECK(*p.latitude.hemisphere_trailing == Hemisphere::North);
        CHECK(p.longitude.degrees == doctest::Approx(74.006));
        CHECK(*p.longitude.hemisphere_trailing == Hemisphere::West);
    }

    SUBCASE("Parenthesized signed pair") {
        const auto &p = pair(geoclean::match("(40.7128, -74.0060)"));
        CHECK(p.latitude.degrees == doctest::Approx(40.7128));
        CHECK(p.longitude.negative);
    }

    SUBCASE("Other delimiters") {
        CHECK(pair(geoclean::match("40;74")).longitude.degrees == doctest::Approx(74.0));
        CHECK(pair(geoclean::match("40/74")).longitude.degrees == doctest::Approx(74.0));
        CHECK(pair(geoclean::match("40.7128 -74.0060")).longitude.degrees == doctest::Approx(-74.006));
    }

    SUBCASE("Hemisphere letters around a separator") {
        const auto &p = pair(geoclean::match("40 N 30 S"));
        CHECK(*p.latitude.hemisphere_trailing == Hemisphere::North);
        CHECK(*p.longitude.hemisphere_trailing == Hemisphere::South);
    }
}

TEST_CASE("Grammar - No match") {
    CHECK_FALSE(geoclean::match("not a coordinate").has_value());
    CHECK_FALSE(geoclean::match("").has_value());
    CHECK_FALSE(geoclean::match("N").has_value());
    CHECK_FALSE(geoclean::match("40.7128 X").has_value());
}

TEST_CASE("Grammar - Digit strings beyond double range") {
    const std::string zeros(400, '0');

    auto big = single(geoclean::match("1" + zeros));
    CHECK(std::isinf(big.degrees));
    CHECK(big.degrees > 0.0);

    auto negative = single(geoclean::match("-1" + zeros + ".5"));
    CHECK(std::isinf(negative.degrees));
    CHECK(negative.degrees < 0.0);
    CHECK(negative.negative);

    auto small = single(geoclean::match("0." + zeros + "1"));
    CHECK(small.degrees == 0.0);

    auto minutes = single(geoclean::match("40 " + zeros + "1'"));
    CHECK(minutes.minutes == doctest::Approx(1.0));
}
