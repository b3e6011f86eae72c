/**
 * @file test_color.cpp
 * @brief Unit tests for Color parsing and luminance
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lucent/color.h>

using namespace lucent;
using Catch::Matchers::WithinAbs;

TEST_CASE("Color hex parsing", "[color]") {
    Color c;

    SECTION("#RRGGBB") {
        REQUIRE(Color::parseHex("#22cc88", c));
        REQUIRE(c.toHex() == "#22cc88");
    }

    SECTION("without hash and upper case") {
        REQUIRE(Color::parseHex("FFAA00", c));
        REQUIRE(c == Color::fromHex(0xffaa00));
    }

    SECTION("#RGB shorthand expands") {
        REQUIRE(Color::parseHex("#f0a", c));
        REQUIRE(c.toHex() == "#ff00aa");
    }

    SECTION("garbage is rejected") {
        REQUIRE_FALSE(Color::parseHex("#12345", c));
        REQUIRE_FALSE(Color::parseHex("#zzzzzz", c));
        REQUIRE_FALSE(Color::parseHex("", c));
    }

    SECTION("fromHex string returns magenta on error") {
        REQUIRE(Color::fromHex(std::string("nope")) == Color(1.0f, 0.0f, 1.0f));
    }
}

TEST_CASE("Color relative luminance", "[color]") {
    REQUIRE_THAT(Color(1.0f, 1.0f, 1.0f).relativeLuminance(), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(Color(0.0f, 0.0f, 0.0f).relativeLuminance(), WithinAbs(0.0, 1e-6));
    REQUIRE(Color::fromHex(0x00ff00).relativeLuminance() > Color::fromHex(0xff0000).relativeLuminance());
    REQUIRE(Color::fromHex(0xff0000).relativeLuminance() > Color::fromHex(0x0000ff).relativeLuminance());
}

TEST_CASE("Color byte conversion", "[color]") {
    REQUIRE(Color::toByte(0.0f) == 0);
    REQUIRE(Color::toByte(1.0f) == 255);
    REQUIRE(Color::toByte(2.0f) == 255);
    REQUIRE(Color::toByte(-1.0f) == 0);
    REQUIRE(Color::fromBytes(34, 204, 136) == Color::fromHex(0x22cc88));

    Color mid = Color(0.0f, 0.0f, 0.0f).lerp(Color(1.0f, 1.0f, 1.0f), 0.5f);
    REQUIRE_THAT(mid.r, WithinAbs(0.5, 1e-6));
}
