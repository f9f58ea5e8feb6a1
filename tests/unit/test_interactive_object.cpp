/**
 * @file test_interactive_object.cpp
 * @brief Unit tests for InteractiveObject idle motion and discovery
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <keepsake/interactive_object.h>

#include <cmath>

using namespace keepsake;
using Catch::Matchers::WithinAbs;

TEST_CASE("InteractiveObject discovery is one-way", "[world][object]") {
    InteractiveObject obj("star", 0.4f);
    REQUIRE(obj.id() == "star");
    REQUIRE_FALSE(obj.isDiscovered());

    obj.markDiscovered();
    obj.markDiscovered();
    REQUIRE(obj.isDiscovered());
}

TEST_CASE("InteractiveObject idle pose", "[world][object]") {
    InteractiveObject a("moon", 0.0f);
    InteractiveObject b("moon", 2.5f);

    SECTION("offsets stay small") {
        for (double t = 0.0; t < 10000.0; t += 333.0) {
            a.update(t);
            REQUIRE(std::abs(a.pose().offsetY) <= 4.2f + 1e-4f);
            REQUIRE(std::abs(a.pose().rotation) <= 1.4f + 1e-4f);
            REQUIRE_THAT(a.pose().scale, WithinAbs(1.0f, 0.017f));
        }
    }

    SECTION("seeds desynchronize objects") {
        a.update(1000.0);
        b.update(1000.0);
        REQUIRE(a.pose().offsetY != b.pose().offsetY);
    }

    SECTION("reduced motion holds still") {
        a.update(1234.0, true);
        REQUIRE(a.pose().offsetY == 0.0f);
        REQUIRE(a.pose().rotation == 0.0f);
        REQUIRE(a.pose().scale == 1.0f);
    }

    SECTION("discovered objects are brighter") {
        a.update(0.0);
        float dim = a.pose().opacity;
        a.markDiscovered();
        a.update(0.0);
        REQUIRE(a.pose().opacity > dim);
        REQUIRE_THAT(a.pose().opacity, WithinAbs(1.0f, 1e-6f));
    }
}

TEST_CASE("InteractiveObject tap bounce", "[world][object]") {
    InteractiveObject obj("shell", 1.0f);

    obj.playTapAnimation(0.0);
    REQUIRE(obj.isTapAnimating());

    obj.update(InteractiveObject::TAP_ANIM_MS / 2.0, true);
    REQUIRE(obj.pose().scale > 1.04f);

    obj.update(InteractiveObject::TAP_ANIM_MS, true);
    REQUIRE_FALSE(obj.isTapAnimating());
    REQUIRE_THAT(obj.pose().scale, WithinAbs(1.0f, 1e-5f));
}
