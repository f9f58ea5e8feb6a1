/**
 * @file test_fade.cpp
 * @brief Unit tests for FadeEngine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <keepsake/fade.h>

#include <string>

using namespace keepsake;
using Catch::Matchers::WithinAbs;

TEST_CASE("FadeDescriptor endpoints are exact", "[audio][fade]") {
    FadeDescriptor f;
    f.from = 0.2f;
    f.to = 0.9f;
    f.startTime = 1000.0;
    f.duration = 500.0;
    f.active = true;

    SECTION("start returns from") {
        REQUIRE(f.sample(1000.0) == 0.2f);
    }

    SECTION("before start returns from") {
        REQUIRE(f.sample(400.0) == 0.2f);
    }

    SECTION("end returns to") {
        REQUIRE(f.sample(1500.0) == 0.9f);
        REQUIRE(f.sample(9000.0) == 0.9f);
    }

    SECTION("midpoint is halfway under ease-in-out") {
        REQUIRE_THAT(f.sample(1250.0), WithinAbs(0.55f, 0.001f));
    }
}

TEST_CASE("FadeEngine drives channels independently", "[audio][fade]") {
    FadeEngine fades;

    SECTION("idle engine needs no update") {
        REQUIRE_FALSE(fades.needsUpdate());
        REQUIRE(fades.update(100.0).empty());
    }

    SECTION("samples are monotonic and finish once") {
        REQUIRE(fades.startFade(Channel::Ambient, 0.0f, 1.0f, 1000.0, 0.0));
        REQUIRE(fades.needsUpdate());

        float last = 0.0f;
        int finishedCount = 0;
        for (double t = 0.0; t <= 1200.0; t += 50.0) {
            for (const auto& s : fades.update(t)) {
                REQUIRE(s.channel == Channel::Ambient);
                REQUIRE(s.value >= last);
                last = s.value;
                if (s.finished) ++finishedCount;
            }
        }
        REQUIRE(finishedCount == 1);
        REQUIRE(fades.value(Channel::Ambient) == 1.0f);
        REQUIRE_FALSE(fades.needsUpdate());
    }

    SECTION("zero duration snaps") {
        REQUIRE_FALSE(fades.startFade(Channel::Final, 0.5f, 0.1f, 0.0, 0.0));
        REQUIRE(fades.value(Channel::Final) == 0.1f);
        REQUIRE_FALSE(fades.isActive(Channel::Final));
    }

    SECTION("last writer wins") {
        fades.startFade(Channel::Ambient, 0.0f, 1.0f, 1000.0, 0.0);
        fades.update(500.0);
        fades.startFade(Channel::Ambient, 0.3f, 0.0f, 200.0, 500.0);
        REQUIRE(fades.descriptor(Channel::Ambient).to == 0.0f);
        fades.update(700.0);
        REQUIRE(fades.value(Channel::Ambient) == 0.0f);
    }

    SECTION("cancel leaves the other channel running") {
        fades.startFade(Channel::Ambient, 0.0f, 1.0f, 1000.0, 0.0);
        fades.startFade(Channel::Final, 1.0f, 0.0f, 1000.0, 0.0);
        fades.cancel(Channel::Ambient);
        auto samples = fades.update(500.0);
        REQUIRE(samples.size() == 1);
        REQUIRE(samples[0].channel == Channel::Final);
    }
}

TEST_CASE("Channel helpers", "[audio][fade]") {
    REQUIRE(otherChannel(Channel::Ambient) == Channel::Final);
    REQUIRE(otherChannel(Channel::Final) == Channel::Ambient);
    REQUIRE(std::string(channelName(Channel::Final)) == "final");
}
