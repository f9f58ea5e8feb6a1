/**
 * @file test_hold_game.cpp
 * @brief Unit tests for the press-and-hold mini-game
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <keepsake/hold_game.h>

using namespace keepsake;
using Catch::Matchers::WithinAbs;

TEST_CASE("HoldGame completes after a continuous hold", "[minigame][hold]") {
    HoldGame game;
    int completed = 0;
    game.setSignals([&] { ++completed; }, nullptr);
    game.mount({}, 0.0);
    REQUIRE(game.isMounted());

    SECTION("progress tracks the hold") {
        game.press(-1, 100.0);
        game.update(100.0 + HoldGame::REQUIRED_MS / 2.0);
        REQUIRE_THAT(game.progress(), WithinAbs(0.5f, 0.001f));
        REQUIRE(completed == 0);
    }

    SECTION("hold for the full duration completes") {
        game.press(-1, 100.0);
        game.update(100.0 + HoldGame::REQUIRED_MS - 1.0);
        REQUIRE(completed == 0);
        game.update(100.0 + HoldGame::REQUIRED_MS);
        REQUIRE(completed == 1);
    }

    SECTION("releasing early resets progress") {
        game.press(-1, 0.0);
        game.update(1500.0);
        game.release(-1, 1500.0);
        REQUIRE(game.progress() == 0.0f);
        REQUIRE_FALSE(game.isHolding());

        game.press(-1, 1600.0);
        game.update(1600.0 + 1000.0);
        REQUIRE(completed == 0);
        REQUIRE_THAT(game.progress(), WithinAbs(1000.0f / 2100.0f, 0.001f));
    }

    SECTION("no progress without a press") {
        game.update(5000.0);
        REQUIRE(game.progress() == 0.0f);
        REQUIRE(completed == 0);
    }
}

TEST_CASE("HoldGame ignores input once unmounted", "[minigame][hold]") {
    HoldGame game;
    int completed = 0;
    game.setSignals([&] { ++completed; }, nullptr);
    game.mount({}, 0.0);
    game.unmount();

    game.press(-1, 0.0);
    game.update(5000.0);
    REQUIRE_FALSE(game.isHolding());
    REQUIRE(completed == 0);
}
