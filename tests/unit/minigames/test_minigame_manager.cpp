/**
 * @file test_minigame_manager.cpp
 * @brief Unit tests for MiniGameManager lifecycle and single resolution
 */

#include <catch2/catch_test_macros.hpp>
#include <keepsake/minigame_manager.h>
#include "support/recording_presenter.h"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace keepsake;
using keepsake::test::RecordingPresenter;

namespace {

// Completes on press, cancels on press(-2), throws from mount when asked
class ScriptedGame : public MiniGame {
public:
    explicit ScriptedGame(int* unmounts = nullptr, bool throwOnMount = false)
        : m_unmounts(unmounts), m_throw(throwOnMount) {}

    std::string title() const override { return "Scripted"; }
    std::string hint() const override { return "Do the thing"; }

    void mount(const PlaySurface&, double) override {
        if (m_throw) throw std::runtime_error("no surface");
        m_mounted = true;
        setHint("Mounted");
    }
    void update(double) override {}
    void unmount() override {
        m_mounted = false;
        if (m_unmounts) ++*m_unmounts;
        // A late signal from unmount must not resolve twice
        complete();
    }
    void press(int target, double) override {
        if (target == -2) {
            cancel();
        } else {
            complete();
            complete();
        }
    }

private:
    int* m_unmounts;
    bool m_throw;
};

} // namespace

TEST_CASE("MiniGameManager resolves once on completion", "[minigame][manager]") {
    TaskQueue tasks;
    RecordingPresenter presenter;
    MiniGameManager manager(tasks, presenter);
    int unmounts = 0;

    std::vector<bool> results;
    manager.open(std::make_unique<ScriptedGame>(&unmounts), 0.0)
        .then([&](bool ok) { results.push_back(ok); });

    REQUIRE(manager.isOpen());
    REQUIRE(presenter.miniGameVisible);
    REQUIRE(presenter.miniGameTitles.back() == "Scripted");
    REQUIRE(presenter.hint == "Mounted");

    manager.press(0, 100.0);
    REQUIRE_FALSE(manager.isOpen());
    REQUIRE_FALSE(presenter.miniGameVisible);
    REQUIRE(unmounts == 1);

    tasks.drain();
    tasks.drain();
    REQUIRE(results == std::vector<bool>{true});

    // Retired game is released on the next update
    manager.update(200.0);
    REQUIRE(manager.active() == nullptr);
}

TEST_CASE("MiniGameManager cancellation paths", "[minigame][manager]") {
    TaskQueue tasks;
    RecordingPresenter presenter;
    MiniGameManager manager(tasks, presenter);

    std::vector<bool> results;
    manager.open(std::make_unique<ScriptedGame>(), 1000.0)
        .then([&](bool ok) { results.push_back(ok); });

    SECTION("game cancel resolves false") {
        manager.press(-2, 1100.0);
        tasks.drain();
        REQUIRE(results == std::vector<bool>{false});
    }

    SECTION("explicit close resolves false") {
        manager.close();
        manager.close();
        tasks.drain();
        REQUIRE(results == std::vector<bool>{false});
        REQUIRE(presenter.miniGameHidden == 1);
    }

    SECTION("backdrop taps inside the guard are ignored") {
        REQUIRE_FALSE(manager.dismiss(1000.0 + MiniGameManager::DISMISS_GUARD_MS - 1.0));
        REQUIRE(manager.isOpen());

        REQUIRE(manager.dismiss(1000.0 + MiniGameManager::DISMISS_GUARD_MS));
        REQUIRE_FALSE(manager.isOpen());
        tasks.drain();
        REQUIRE(results == std::vector<bool>{false});
    }

    SECTION("opening another game cancels the first") {
        std::vector<bool> second;
        manager.open(std::make_unique<ScriptedGame>(), 1200.0)
            .then([&](bool ok) { second.push_back(ok); });
        REQUIRE(manager.isOpen());

        manager.press(0, 1300.0);
        tasks.drain();
        REQUIRE(results == std::vector<bool>{false});
        REQUIRE(second == std::vector<bool>{true});
    }
}

TEST_CASE("MiniGameManager survives a failing mount", "[minigame][manager]") {
    TaskQueue tasks;
    RecordingPresenter presenter;
    MiniGameManager manager(tasks, presenter);

    bool result = true;
    manager.open(std::make_unique<ScriptedGame>(nullptr, true), 0.0)
        .then([&](bool ok) { result = ok; });

    REQUIRE_FALSE(manager.isOpen());
    REQUIRE_FALSE(presenter.miniGameVisible);
    tasks.drain();
    REQUIRE_FALSE(result);
}

TEST_CASE("MiniGameManager rejects a null game", "[minigame][manager]") {
    TaskQueue tasks;
    RecordingPresenter presenter;
    MiniGameManager manager(tasks, presenter);

    Outcome o = manager.open(nullptr, 0.0);
    REQUIRE(o.isResolved());
    REQUIRE_FALSE(o.value());
    REQUIRE_FALSE(manager.isOpen());
}
