/**
 * @file test_experience.cpp
 * @brief End-to-end journeys through Experience with fake audio and storage
 */

#include <catch2/catch_test_macros.hpp>
#include <keepsake/catch_game.h>
#include <keepsake/experience.h>
#include <keepsake/hold_game.h>
#include "support/fake_track.h"
#include "support/recording_presenter.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keepsake;
using keepsake::test::FakeTrack;
using keepsake::test::RecordingPresenter;

namespace {

struct Harness {
    explicit Harness(const ProgressRecord& saved = {}) {
        storage.save(saved);
        savesBefore = storage.saveCount();
        ExperienceOptions options;
        options.seed = 1234;
        exp = std::make_unique<Experience>(ctx, defaultContent(), audio, storage, presenter, options);
    }

    void run(double ms, double step = 16.0) {
        for (double t = 0.0; t < ms; t += step) {
            ctx.advance(step);
            exp->tick();
        }
    }

    void enterWorld() {
        exp->startJourney();
        run(SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 100.0);
    }

    // Catch three targets of the open Catch game and let the result land
    void solveCatch() {
        auto* game = dynamic_cast<CatchGame*>(exp->miniGames().active());
        REQUIRE(game != nullptr);
        for (int i = 0; i < CatchGame::REQUIRED_CATCHES; ++i) {
            exp->pressMiniGame(i);
        }
        run(32.0);
    }

    int saves() const { return storage.saveCount() - savesBefore; }

    Context ctx;
    FakeTrack ambient;
    FakeTrack final;
    FakeTrack chime;
    AudioController audio{ambient, final, &chime};
    MemoryProgressStorage storage;
    RecordingPresenter presenter;
    std::unique_ptr<Experience> exp;
    int savesBefore = 0;
};

ProgressRecord allBut(const std::string& missing) {
    ProgressRecord r;
    for (const auto& id : defaultContent().objectIds()) {
        if (id != missing) {
            r.discoveredIds.push_back(id);
        }
    }
    return r;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("Fresh profile starts at the intro", "[integration][experience]") {
    Harness h;

    REQUIRE(h.exp->state().scene == Scene::Intro);
    REQUIRE(h.presenter.scenes.back() == Scene::Intro);
    REQUIRE(h.presenter.discovered == 0);
    REQUIRE(h.presenter.total == 9);
    REQUIRE_FALSE(h.presenter.finalButton);
    REQUIRE_FALSE(h.audio.isEnabled());

    SECTION("objects are ignored before entering the world") {
        REQUIRE(h.exp->tapObject("star") == TapResult::Ignored);
    }

    SECTION("start unlocks audio and moves to the world") {
        h.exp->startJourney();
        REQUIRE(h.audio.isEnabled());
        REQUIRE_FALSE(h.ambient.paused);
        REQUIRE(h.exp->scenes().isTransitioning());

        h.run(SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 100.0);
        REQUIRE(h.exp->state().scene == Scene::World);
        REQUIRE_FALSE(h.presenter.cover);
        REQUIRE_FALSE(h.exp->completionOpen());
    }

    SECTION("a refused first gesture can be retried") {
        h.ambient.refusePlay = true;
        h.exp->userGesture();
        REQUIRE_FALSE(h.exp->state().audioUnlocked);
        h.ambient.refusePlay = false;
        h.exp->userGesture();
        REQUIRE(h.exp->state().audioUnlocked);
    }
}

TEST_CASE("Discovering an object through its mini-game", "[integration][experience]") {
    Harness h;
    h.enterWorld();

    REQUIRE(h.exp->tapObject("star") == TapResult::MiniGameOpened);
    REQUIRE(h.presenter.miniGameVisible);
    REQUIRE(h.exp->tapObject("moon") == TapResult::Ignored);

    h.solveCatch();

    REQUIRE(h.exp->state().isDiscovered("star"));
    REQUIRE(h.exp->object("star").isDiscovered());
    REQUIRE_FALSE(h.presenter.miniGameVisible);
    REQUIRE(h.presenter.discovered == 1);
    REQUIRE(contains(h.presenter.glowing, "star"));
    REQUIRE(h.chime.playCalls == 1);

    std::string phrase = h.exp->ledger().phraseFor("star");
    REQUIRE_FALSE(phrase.empty());
    REQUIRE(h.presenter.messages.back() == phrase);
    REQUIRE(h.exp->messages().text() == phrase);

    REQUIRE(h.saves() >= 1);
    REQUIRE(contains(h.storage.record().discoveredIds, "star"));
    REQUIRE(h.storage.record().assignedPhrases.at("star") == phrase);

    SECTION("a second tap only acknowledges") {
        h.run(100.0);
        REQUIRE(h.exp->tapObject("star") == TapResult::AlreadyDiscovered);
        REQUIRE(h.presenter.messages.back() == h.exp->content().repeatNotice);
        REQUIRE_FALSE(h.exp->miniGames().isOpen());
        REQUIRE(h.exp->ledger().phraseFor("star") == phrase);
    }

    SECTION("the diary lists the phrase") {
        h.exp->openDiary();
        REQUIRE(h.presenter.diaryOpen);
        REQUIRE(h.presenter.diaryPage.text == phrase);
        REQUIRE(h.presenter.diaryPage.meta() == "Page 1 / 1");
        h.exp->closeDiary();
        REQUIRE_FALSE(h.presenter.diaryOpen);
    }
}

TEST_CASE("Leaving a mini-game early discovers nothing", "[integration][experience]") {
    Harness h;
    h.enterWorld();

    REQUIRE(h.exp->tapObject("letter") == TapResult::MiniGameOpened);
    REQUIRE(dynamic_cast<HoldGame*>(h.exp->miniGames().active()) != nullptr);

    SECTION("backdrop tap right after opening is ignored") {
        REQUIRE_FALSE(h.exp->dismissMiniGame());
        h.run(MiniGameManager::DISMISS_GUARD_MS + 20.0);
        REQUIRE(h.exp->dismissMiniGame());
    }

    SECTION("explicit close") {
        h.exp->closeMiniGame();
    }

    SECTION("releasing a hold early") {
        h.exp->pressMiniGame(-1);
        h.run(1000.0);
        h.exp->releaseMiniGame(-1);
        h.run(2000.0);
        REQUIRE(h.exp->miniGames().isOpen());
        h.exp->closeMiniGame();
    }

    h.run(50.0);
    REQUIRE_FALSE(h.exp->miniGames().isOpen());
    REQUIRE_FALSE(h.exp->state().isDiscovered("letter"));
    REQUIRE(h.presenter.discovered == 0);
}

TEST_CASE("Holding long enough discovers the letter", "[integration][experience]") {
    Harness h;
    h.enterWorld();

    h.exp->tapObject("letter");
    h.exp->pressMiniGame(-1);
    h.run(HoldGame::REQUIRED_MS + 100.0);

    REQUIRE(h.exp->state().isDiscovered("letter"));
    REQUIRE_FALSE(h.exp->miniGames().isOpen());
}

TEST_CASE("Completing the collection opens the prompt once", "[integration][experience]") {
    Harness h(allBut("star"));
    REQUIRE(h.presenter.discovered == 8);
    h.enterWorld();
    REQUIRE_FALSE(h.exp->completionOpen());

    h.exp->tapObject("star");
    h.solveCatch();

    REQUIRE(h.exp->state().isComplete());
    REQUIRE(h.exp->completionOpen());
    REQUIRE(h.presenter.completionOpened == 1);
    REQUIRE(h.presenter.finalButton);

    SECTION("objects stop reacting once complete") {
        REQUIRE(h.exp->tapObject("moon") == TapResult::Ignored);
    }

    SECTION("stay closes the prompt and the final button reopens it") {
        h.exp->dismissCompletion();
        REQUIRE_FALSE(h.presenter.completionPrompt);
        h.run(100.0);
        REQUIRE(h.presenter.completionOpened == 1);

        h.exp->requestFinale();
        REQUIRE(h.exp->completionOpen());
        REQUIRE(h.presenter.completionOpened == 2);
    }

    SECTION("go enters the finale") {
        h.exp->acceptFinale();
        REQUIRE_FALSE(h.exp->completionOpen());
        REQUIRE(h.exp->finaleEntering());
        REQUIRE(h.presenter.darkness);
        REQUIRE(h.storage.record().seenFinal);

        h.run(Experience::FINALE_DARK_MS - 50.0);
        REQUIRE_FALSE(h.exp->scenes().isTransitioning());

        h.run(100.0 + SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 100.0);
        REQUIRE(h.exp->state().scene == Scene::Final);
        REQUIRE_FALSE(h.exp->finaleEntering());
        REQUIRE(h.exp->finale().isActive());
        REQUIRE(h.presenter.finale.size() == 6);
        REQUIRE_FALSE(h.final.paused);

        h.run(FinaleTimeline::BASE_DELAY_MS + 100.0);
        REQUIRE_FALSE(h.presenter.revealed.empty());
        REQUIRE(h.presenter.revealed.front() == 0);

        h.run(FinaleTimeline::STEP_DELAY_MS * 6.0);
        REQUIRE(h.exp->finale().isFinished());
        REQUIRE(h.presenter.revealed.size() == 6);

        SECTION("closing returns to the world with ambient music") {
            h.exp->closeFinale();
            REQUIRE_FALSE(h.presenter.darkness);
            h.run(SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 100.0);
            REQUIRE(h.exp->state().scene == Scene::World);
            REQUIRE_FALSE(h.exp->finale().isActive());
            REQUIRE_FALSE(h.ambient.paused);
            REQUIRE(h.audio.state(Channel::Ambient) == ChannelState::FadingIn);
        }
    }
}

TEST_CASE("Leaving the finale retries audio the host refused", "[integration][experience]") {
    Harness h(allBut(""));
    h.ambient.refusePlay = true;
    h.final.refusePlay = true;

    h.enterWorld();
    REQUIRE(h.exp->state().scene == Scene::World);
    REQUIRE_FALSE(h.audio.isEnabled());
    REQUIRE(h.exp->completionOpen());

    h.exp->acceptFinale();
    h.run(Experience::FINALE_DARK_MS + SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 200.0);
    REQUIRE(h.exp->state().scene == Scene::Final);
    REQUIRE_FALSE(h.audio.isEnabled());
    REQUIRE_FALSE(h.exp->state().audioUnlocked);

    h.ambient.refusePlay = false;
    h.exp->closeFinale();
    h.run(SceneManager::COVER_HOLD_MS + SceneManager::SETTLE_MS + 100.0);

    REQUIRE(h.exp->state().scene == Scene::World);
    REQUIRE(h.audio.isEnabled());
    REQUIRE(h.exp->state().audioUnlocked);
    REQUIRE_FALSE(h.ambient.paused);
    REQUIRE(h.final.paused);
    REQUIRE(h.audio.state(Channel::Ambient) == ChannelState::FadingIn);
}

TEST_CASE("A completed profile prompts after entering the world", "[integration][experience]") {
    ProgressRecord full = allBut("");
    Harness h(full);
    REQUIRE(h.exp->state().isComplete());
    REQUIRE(h.exp->state().scene == Scene::Intro);
    REQUIRE(h.presenter.finalButton);
    REQUIRE_FALSE(h.exp->completionOpen());

    h.enterWorld();
    REQUIRE(h.exp->completionOpen());
    REQUIRE(h.presenter.completionOpened == 1);
}

TEST_CASE("Saved progress is restored and cleaned", "[integration][experience]") {
    ProgressRecord saved;
    saved.discoveredIds = {"moon", "ghost"};
    saved.unlockedOrder = {"ghost", "moon"};
    saved.assignedPhrases = {{"moon", "kept phrase"}};
    saved.volume = 0.5f;

    Harness h(saved);
    REQUIRE(h.exp->state().discoveredCount() == 1);
    REQUIRE(h.exp->object("moon").isDiscovered());
    REQUIRE(h.exp->ledger().phraseFor("moon") == "kept phrase");
    REQUIRE(h.exp->ledger().unlockedOrder() == std::vector<std::string>{"moon"});
    REQUIRE(h.audio.masterVolume() == 0.5f);
    REQUIRE(h.presenter.volume == 0.5f);
    REQUIRE_THROWS_AS(h.exp->object("ghost"), std::runtime_error);
}

TEST_CASE("Mute survives transitions and reloads", "[integration][experience]") {
    Harness h;
    h.enterWorld();
    REQUIRE_FALSE(h.ambient.paused);

    h.exp->toggleMute();
    REQUIRE(h.exp->state().audioMuted);
    REQUIRE(h.presenter.muted);
    REQUIRE(h.ambient.paused);
    REQUIRE(h.ambient.vol == 0.0f);
    REQUIRE(h.storage.record().muted);

    SECTION("watchdog stays quiet while muted") {
        h.run(5000.0);
        REQUIRE(h.ambient.paused);
    }

    SECTION("unmute fades back in") {
        h.exp->toggleMute();
        REQUIRE_FALSE(h.exp->state().audioMuted);
        REQUIRE_FALSE(h.ambient.paused);
        REQUIRE(h.audio.state(Channel::Ambient) == ChannelState::FadingIn);
        REQUIRE_FALSE(h.storage.record().muted);
    }

    SECTION("a muted profile reloads muted") {
        Harness again(h.storage.record());
        again.enterWorld();
        REQUIRE(again.exp->state().audioMuted);
        REQUIRE(again.ambient.playCalls == 0);
        REQUIRE(again.ambient.paused);
    }
}

TEST_CASE("Suspended audio is recovered", "[integration][experience]") {
    Harness h;
    h.enterWorld();
    h.run(2500.0);

    h.ambient.suspend();
    h.exp->hostResumed();
    REQUIRE_FALSE(h.ambient.paused);

    h.ambient.suspend();
    h.run(3000.0);
    REQUIRE_FALSE(h.ambient.paused);
}

TEST_CASE("Volume changes are persisted", "[integration][experience]") {
    Harness h;
    h.enterWorld();
    h.exp->setVolume(0.25f);
    REQUIRE(h.presenter.volume == 0.25f);
    REQUIRE(h.storage.record().volume == 0.25f);
}
