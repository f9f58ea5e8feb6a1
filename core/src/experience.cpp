// Keepsake - Experience Orchestrator Implementation

#include <keepsake/experience.h>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace keepsake {

const char* tapResultName(TapResult r) {
    switch (r) {
        case TapResult::Ignored: return "ignored";
        case TapResult::MiniGameOpened: return "minigame";
        case TapResult::AlreadyDiscovered: return "already-discovered";
    }
    return "unknown";
}

Experience::Experience(Context& ctx, Content content, AudioController& audio,
                       ProgressStorage& storage, Presenter& presenter, ExperienceOptions options)
    : m_ctx(ctx)
    , m_content(std::move(content))
    , m_audio(audio)
    , m_storage(storage)
    , m_presenter(presenter)
    , m_options(options)
    , m_state(m_content.objects.size())
    , m_ledger(m_state, m_content.phrases, options.seed ^ 0x5eedu)
    , m_particles(options.seed)
    , m_scenes(m_state, presenter, ctx.tasks())
    , m_miniGames(ctx.tasks(), presenter, options.surface)
    , m_player(audio)
    , m_rng(options.seed)
{
    for (const auto& spec : m_content.objects) {
        m_objects.emplace_back(spec.id, spec.idleSeed);
    }
    m_diary.setEmptyText(m_content.emptyDiary);

    m_particles.setReducedMotion(m_ctx.reducedMotion());
    m_particles.resize(m_options.viewportWidth, m_options.viewportHeight);

    restore();
    registerStages();

    // Progress survives a reload; the scene never does
    m_scenes.setDarkness(false);
    m_scenes.show(Scene::Intro);

    m_presenter.setMuted(m_state.audioMuted);
    m_presenter.setVolume(m_audio.masterVolume());
    for (const auto& obj : m_objects) {
        if (obj.isDiscovered()) {
            m_presenter.setObjectDiscovered(obj.id());
        }
    }
    refreshProgress();
    refreshDiary();
    refreshFinalButton();
    refreshPlayer();
}

// -----------------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------------

void Experience::registerStages() {
    m_scheduler.addStage("tasks", [](Context& ctx) {
        ctx.tasks().drain();
    });

    m_scheduler.addStage("timers", [this](Context& ctx) {
        m_timers.update(ctx.time());
    });

    m_scheduler.addStage("particles", [this](Context& ctx) {
        m_particles.setReducedMotion(ctx.reducedMotion());
        m_particles.update(ctx.time());
    });

    m_scheduler.addStage("objects", [this](Context& ctx) {
        for (auto& obj : m_objects) {
            obj.update(ctx.time(), ctx.reducedMotion());
        }
    }, [this] { return m_state.scene == Scene::World; });

    m_scheduler.addStage("messages", [this](Context& ctx) {
        m_messages.update(ctx.time());
    });

    m_scheduler.addStage("audio", [this](Context& ctx) {
        m_audio.update(ctx.time());
    }, [this] { return m_audio.needsUpdate(); });

    m_scheduler.addStage("watchdog", [this](Context& ctx) {
        m_audio.watchdog(ctx.time());
    }, [this] { return m_state.audioUnlocked && !m_state.audioMuted; });

    m_scheduler.addStage("minigames", [this](Context& ctx) {
        m_miniGames.update(ctx.time());
    });

    m_scheduler.addStage("scenes", [this](Context& ctx) {
        m_scenes.update(ctx.time());
    });

    m_scheduler.addStage("finale", [this](Context& ctx) {
        int revealed = m_finale.update(ctx.time());
        if (revealed >= 0) {
            m_presenter.revealFinaleSegment(static_cast<size_t>(revealed));
        }
    }, [this] { return m_state.scene == Scene::Final && m_finale.isActive(); });

    m_scheduler.addStage("diary", [this](Context& ctx) {
        if (m_diary.update(ctx.time())) {
            m_presenter.setDiaryPage(m_diary.page());
        }
    });

    m_scheduler.addStage("player", [this](Context&) {
        refreshPlayer();
    }, [this] { return m_state.scene == Scene::Final; });
}

void Experience::tick() {
    m_scheduler.tick(m_ctx);
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------

void Experience::restore() {
    ProgressRecord saved = m_storage.load();

    // Ids from another catalogue would skew completion
    std::vector<std::string> known;
    for (const auto& id : saved.discoveredIds) {
        if (m_content.find(id)) {
            known.push_back(id);
        } else {
            std::cerr << "[Experience] Ignoring saved discovery of unknown object '" << id << "'"
                      << std::endl;
        }
    }
    saved.discoveredIds = std::move(known);

    std::vector<std::string> order;
    for (const auto& id : saved.unlockedOrder) {
        if (m_content.find(id)) {
            order.push_back(id);
        }
    }
    saved.unlockedOrder = std::move(order);

    m_state.audioMuted = saved.muted;
    m_audio.setMuted(saved.muted);
    m_audio.setMasterVolume(saved.volume);

    m_ledger.restore(saved, m_content.objectIds());

    for (auto& obj : m_objects) {
        if (m_state.isDiscovered(obj.id())) {
            obj.markDiscovered();
        }
    }

    std::cout << "[Experience] Restored " << m_state.discoveredCount() << " of "
              << m_state.totalObjects << " discoveries" << std::endl;
}

ProgressRecord Experience::record() const {
    ProgressRecord r;
    m_ledger.fill(r);
    r.muted = m_state.audioMuted;
    r.volume = m_audio.masterVolume();
    return r;
}

bool Experience::persist() {
    if (!m_storage.save(record())) {
        std::cerr << "[Experience] Progress was not saved" << std::endl;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------------

bool Experience::unlockAudio() {
    m_gestureSeen = true;
    bool ok = m_audio.unlock(sceneChannel(), m_ctx.time());
    m_state.audioUnlocked = ok;
    return ok;
}

void Experience::userGesture() {
    if (!m_state.audioUnlocked) {
        unlockAudio();
    }
}

void Experience::startJourney() {
    unlockAudio();

    if (m_state.scene != Scene::Intro || m_scenes.isTransitioning()) {
        return;
    }

    m_scenes.transitionTo(Scene::World, m_ctx.time()).then([this](bool ok) {
        if (ok && m_state.isComplete()) {
            openCompletion();
        }
    });
}

TapResult Experience::tapObject(const std::string& id) {
    if (m_state.scene == Scene::World) {
        userGesture();
    }

    if (m_state.scene != Scene::World || m_scenes.isTransitioning()) return TapResult::Ignored;
    if (m_state.isComplete()) return TapResult::Ignored;
    if (m_diary.isOpen() || m_miniGames.isOpen()) return TapResult::Ignored;
    if (m_completionOpen || m_finaleEntering) return TapResult::Ignored;

    InteractiveObject* obj = findObject(id);
    if (!obj) {
        std::cerr << "[Experience] Tap on unknown object '" << id << "'" << std::endl;
        return TapResult::Ignored;
    }

    const double now = m_ctx.time();
    obj->playTapAnimation(now);

    if (obj->isDiscovered()) {
        showMessage(m_content.repeatNotice, REPEAT_HOLD_MS);
        return TapResult::AlreadyDiscovered;
    }

    MiniGameKind kind = miniGameFor(id);
    std::cout << "[Experience] '" << id << "' opens " << miniGameKindName(kind) << std::endl;

    Outcome outcome = m_miniGames.open(makeMiniGame(kind, m_rng()), now);
    outcome.then([this, id](bool completed) {
        if (completed) {
            completeDiscovery(id);
        }
    });
    return TapResult::MiniGameOpened;
}

void Experience::completeDiscovery(const std::string& id) {
    UnlockResult result = m_ledger.unlock(id);
    if (!result.newlyUnlocked) {
        return;
    }

    InteractiveObject* obj = findObject(id);
    if (obj) {
        obj->markDiscovered();
    }
    m_presenter.setObjectDiscovered(id);

    persist();
    m_audio.playChime();

    showMessage(result.phrase, UNLOCK_HOLD_MS);
    refreshProgress();
    refreshDiary();
    refreshFinalButton();

    std::cout << "[Experience] Unlocked '" << id << "' (" << m_state.discoveredCount() << "/"
              << m_state.totalObjects << ")" << std::endl;

    if (result.crossedCompletion) {
        openCompletion();
    }
}

void Experience::pressMiniGame(int target) {
    m_miniGames.press(target, m_ctx.time());
}

void Experience::releaseMiniGame(int target) {
    m_miniGames.release(target, m_ctx.time());
}

void Experience::closeMiniGame() {
    m_miniGames.close();
}

bool Experience::dismissMiniGame() {
    return m_miniGames.dismiss(m_ctx.time());
}

void Experience::toggleMute() {
    if (!m_state.audioUnlocked) {
        unlockAudio();
    }

    m_state.audioMuted = !m_state.audioMuted;
    m_audio.setMuted(m_state.audioMuted);
    m_presenter.setMuted(m_state.audioMuted);
    persist();

    if (m_state.audioMuted) {
        return;
    }

    if (!m_audio.isEnabled()) {
        unlockAudio();
    } else {
        m_audio.resume(sceneChannel(), m_ctx.time());
    }
}

void Experience::setVolume(float volume) {
    m_audio.setMasterVolume(volume);
    m_presenter.setVolume(m_audio.masterVolume());
    persist();
}

void Experience::openDiary() {
    if (m_miniGames.isOpen()) {
        return;
    }
    userGesture();

    refreshDiary();
    m_diary.open();
    m_presenter.setDiaryOpen(true);
    m_presenter.setDiaryPage(m_diary.page());
}

void Experience::closeDiary() {
    if (!m_diary.isOpen()) {
        return;
    }
    m_diary.close();
    m_presenter.setDiaryOpen(false);
}

void Experience::diaryPrev() {
    if (m_diary.isOpen() && m_diary.prev(m_ctx.time())) {
        m_presenter.setDiaryPage(m_diary.page());
    }
}

void Experience::diaryNext() {
    if (m_diary.isOpen() && m_diary.next(m_ctx.time())) {
        m_presenter.setDiaryPage(m_diary.page());
    }
}

void Experience::requestFinale() {
    if (m_state.scene != Scene::World || !m_state.isComplete()) {
        return;
    }
    openCompletion();
}

void Experience::acceptFinale() {
    if (!m_completionOpen) {
        return;
    }
    userGesture();

    m_ledger.markSeenFinal();
    persist();
    closeCompletion();
    beginFinale();
}

void Experience::dismissCompletion() {
    closeCompletion();
}

void Experience::closeFinale() {
    if (m_state.scene != Scene::Final || m_scenes.isTransitioning()) {
        return;
    }

    m_scenes.setDarkness(false);
    m_scenes.transitionTo(Scene::World, m_ctx.time()).then([this](bool ok) {
        if (!ok) {
            return;
        }
        m_finale.stop();
        refreshPlayer();

        if (m_state.audioMuted) {
            return;
        }
        if (!m_audio.isEnabled()) {
            // The host refused every earlier attempt; retry now on ambient
            if (m_gestureSeen) {
                unlockAudio();
            }
        } else {
            m_audio.switchTo(Channel::Ambient, m_ctx.time());
        }
    });
}

void Experience::togglePlayer() {
    userGesture();
    if (m_state.audioMuted) {
        return;
    }
    m_player.toggle(m_state.scene);
    refreshPlayer();
}

void Experience::previewSeek(float fraction) {
    m_player.beginSeek(fraction);
    refreshPlayer();
}

void Experience::seekPlayer(float fraction) {
    m_player.beginSeek(fraction);
    m_player.commitSeek(m_state.scene);
    refreshPlayer();
}

void Experience::hostResumed() {
    if (!m_state.audioUnlocked || m_state.audioMuted) {
        return;
    }
    m_audio.ensurePlayback();
}

// -----------------------------------------------------------------------------
// Completion and finale
// -----------------------------------------------------------------------------

void Experience::openCompletion() {
    if (m_completionOpen) {
        return;
    }
    m_completionOpen = true;
    m_presenter.setCompletionPrompt(true);
}

void Experience::closeCompletion() {
    if (!m_completionOpen) {
        return;
    }
    m_completionOpen = false;
    m_presenter.setCompletionPrompt(false);
}

void Experience::beginFinale() {
    if (m_finaleEntering || m_state.scene == Scene::Final) {
        return;
    }
    m_finaleEntering = true;

    m_scenes.setDarkness(true);
    m_timers.after(m_ctx.time(), FINALE_DARK_MS, [this]() {
        m_scenes.transitionTo(Scene::Final, m_ctx.time()).then([this](bool ok) {
            m_finaleEntering = false;
            if (ok) {
                enterFinale();
            }
        });
    });
}

void Experience::enterFinale() {
    const double now = m_ctx.time();

    if (!m_audio.isEnabled()) {
        m_gestureSeen = true;
        m_state.audioUnlocked = m_audio.unlock(Channel::Final, now);
    } else {
        m_audio.switchTo(Channel::Final, now);
    }

    m_finale.start(m_content.finale, now, m_ctx.reducedMotion());
    m_presenter.setFinaleText(m_content.finale);

    refreshPlayer();
    refreshFinalButton();
}

// -----------------------------------------------------------------------------
// Read-outs
// -----------------------------------------------------------------------------

void Experience::showMessage(const std::string& text, double holdMs) {
    m_messages.show(text, m_ctx.time(), holdMs);
    m_presenter.showMessage(text);
}

void Experience::refreshProgress() {
    m_presenter.setProgress(m_state.discoveredCount(), m_state.totalObjects);
}

void Experience::refreshDiary() {
    m_diary.setPhrases(m_ledger.history());
    if (m_diary.isOpen()) {
        m_presenter.setDiaryPage(m_diary.page());
    }
}

void Experience::refreshFinalButton() {
    m_presenter.setFinalButton(m_state.isComplete());
}

void Experience::refreshPlayer() {
    m_presenter.setPlayer(m_player.readout(m_state.scene));
}

InteractiveObject* Experience::findObject(const std::string& id) {
    for (auto& obj : m_objects) {
        if (obj.id() == id) {
            return &obj;
        }
    }
    return nullptr;
}

const InteractiveObject& Experience::object(const std::string& id) const {
    for (const auto& obj : m_objects) {
        if (obj.id() == id) {
            return obj;
        }
    }
    throw std::runtime_error("Unknown object: " + id);
}

} // namespace keepsake
