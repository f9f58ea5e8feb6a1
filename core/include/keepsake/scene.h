#pragma once

/**
 * @file scene.h
 * @brief Intro / World / Final scene switching with cover and darkness overlays
 */

#include <keepsake/presenter.h>
#include <keepsake/session_state.h>
#include <keepsake/task_queue.h>

#include <memory>

namespace keepsake {

enum class TransitionPhase {
    Idle,       ///< No transition running
    Covering,   ///< Cover is on, old scene still visible
    Settling    ///< New scene visible under the cover
};

/**
 * @brief The only writer of SessionState::scene
 *
 * transitionTo() is a resumable state machine driven by update(): cover on,
 * hold, swap the visible scene, short settle, cover off, resolve. Starting a
 * second transition before the first resolves is a caller error; it is
 * refused and the returned outcome resolves to false.
 */
class SceneManager {
public:
    static constexpr double COVER_HOLD_MS = 1150.0;
    static constexpr double SETTLE_MS = 140.0;

    SceneManager(SessionState& state, Presenter& presenter, TaskQueue& tasks);

    /// @brief Swap the visible scene immediately (startup only)
    void show(Scene scene);

    /**
     * @brief Start a covered transition
     * @return Outcome resolving to true once the cover is removed
     */
    Outcome transitionTo(Scene target, double now);

    void update(double now);

    void setDarkness(bool on);
    bool darkness() const { return m_darkness; }

    bool isTransitioning() const { return m_phase != TransitionPhase::Idle; }
    TransitionPhase phase() const { return m_phase; }
    bool coverOn() const { return m_cover; }
    Scene current() const { return m_state.scene; }

private:
    void setCover(bool on);

    SessionState& m_state;
    Presenter& m_presenter;
    TaskQueue& m_tasks;

    TransitionPhase m_phase = TransitionPhase::Idle;
    Scene m_target = Scene::Intro;
    double m_phaseStart = 0.0;
    std::unique_ptr<Deferred> m_pending;

    bool m_cover = false;
    bool m_darkness = false;
};

} // namespace keepsake
