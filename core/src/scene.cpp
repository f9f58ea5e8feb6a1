// Keepsake - Scene Manager Implementation

#include <keepsake/scene.h>
#include <iostream>

namespace keepsake {

SceneManager::SceneManager(SessionState& state, Presenter& presenter, TaskQueue& tasks)
    : m_state(state)
    , m_presenter(presenter)
    , m_tasks(tasks)
{
}

void SceneManager::show(Scene scene) {
    m_state.scene = scene;
    m_presenter.showScene(scene);
}

Outcome SceneManager::transitionTo(Scene target, double now) {
    Deferred deferred(m_tasks);

    if (isTransitioning()) {
        std::cerr << "[Scene] Transition to " << sceneName(target)
                  << " refused: already moving to " << sceneName(m_target) << std::endl;
        deferred.resolve(false);
        return deferred.outcome();
    }

    std::cout << "[Scene] " << sceneName(m_state.scene) << " -> " << sceneName(target) << std::endl;

    m_target = target;
    m_phase = TransitionPhase::Covering;
    m_phaseStart = now;
    m_pending = std::make_unique<Deferred>(deferred);
    setCover(true);
    return deferred.outcome();
}

void SceneManager::update(double now) {
    switch (m_phase) {
        case TransitionPhase::Idle:
            return;

        case TransitionPhase::Covering:
            if (now - m_phaseStart >= COVER_HOLD_MS) {
                show(m_target);
                m_phase = TransitionPhase::Settling;
                m_phaseStart = now;
            }
            return;

        case TransitionPhase::Settling:
            if (now - m_phaseStart >= SETTLE_MS) {
                setCover(false);
                m_phase = TransitionPhase::Idle;
                auto pending = std::move(m_pending);
                if (pending) {
                    pending->resolve(true);
                }
            }
            return;
    }
}

void SceneManager::setDarkness(bool on) {
    m_darkness = on;
    m_presenter.setDarkness(on);
}

void SceneManager::setCover(bool on) {
    m_cover = on;
    m_presenter.setCover(on);
}

} // namespace keepsake
