// Keepsake - Mini-Game Manager Implementation

#include <keepsake/minigame_manager.h>
#include <iostream>
#include <stdexcept>

namespace keepsake {

MiniGameManager::MiniGameManager(TaskQueue& tasks, Presenter& presenter, PlaySurface surface)
    : m_tasks(tasks)
    , m_presenter(presenter)
    , m_surface(surface)
{
}

MiniGameManager::~MiniGameManager() {
    if (m_active) {
        m_active->bindUi(nullptr);
        m_active->setSignals(nullptr, nullptr);
    }
}

Outcome MiniGameManager::open(std::unique_ptr<MiniGame> game, double now) {
    Deferred deferred(m_tasks);

    if (!game) {
        deferred.resolve(false);
        return deferred.outcome();
    }
    if (m_active) {
        std::cout << "[MiniGame] Closing '" << m_active->title() << "' to open '"
                  << game->title() << "'" << std::endl;
        finish(false);
    }

    m_active = std::move(game);
    m_pending = std::make_unique<Deferred>(deferred);
    m_openedAt = now;

    m_active->setSignals([this]() { finish(true); }, [this]() { finish(false); });
    m_active->bindUi(this);
    m_presenter.showMiniGame(m_active->title(), m_active->hint());

    try {
        m_active->mount(m_surface, now);
    } catch (const std::exception& e) {
        std::cerr << "[MiniGame] Mount failed for '" << m_active->title() << "': "
                  << e.what() << std::endl;
        finish(false);
    }

    return deferred.outcome();
}

void MiniGameManager::close() {
    if (m_active) {
        finish(false);
    }
}

bool MiniGameManager::dismiss(double now) {
    if (!m_active || now - m_openedAt < DISMISS_GUARD_MS) {
        return false;
    }
    finish(false);
    return true;
}

void MiniGameManager::press(int target, double now) {
    if (m_active) {
        m_active->press(target, now);
    }
}

void MiniGameManager::release(int target, double now) {
    if (m_active) {
        m_active->release(target, now);
    }
}

void MiniGameManager::update(double now) {
    m_retired.reset();
    if (m_active) {
        m_active->update(now);
    }
}

void MiniGameManager::setHint(const std::string& hint) {
    m_presenter.setMiniGameHint(hint);
}

void MiniGameManager::finish(bool completed) {
    if (!m_active) {
        return;
    }

    // Detach first so re-entrant signals from unmount() are no-ops
    std::unique_ptr<MiniGame> game = std::move(m_active);
    try {
        game->unmount();
    } catch (const std::exception& e) {
        std::cerr << "[MiniGame] Unmount failed for '" << game->title() << "': "
                  << e.what() << std::endl;
    }
    game->bindUi(nullptr);
    m_retired = std::move(game);

    m_presenter.hideMiniGame();

    auto pending = std::move(m_pending);
    if (pending) {
        pending->resolve(completed);
    }
}

} // namespace keepsake
