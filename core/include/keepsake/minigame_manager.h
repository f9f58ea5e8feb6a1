#pragma once

/**
 * @file minigame_manager.h
 * @brief Opens, drives and closes the single active mini-game
 */

#include <keepsake/minigame.h>
#include <keepsake/presenter.h>
#include <keepsake/task_queue.h>

#include <memory>

namespace keepsake {

/**
 * @brief Owner of the active mini-game and its overlay
 *
 * The outcome returned by open() resolves exactly once: true when the game
 * completes, false when it is cancelled, dismissed or closed. A finished game
 * is unmounted immediately but destroyed on the next update(), so a game may
 * safely report its result from inside its own press() or update().
 */
class MiniGameManager : private MiniGameUi {
public:
    /// @brief Backdrop taps this soon after opening are ignored
    static constexpr double DISMISS_GUARD_MS = 280.0;

    MiniGameManager(TaskQueue& tasks, Presenter& presenter, PlaySurface surface = {});
    ~MiniGameManager() override;

    MiniGameManager(const MiniGameManager&) = delete;
    MiniGameManager& operator=(const MiniGameManager&) = delete;

    /**
     * @brief Mount a game and show its overlay
     * @return Outcome resolving to true on completion
     *
     * A game that is still open is cancelled first.
     */
    Outcome open(std::unique_ptr<MiniGame> game, double now);

    bool isOpen() const { return m_active != nullptr; }
    MiniGame* active() const { return m_active.get(); }

    /// @brief Explicit close control; resolves the outcome with false
    void close();

    /**
     * @brief Backdrop tap
     * @return true if the game was dismissed
     */
    bool dismiss(double now);

    void press(int target, double now);
    void release(int target, double now);

    void update(double now);

    void setSurface(const PlaySurface& surface) { m_surface = surface; }
    const PlaySurface& surface() const { return m_surface; }

private:
    void setHint(const std::string& hint) override;
    void finish(bool completed);

    TaskQueue& m_tasks;
    Presenter& m_presenter;
    PlaySurface m_surface;

    std::unique_ptr<MiniGame> m_active;
    std::unique_ptr<MiniGame> m_retired;
    std::unique_ptr<Deferred> m_pending;
    double m_openedAt = 0.0;
};

} // namespace keepsake
