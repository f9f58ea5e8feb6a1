#pragma once

/**
 * @file minigame.h
 * @brief Interface shared by every mini-interaction that gates a discovery
 *
 * New variants implement MiniGame; nothing else in the engine branches on the
 * concrete type.
 */

#include <algorithm>
#include <functional>
#include <string>
#include <utility>

namespace keepsake {

/**
 * @brief Area a mini-game lays its targets out in
 */
struct PlaySurface {
    static constexpr float MIN_WIDTH = 320.0f;
    static constexpr float MIN_HEIGHT = 260.0f;

    float width = MIN_WIDTH;
    float height = MIN_HEIGHT;

    /// @brief Surface grown to the minimum playable size
    PlaySurface clamped() const {
        PlaySurface s;
        s.width = std::max(MIN_WIDTH, width);
        s.height = std::max(MIN_HEIGHT, height);
        return s;
    }
};

/**
 * @brief Hooks a mini-game may use to talk to its overlay
 */
class MiniGameUi {
public:
    virtual ~MiniGameUi() = default;
    virtual void setHint(const std::string& hint) = 0;
};

/**
 * @brief Abstract mini-interaction
 *
 * Lifecycle, driven by MiniGameManager:
 * 1. bindUi() - optional, before mount
 * 2. mount() - lay out targets, reset state
 * 3. update() / press() / release() - every frame and on input
 * 4. unmount() - stop reacting to input
 *
 * A game reports its result through complete() or cancel(). Only the first
 * report reaches the manager.
 */
class MiniGame {
public:
    using Signal = std::function<void()>;

    virtual ~MiniGame() = default;

    virtual std::string title() const = 0;
    virtual std::string hint() const = 0;

    virtual void bindUi(MiniGameUi* ui) { m_ui = ui; }

    virtual void mount(const PlaySurface& surface, double now) = 0;
    virtual void update(double now) = 0;
    virtual void unmount() = 0;

    /**
     * @brief Pointer down on a target
     * @param target Variant-specific target index (-1 for the whole area)
     */
    virtual void press(int target, double now) = 0;

    /// @brief Pointer released or left the target
    virtual void release(int target, double now) { (void)target; (void)now; }

    bool isMounted() const { return m_mounted; }

    /// @brief Installed by the manager before mount
    void setSignals(Signal onComplete, Signal onCancel) {
        m_onComplete = std::move(onComplete);
        m_onCancel = std::move(onCancel);
    }

protected:
    void complete() { if (m_onComplete) m_onComplete(); }
    void cancel() { if (m_onCancel) m_onCancel(); }

    void setHint(const std::string& hint) { if (m_ui) m_ui->setHint(hint); }

    bool m_mounted = false;

private:
    MiniGameUi* m_ui = nullptr;
    Signal m_onComplete;
    Signal m_onCancel;
};

} // namespace keepsake
