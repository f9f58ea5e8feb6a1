#pragma once

/**
 * @file hold_game.h
 * @brief Press-and-hold mini-game
 */

#include <keepsake/minigame.h>

namespace keepsake {

/**
 * @brief Completes once a single continuous press lasts long enough
 *
 * Releasing early drops progress back to zero.
 */
class HoldGame : public MiniGame {
public:
    static constexpr double REQUIRED_MS = 2100.0;

    std::string title() const override { return "A second"; }
    std::string hint() const override { return "Press and hold. Let go whenever you like."; }

    void mount(const PlaySurface& surface, double now) override;
    void update(double now) override;
    void unmount() override;
    void press(int target, double now) override;
    void release(int target, double now) override;

    bool isHolding() const { return m_holding; }

    /// @brief Hold progress in [0, 1], refreshed every update
    float progress() const { return m_progress; }

    /// @brief Gentle breathing scale of the orb
    float breathe() const { return m_breathe; }

private:
    bool m_holding = false;
    double m_holdStart = 0.0;
    float m_progress = 0.0f;
    float m_breathe = 1.0f;
};

} // namespace keepsake
