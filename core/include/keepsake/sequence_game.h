#pragma once

/**
 * @file sequence_game.h
 * @brief Memorize-then-repeat mini-game
 */

#include <keepsake/minigame.h>

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <random>
#include <vector>

namespace keepsake {

/**
 * @brief One light the player can tap
 */
struct SequenceNode {
    int position = 0;           ///< Index into SequenceGame::POSITIONS
    glm::vec2 point{0.0f};      ///< Surface coordinates, px
    bool lit = false;
    float scale = 1.0f;
};

/**
 * @brief Shows a short pattern of lights, then asks for it back
 *
 * Timeline after mount():
 * - LEAD_IN_MS of darkness
 * - each step lit for STEP_ON_MS followed by STEP_GAP_MS
 * - GRACE_MS before input is accepted
 *
 * A wrong tap quietly restarts the pattern; there is no failure state.
 * Taps closer than DEBOUNCE_MS to the previous one are dropped.
 */
class SequenceGame : public MiniGame {
public:
    static constexpr int POSITION_COUNT = 4;
    static constexpr int STEP_COUNT = 3;
    static constexpr double LEAD_IN_MS = 1300.0;
    static constexpr double STEP_ON_MS = 980.0;
    static constexpr double STEP_GAP_MS = 620.0;
    static constexpr double GRACE_MS = 1500.0;
    static constexpr double DEBOUNCE_MS = 240.0;
    static constexpr double FLASH_MS = 260.0;

    /// @brief Fixed layout, as fractions of the surface
    static const std::array<glm::vec2, POSITION_COUNT> POSITIONS;

    explicit SequenceGame(uint32_t seed = std::random_device{}());

    std::string title() const override { return "A small rhythm"; }
    std::string hint() const override { return "Touch the lights in the order they appear."; }

    void mount(const PlaySurface& surface, double now) override;
    void update(double now) override;
    void unmount() override;

    /// @param target Position index of the tapped light
    void press(int target, double now) override;

    const std::vector<int>& order() const { return m_order; }
    const std::vector<SequenceNode>& nodes() const { return m_nodes; }
    int progress() const { return m_progress; }
    bool isShowing() const { return m_showing; }
    bool isAcceptingInput(double now) const { return m_mounted && !m_showing && now >= m_readyAt; }

    /// @brief Time at which input opens (0 while the pattern is playing)
    double readyAt() const { return m_readyAt; }

private:
    std::mt19937 m_rng;
    std::vector<int> m_order;
    std::vector<SequenceNode> m_nodes;
    int m_progress = 0;
    bool m_showing = true;
    double m_phaseStart = 0.0;
    double m_readyAt = 0.0;
    std::map<int, double> m_flashUntil;
    double m_lastPress = 0.0;
    bool m_hasPressed = false;
};

} // namespace keepsake
