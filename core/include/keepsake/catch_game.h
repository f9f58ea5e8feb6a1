#pragma once

/**
 * @file catch_game.h
 * @brief Drifting-targets mini-game
 */

#include <keepsake/minigame.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <random>
#include <vector>

namespace keepsake {

struct CatchTarget {
    glm::vec2 position{0.0f};   ///< px
    glm::vec2 velocity{0.0f};   ///< px per second
    float phase = 0.0f;
    bool alive = true;
    float floatY = 0.0f;        ///< Visual bob, px
    float scale = 1.0f;
};

/**
 * @brief A few targets wander the surface; catching enough of them completes
 *
 * Motion is integrated from the real time step so the drift speed does not
 * depend on frame rate. Targets reflect off a margin at every edge.
 */
class CatchGame : public MiniGame {
public:
    static constexpr int TARGET_COUNT = 5;
    static constexpr int REQUIRED_CATCHES = 3;
    static constexpr float EDGE_MARGIN = 28.0f;
    static constexpr double MAX_STEP_MS = 50.0;

    explicit CatchGame(uint32_t seed = std::random_device{}());

    std::string title() const override { return "Butterflies"; }
    std::string hint() const override { return "Touch three butterflies, calmly."; }

    void mount(const PlaySurface& surface, double now) override;
    void update(double now) override;
    void unmount() override;

    /// @param target Index into targets()
    void press(int target, double now) override;

    const std::vector<CatchTarget>& targets() const { return m_targets; }
    int caught() const { return m_caught; }
    const PlaySurface& surface() const { return m_surface; }

private:
    float random01();

    std::mt19937 m_rng;
    std::vector<CatchTarget> m_targets;
    PlaySurface m_surface;
    int m_caught = 0;
    double m_lastUpdate = 0.0;
};

} // namespace keepsake
