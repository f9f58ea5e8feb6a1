#pragma once

/**
 * @file particles.h
 * @brief Decorative background particle field
 *
 * Stars and soft petals rising slowly through the scene. The field is purely
 * visual: nothing in the game logic reads it, and it keeps no persistent state.
 */

#include <glm/glm.hpp>

#include <cstdint>
#include <random>
#include <vector>

namespace keepsake {

enum class ParticleShape {
    Dot,
    Diamond
};

/**
 * @brief One rising particle
 */
struct Particle {
    glm::vec2 position{0.0f};
    float radius = 1.0f;
    float speed = 4.0f;         ///< Rise speed, px/s
    float drift = 0.0f;         ///< Horizontal drift, px/s
    float twinkle = 1.0f;       ///< Pulse depth in [0.35, 1]
    float phase = 0.0f;         ///< Pulse phase offset, radians
    glm::vec4 color{1.0f};      ///< RGBA, alpha is recomputed every update
    ParticleShape shape = ParticleShape::Dot;
};

/**
 * @brief Fixed-size pool of particles recycled from the bottom edge
 *
 * @par Example
 * @code
 * ParticleField field;
 * field.resize(1280.0f, 720.0f);
 * // every frame
 * field.update(ctx.time());
 * for (const auto& p : field.particles()) draw(p);
 * @endcode
 */
class ParticleField {
public:
    static constexpr size_t FULL_COUNT = 90;
    static constexpr size_t REDUCED_COUNT = 40;

    explicit ParticleField(uint32_t seed = std::random_device{}());

    /// @brief Set the surface size and reseed the pool to its capacity
    void resize(float width, float height);

    /// @brief Cap the pool and freeze the twinkle when motion should be reduced
    void setReducedMotion(bool reduced);
    bool reducedMotion() const { return m_reducedMotion; }

    /// @brief Disable updates entirely (no drawing surface)
    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Advance every particle
     * @param now Frame time in ms; the step is capped at 50 ms
     */
    void update(double now);

    const std::vector<Particle>& particles() const { return m_particles; }
    size_t capacity() const { return m_reducedMotion ? REDUCED_COUNT : FULL_COUNT; }
    float width() const { return m_width; }
    float height() const { return m_height; }

    /// @brief Particles respawned since construction
    uint64_t recycled() const { return m_recycled; }

private:
    void refill();
    Particle makeParticle(bool anywhere);
    float random01();

    std::mt19937 m_rng;
    std::vector<Particle> m_particles;
    float m_width = 1.0f;
    float m_height = 1.0f;
    bool m_reducedMotion = false;
    bool m_enabled = true;
    double m_last = 0.0;
    bool m_started = false;
    uint64_t m_recycled = 0;
};

} // namespace keepsake
