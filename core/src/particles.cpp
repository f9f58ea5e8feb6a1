// Keepsake - Particle Field Implementation

#include <keepsake/particles.h>
#include <keepsake/easing.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace keepsake {

namespace {

constexpr float TWO_PI = 6.28318530718f;
constexpr double MAX_STEP_MS = 50.0;

// Violet / night blue / soft pink / white
const std::array<glm::vec4, 4> PALETTE = {{
    {231.0f / 255.0f, 181.0f / 255.0f, 1.0f, 0.65f},
    {170.0f / 255.0f, 195.0f / 255.0f, 1.0f, 0.55f},
    {1.0f, 188.0f / 255.0f, 214.0f / 255.0f, 0.50f},
    {1.0f, 1.0f, 1.0f, 0.32f},
}};

} // namespace

ParticleField::ParticleField(uint32_t seed)
    : m_rng(seed)
{
    refill();
}

float ParticleField::random01() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(m_rng);
}

void ParticleField::resize(float width, float height) {
    m_width = std::max(1.0f, width);
    m_height = std::max(1.0f, height);
    m_particles.clear();
    refill();
}

void ParticleField::setReducedMotion(bool reduced) {
    if (m_reducedMotion == reduced) {
        return;
    }
    m_reducedMotion = reduced;
    refill();
}

void ParticleField::refill() {
    size_t target = capacity();
    while (m_particles.size() < target) {
        m_particles.push_back(makeParticle(true));
    }
    if (m_particles.size() > target) {
        m_particles.resize(target);
    }
}

Particle ParticleField::makeParticle(bool anywhere) {
    Particle p;
    p.position.x = random01() * m_width;
    p.position.y = anywhere ? random01() * m_height : m_height + 20.0f + random01() * 60.0f;
    p.radius = 0.6f + random01() * 2.4f;
    p.speed = 2.2f + random01() * 6.8f;
    p.drift = (random01() - 0.5f) * 5.5f;
    p.twinkle = 0.35f + random01() * 0.65f;
    p.phase = random01() * TWO_PI;

    size_t ci = std::min(PALETTE.size() - 1, static_cast<size_t>(random01() * PALETTE.size()));
    p.color = PALETTE[ci];
    p.shape = random01() < 0.22f ? ParticleShape::Diamond : ParticleShape::Dot;
    return p;
}

void ParticleField::update(double now) {
    if (!m_enabled) {
        return;
    }
    if (!m_started) {
        m_started = true;
        m_last = now;
    }
    float dt = static_cast<float>(std::min(MAX_STEP_MS, std::max(0.0, now - m_last)) / 1000.0);
    m_last = now;

    for (auto& p : m_particles) {
        p.position.y -= p.speed * dt;
        p.position.x += p.drift * dt * 0.6f;

        if (p.position.y < -30.0f) {
            p = makeParticle(false);
            ++m_recycled;
            continue;
        }
        if (p.position.x < -40.0f) p.position.x = m_width + 40.0f;
        if (p.position.x > m_width + 40.0f) p.position.x = -40.0f;

        float pulse = 0.55f;
        if (!m_reducedMotion) {
            pulse += 0.45f * std::sin(static_cast<float>(now / 900.0) + p.phase);
        }
        p.color.a = clamp01(0.12f + 0.42f * pulse * p.twinkle);
    }
}

} // namespace keepsake
