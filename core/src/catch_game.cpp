// Keepsake - Catch Mini-Game Implementation

#include <keepsake/catch_game.h>
#include <algorithm>
#include <cmath>

namespace keepsake {

namespace {
constexpr float TWO_PI = 6.28318530718f;
constexpr double FRAME_MS = 1000.0 / 60.0;
constexpr float WANDER = 0.10f;
}

CatchGame::CatchGame(uint32_t seed)
    : m_rng(seed)
{
}

float CatchGame::random01() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(m_rng);
}

void CatchGame::mount(const PlaySurface& surface, double now) {
    m_surface = surface.clamped();
    m_targets.clear();
    m_caught = 0;
    m_lastUpdate = now;

    for (int i = 0; i < TARGET_COUNT; ++i) {
        CatchTarget t;
        t.position.x = random01() * (m_surface.width - 80.0f) + 40.0f;
        t.position.y = random01() * (m_surface.height - 80.0f) + 40.0f;
        t.velocity.x = (random01() - 0.5f) * 14.0f;
        t.velocity.y = (random01() - 0.5f) * 14.0f;
        t.phase = random01() * TWO_PI;
        m_targets.push_back(t);
    }

    m_mounted = true;
    setHint(hint());
}

void CatchGame::unmount() {
    m_mounted = false;
}

void CatchGame::press(int target, double now) {
    (void)now;
    if (!m_mounted || target < 0 || target >= static_cast<int>(m_targets.size())) {
        return;
    }

    CatchTarget& t = m_targets[static_cast<size_t>(target)];
    if (!t.alive) {
        return;
    }
    t.alive = false;
    ++m_caught;

    if (m_caught >= REQUIRED_CATCHES) {
        complete();
    }
}

void CatchGame::update(double now) {
    if (!m_mounted) {
        return;
    }

    double stepMs = std::min(std::max(now - m_lastUpdate, 0.0), MAX_STEP_MS);
    m_lastUpdate = now;
    // Wander is tuned per 60 fps frame
    float frames = static_cast<float>(stepMs / FRAME_MS);
    float dt = frames / 60.0f;

    const float minX = EDGE_MARGIN;
    const float maxX = m_surface.width - EDGE_MARGIN;
    const float minY = EDGE_MARGIN;
    const float maxY = m_surface.height - EDGE_MARGIN;

    for (auto& t : m_targets) {
        if (!t.alive) {
            continue;
        }

        t.position += t.velocity * dt;
        t.position.x += std::sin(static_cast<float>(now / 1400.0) + t.phase) * WANDER * frames;
        t.position.y += std::cos(static_cast<float>(now / 1600.0) + t.phase) * WANDER * frames;

        if (t.position.x < minX) {
            t.position.x = minX;
            t.velocity.x = std::abs(t.velocity.x);
        } else if (t.position.x > maxX) {
            t.position.x = maxX;
            t.velocity.x = -std::abs(t.velocity.x);
        }
        if (t.position.y < minY) {
            t.position.y = minY;
            t.velocity.y = std::abs(t.velocity.y);
        } else if (t.position.y > maxY) {
            t.position.y = maxY;
            t.velocity.y = -std::abs(t.velocity.y);
        }

        t.floatY = std::sin(static_cast<float>(now / 980.0) + t.phase) * 2.0f;
        t.scale = 1.0f + std::sin(static_cast<float>(now / 1200.0) + t.phase) * 0.02f;
    }
}

} // namespace keepsake
