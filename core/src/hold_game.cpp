// Keepsake - Hold Mini-Game Implementation

#include <keepsake/hold_game.h>
#include <keepsake/easing.h>
#include <cmath>

namespace keepsake {

void HoldGame::mount(const PlaySurface& surface, double now) {
    (void)surface;
    (void)now;
    m_mounted = true;
    m_holding = false;
    m_holdStart = 0.0;
    m_progress = 0.0f;
}

void HoldGame::unmount() {
    m_mounted = false;
    m_holding = false;
}

void HoldGame::press(int target, double now) {
    (void)target;
    if (!m_mounted) {
        return;
    }
    m_holding = true;
    m_holdStart = now;
}

void HoldGame::release(int target, double now) {
    (void)target;
    (void)now;
    m_holding = false;
    m_progress = 0.0f;
}

void HoldGame::update(double now) {
    if (!m_mounted) {
        return;
    }

    m_progress = 0.0f;
    if (m_holding) {
        m_progress = static_cast<float>(clamp01((now - m_holdStart) / REQUIRED_MS));
        if (m_progress >= 1.0f) {
            complete();
            return;
        }
    }

    m_breathe = 1.0f + std::sin(static_cast<float>(now / 1100.0)) * 0.012f;
}

} // namespace keepsake
