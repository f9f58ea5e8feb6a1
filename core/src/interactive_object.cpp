// Keepsake - Interactive Object Implementation

#include <keepsake/interactive_object.h>
#include <keepsake/easing.h>
#include <cmath>
#include <utility>

namespace keepsake {

namespace {
constexpr float PI = 3.14159265359f;
}

InteractiveObject::InteractiveObject(std::string id, float idleSeed)
    : m_id(std::move(id))
    , m_idleSeed(idleSeed)
{
}

void InteractiveObject::playTapAnimation(double now) {
    m_tapActive = true;
    m_tapStart = now;
}

void InteractiveObject::update(double now, bool reducedMotion) {
    const float s = m_idleSeed;
    const float t = static_cast<float>(now);

    IdlePose pose;
    if (!reducedMotion) {
        pose.offsetY = std::sin(t / 1900.0f + s) * 4.2f;
        pose.rotation = std::sin(t / 2400.0f + s * 2.1f) * 1.4f;
        pose.scale = 1.0f + std::sin(t / 2800.0f + s * 3.2f) * 0.016f;
    }

    float tapScale = 1.0f;
    if (m_tapActive) {
        float p = static_cast<float>(clamp01((now - m_tapStart) / TAP_ANIM_MS));
        tapScale = 1.0f + std::sin(easeInOut(p) * PI) * 0.05f;
        if (p >= 1.0f) {
            m_tapActive = false;
        }
    }
    pose.scale *= tapScale;

    // Discovered objects glow a little brighter
    float glow = m_discovered ? 1.0f : 0.55f;
    pose.opacity = 0.92f + 0.08f * glow;

    m_pose = pose;
}

} // namespace keepsake
