// Keepsake - Message Display Implementation

#include <keepsake/message_display.h>
#include <keepsake/easing.h>

namespace keepsake {

void MessageDisplay::show(const std::string& text, double now, double holdMs) {
    m_text = text;
    m_holdMs = holdMs;
    m_phase = MessagePhase::In;
    m_phaseStart = now;
}

void MessageDisplay::update(double now) {
    const double t = now - m_phaseStart;

    switch (m_phase) {
        case MessagePhase::Idle:
            return;

        case MessagePhase::In: {
            float p = static_cast<float>(clamp01(t / FADE_IN_MS));
            float e = easeInOut(p);
            m_opacity = e;
            m_offsetY = lerp(HIDDEN_OFFSET, 0.0f, e);
            if (p >= 1.0f) {
                m_phase = MessagePhase::Hold;
                m_phaseStart = now;
            }
            return;
        }

        case MessagePhase::Hold:
            m_opacity = 1.0f;
            m_offsetY = 0.0f;
            if (t >= m_holdMs) {
                m_phase = MessagePhase::Out;
                m_phaseStart = now;
            }
            return;

        case MessagePhase::Out: {
            float p = static_cast<float>(clamp01(t / FADE_OUT_MS));
            float e = easeInOut(p);
            m_opacity = lerp(1.0f, 0.0f, e);
            m_offsetY = lerp(0.0f, HIDDEN_OFFSET, e);
            if (p >= 1.0f) {
                m_phase = MessagePhase::Idle;
                m_opacity = 0.0f;
                m_offsetY = HIDDEN_OFFSET;
            }
            return;
        }
    }
}

} // namespace keepsake
