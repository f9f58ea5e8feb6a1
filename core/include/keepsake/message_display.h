#pragma once

/**
 * @file message_display.h
 * @brief Non-modal message box that fades in, holds, and fades out
 */

#include <string>

namespace keepsake {

enum class MessagePhase {
    Idle,
    In,
    Hold,
    Out
};

/**
 * @brief Timed message box
 *
 * show() always restarts from the fade-in, replacing any message on screen.
 * The box never blocks input.
 */
class MessageDisplay {
public:
    static constexpr double FADE_IN_MS = 520.0;
    static constexpr double DEFAULT_HOLD_MS = 2400.0;
    static constexpr double FADE_OUT_MS = 900.0;
    static constexpr float HIDDEN_OFFSET = 10.0f;

    void show(const std::string& text, double now, double holdMs = DEFAULT_HOLD_MS);
    void update(double now);

    MessagePhase phase() const { return m_phase; }
    bool isVisible() const { return m_phase != MessagePhase::Idle; }
    const std::string& text() const { return m_text; }

    float opacity() const { return m_opacity; }

    /// @brief Vertical offset in px (10 when hidden, 0 when fully shown)
    float offsetY() const { return m_offsetY; }

private:
    MessagePhase m_phase = MessagePhase::Idle;
    double m_phaseStart = 0.0;
    double m_holdMs = DEFAULT_HOLD_MS;
    std::string m_text;
    float m_opacity = 0.0f;
    float m_offsetY = HIDDEN_OFFSET;
};

} // namespace keepsake
