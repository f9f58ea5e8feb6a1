#pragma once

/**
 * @file finale.h
 * @brief Staged reveal of the closing paragraphs
 */

#include <cstddef>
#include <string>
#include <vector>

namespace keepsake {

/**
 * @brief Reveals segment i at baseDelay + i * stepDelay after start()
 *
 * Reveals are monotonic and at most one segment appears per update, so a long
 * stall catches up gradually instead of dumping the whole text at once.
 */
class FinaleTimeline {
public:
    static constexpr double BASE_DELAY_MS = 900.0;
    static constexpr double STEP_DELAY_MS = 2100.0;
    static constexpr double REDUCED_BASE_DELAY_MS = 500.0;
    static constexpr double REDUCED_STEP_DELAY_MS = 900.0;

    /// @brief Rebuild the timeline; nothing is revealed yet
    void start(std::vector<std::string> segments, double now, bool reducedMotion);

    /// @brief Drop the timeline (leaving the finale)
    void stop();

    /**
     * @brief Reveal the next segment if it is due
     * @return Index of the segment revealed this call, or -1
     */
    int update(double now);

    bool isActive() const { return m_active; }
    bool isFinished() const { return m_revealed >= m_segments.size(); }
    bool isRevealed(size_t index) const { return index < m_revealed; }
    size_t revealedCount() const { return m_revealed; }

    const std::vector<std::string>& segments() const { return m_segments; }
    double baseDelay() const { return m_baseDelay; }
    double stepDelay() const { return m_stepDelay; }

    /// @brief Time at which the given segment becomes due
    double dueTime(size_t index) const { return m_start + m_baseDelay + index * m_stepDelay; }

private:
    std::vector<std::string> m_segments;
    double m_start = 0.0;
    double m_baseDelay = BASE_DELAY_MS;
    double m_stepDelay = STEP_DELAY_MS;
    size_t m_revealed = 0;
    bool m_active = false;
};

} // namespace keepsake
