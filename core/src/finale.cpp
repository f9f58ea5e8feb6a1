// Keepsake - Finale Timeline Implementation

#include <keepsake/finale.h>
#include <utility>

namespace keepsake {

void FinaleTimeline::start(std::vector<std::string> segments, double now, bool reducedMotion) {
    m_segments = std::move(segments);
    m_start = now;
    m_baseDelay = reducedMotion ? REDUCED_BASE_DELAY_MS : BASE_DELAY_MS;
    m_stepDelay = reducedMotion ? REDUCED_STEP_DELAY_MS : STEP_DELAY_MS;
    m_revealed = 0;
    m_active = true;
}

void FinaleTimeline::stop() {
    m_active = false;
}

int FinaleTimeline::update(double now) {
    if (!m_active || isFinished()) {
        return -1;
    }
    if (now < dueTime(m_revealed)) {
        return -1;
    }
    return static_cast<int>(m_revealed++);
}

} // namespace keepsake
