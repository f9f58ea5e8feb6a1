// Keepsake - Context Implementation

#include <keepsake/context.h>

namespace keepsake {

Context::Context(double startMs)
    : m_time(startMs)
{
}

void Context::beginFrame(double nowMs) {
    // Host clocks occasionally step backwards; keep animation time monotonic
    if (nowMs < m_time) {
        nowMs = m_time;
    }
    m_dt = (m_frame == 0) ? 0.0 : nowMs - m_time;
    m_time = nowMs;
    ++m_frame;
}

} // namespace keepsake
