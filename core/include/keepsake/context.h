#pragma once

/**
 * @file context.h
 * @brief Per-frame runtime context shared by every component
 *
 * The Context provides access to:
 * - Time information (elapsed time, delta time, frame count)
 * - The reduced-motion preference
 * - The task queue used to resume work on a later tick
 *
 * All times are milliseconds on a monotonic clock chosen by the host. The
 * runtime feeds wall-clock time; tests advance it by hand.
 */

#include <keepsake/task_queue.h>

#include <cstdint>

namespace keepsake {

/**
 * @brief Runtime context providing time and the deferred task queue
 *
 * @par Example
 * @code
 * Context ctx;
 * ctx.beginFrame(clockMs());
 * experience.tapObject("star");   // input reads ctx.time()
 * experience.tick();              // scheduler drives everything
 * @endcode
 */
class Context {
public:
    /**
     * @brief Construct a context
     * @param startMs Time of the first frame
     */
    explicit Context(double startMs = 0.0);

    /**
     * @brief Start a new frame at the given host time
     * @param nowMs Host time in milliseconds (must not go backwards)
     *
     * A timestamp earlier than the previous frame is clamped so that
     * animation progress stays monotonic.
     */
    void beginFrame(double nowMs);

    /// @brief Convenience for tests: start a frame dtMs after the current one
    void advance(double dtMs) { beginFrame(m_time + dtMs); }

    // -------------------------------------------------------------------------
    /// @name Time
    /// @{

    /// @brief Current frame time in milliseconds
    double time() const { return m_time; }

    /// @brief Milliseconds elapsed since the previous frame
    double dt() const { return m_dt; }

    /// @brief Number of frames begun so far
    uint64_t frame() const { return m_frame; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Preferences
    /// @{

    bool reducedMotion() const { return m_reducedMotion; }
    void setReducedMotion(bool reduced) { m_reducedMotion = reduced; }

    /// @}

    /// @brief Continuations that run at the start of the next tick
    TaskQueue& tasks() { return m_tasks; }
    const TaskQueue& tasks() const { return m_tasks; }

private:
    double m_time = 0.0;
    double m_dt = 0.0;
    uint64_t m_frame = 0;
    bool m_reducedMotion = false;
    TaskQueue m_tasks;
};

} // namespace keepsake
