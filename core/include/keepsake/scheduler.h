#pragma once

/**
 * @file scheduler.h
 * @brief Single cooperative tick that drives every time-based component
 */

#include <keepsake/context.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace keepsake {

/**
 * @brief Ordered list of per-frame stages
 *
 * Stages run in registration order. A stage may carry a predicate that skips
 * it for the frame (e.g. idle objects outside the World scene). Every stage
 * runs inside its own guard: an exception is logged and counted, and later
 * stages and later ticks still run.
 *
 * Set KEEPSAKE_DEBUG_FRAMES=1 to log the stage order once and fault details
 * as they happen.
 *
 * @par Example
 * @code
 * FrameScheduler scheduler;
 * scheduler.addStage("particles", [&](Context& ctx) { particles.update(ctx.time()); });
 * scheduler.addStage("objects", updateObjects, [&] { return state.scene == Scene::World; });
 * scheduler.tick(ctx);
 * @endcode
 */
class FrameScheduler {
public:
    using StageFn = std::function<void(Context&)>;
    using Predicate = std::function<bool()>;

    struct Stage {
        std::string name;
        StageFn fn;
        Predicate enabled;
        uint64_t runs = 0;
        uint64_t faults = 0;
    };

    FrameScheduler();

    /// @brief Append a stage; stages run in the order they were added
    void addStage(const std::string& name, StageFn fn, Predicate enabled = nullptr);

    /// @brief Run every enabled stage once
    void tick(Context& ctx);

    uint64_t ticks() const { return m_ticks; }
    uint64_t faultCount() const { return m_faults; }
    const std::string& lastFault() const { return m_lastFault; }

    const std::vector<Stage>& stages() const { return m_stages; }
    const Stage* stage(const std::string& name) const;

    void setDebug(bool enabled) { m_debug = enabled; }
    bool isDebug() const { return m_debug; }

private:
    std::vector<Stage> m_stages;
    uint64_t m_ticks = 0;
    uint64_t m_faults = 0;
    std::string m_lastFault;
    bool m_debug = false;
};

} // namespace keepsake
