#pragma once

/**
 * @file task_queue.h
 * @brief Cooperative continuations, one-shot outcomes and frame timers
 *
 * Nothing in keepsake blocks. A multi-frame wait is state kept across ticks,
 * and whatever must happen "afterwards" is posted here and runs on a later
 * tick, never synchronously inside the call that finished the wait.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace keepsake {

/**
 * @brief FIFO of callbacks drained once per tick
 *
 * Tasks posted while the queue is draining are kept for the next drain.
 */
class TaskQueue {
public:
    using Task = std::function<void()>;

    void post(Task task);

    /**
     * @brief Run every task that was queued before this call
     * @return Number of tasks executed
     *
     * Exceptions thrown by a task propagate to the caller after the
     * remaining tasks of this batch have been re-queued.
     */
    size_t drain();

    size_t pending() const { return m_tasks.size(); }
    bool empty() const { return m_tasks.empty(); }

private:
    std::vector<Task> m_tasks;
};

/**
 * @brief Read side of a value that becomes available exactly once
 *
 * Outcomes are cheap handles; copies observe the same result.
 */
class Outcome {
public:
    Outcome() = default;

    bool valid() const { return m_state != nullptr; }
    bool isResolved() const { return m_state && m_state->resolved; }

    /// @brief Resolved value; false while pending
    bool value() const { return m_state && m_state->value; }

    /**
     * @brief Register the continuation to run once resolved
     * @param fn Receives the resolved value
     *
     * The continuation always runs from the task queue on a later tick, even
     * when the outcome is already resolved. Only one continuation is kept;
     * registering another replaces it.
     */
    void then(std::function<void(bool)> fn);

private:
    friend class Deferred;

    struct State {
        bool resolved = false;
        bool value = false;
        bool delivered = false;
        std::function<void(bool)> continuation;
        TaskQueue* queue = nullptr;
    };

    explicit Outcome(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    static void schedule(const std::shared_ptr<State>& state);

    std::shared_ptr<State> m_state;
};

/**
 * @brief Write side of an Outcome; resolves at most once
 */
class Deferred {
public:
    explicit Deferred(TaskQueue& queue);

    Outcome outcome() const { return Outcome(m_state); }

    /**
     * @brief Resolve the outcome
     * @return true if this call resolved it, false if it was already resolved
     */
    bool resolve(bool value);

    bool isResolved() const { return m_state->resolved; }

private:
    std::shared_ptr<Outcome::State> m_state;
};

/**
 * @brief One-shot timers measured against frame time
 */
class Timers {
public:
    using Callback = std::function<void()>;

    /**
     * @brief Schedule a callback
     * @param now Current frame time in ms
     * @param delayMs Delay from now; the callback fires on the first update
     *                whose time is at least now + delayMs
     * @return Timer id usable with cancel()
     */
    uint64_t after(double now, double delayMs, Callback cb);

    bool cancel(uint64_t id);
    void clear() { m_timers.clear(); }

    /// @brief Fire every due timer in due-time order
    void update(double now);

    size_t pending() const { return m_timers.size(); }

private:
    struct Entry {
        uint64_t id;
        double due;
        Callback cb;
    };
    std::vector<Entry> m_timers;
    uint64_t m_nextId = 1;
};

} // namespace keepsake
