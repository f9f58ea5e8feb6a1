// Keepsake - Task Queue, Outcome and Timers Implementation

#include <keepsake/task_queue.h>
#include <algorithm>
#include <utility>

namespace keepsake {

void TaskQueue::post(Task task) {
    if (task) {
        m_tasks.push_back(std::move(task));
    }
}

size_t TaskQueue::drain() {
    // Swap out the batch so tasks posted while draining wait for the next tick
    std::vector<Task> batch;
    batch.swap(m_tasks);

    size_t ran = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        try {
            batch[i]();
            ++ran;
        } catch (...) {
            // Put the unexecuted remainder back in front of anything posted meanwhile
            std::vector<Task> rest(std::make_move_iterator(batch.begin() + i + 1),
                                   std::make_move_iterator(batch.end()));
            rest.insert(rest.end(), std::make_move_iterator(m_tasks.begin()),
                        std::make_move_iterator(m_tasks.end()));
            m_tasks.swap(rest);
            throw;
        }
    }
    return ran;
}

// -----------------------------------------------------------------------------
// Outcome / Deferred
// -----------------------------------------------------------------------------

void Outcome::then(std::function<void(bool)> fn) {
    if (!m_state) {
        return;
    }
    m_state->continuation = std::move(fn);
    m_state->delivered = false;
    if (m_state->resolved) {
        schedule(m_state);
    }
}

void Outcome::schedule(const std::shared_ptr<State>& state) {
    if (!state->continuation || !state->queue) {
        return;
    }
    // The task owns the state: both ends of an outcome may be gone by the time it runs
    state->queue->post([s = state]() {
        if (s->delivered || !s->continuation) {
            return;
        }
        s->delivered = true;
        auto fn = std::move(s->continuation);
        s->continuation = nullptr;
        fn(s->value);
    });
}

Deferred::Deferred(TaskQueue& queue)
    : m_state(std::make_shared<Outcome::State>()) {
    m_state->queue = &queue;
}

bool Deferred::resolve(bool value) {
    if (m_state->resolved) {
        return false;
    }
    m_state->resolved = true;
    m_state->value = value;
    Outcome::schedule(m_state);
    return true;
}

// -----------------------------------------------------------------------------
// Timers
// -----------------------------------------------------------------------------

uint64_t Timers::after(double now, double delayMs, Callback cb) {
    uint64_t id = m_nextId++;
    m_timers.push_back({id, now + std::max(0.0, delayMs), std::move(cb)});
    return id;
}

bool Timers::cancel(uint64_t id) {
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == m_timers.end()) {
        return false;
    }
    m_timers.erase(it);
    return true;
}

void Timers::update(double now) {
    std::vector<Entry> due;
    auto split = std::stable_partition(m_timers.begin(), m_timers.end(),
                                       [now](const Entry& e) { return e.due > now; });
    due.assign(std::make_move_iterator(split), std::make_move_iterator(m_timers.end()));
    m_timers.erase(split, m_timers.end());

    std::stable_sort(due.begin(), due.end(),
                     [](const Entry& a, const Entry& b) { return a.due < b.due; });
    for (auto& e : due) {
        if (e.cb) {
            e.cb();
        }
    }
}

} // namespace keepsake
