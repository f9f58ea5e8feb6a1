// Keepsake - Frame Scheduler Implementation

#include <keepsake/scheduler.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace keepsake {

FrameScheduler::FrameScheduler() {
    const char* envVal = std::getenv("KEEPSAKE_DEBUG_FRAMES");
    if (envVal && (std::string(envVal) == "1" || std::string(envVal) == "true")) {
        m_debug = true;
        std::cout << "[Scheduler] Debug mode enabled via KEEPSAKE_DEBUG_FRAMES" << std::endl;
    }
}

void FrameScheduler::addStage(const std::string& name, StageFn fn, Predicate enabled) {
    Stage stage;
    stage.name = name;
    stage.fn = std::move(fn);
    stage.enabled = std::move(enabled);
    m_stages.push_back(std::move(stage));
}

const FrameScheduler::Stage* FrameScheduler::stage(const std::string& name) const {
    for (const auto& s : m_stages) {
        if (s.name == name) {
            return &s;
        }
    }
    return nullptr;
}

void FrameScheduler::tick(Context& ctx) {
    if (m_debug && m_ticks == 0) {
        std::cout << "[Scheduler] Stage order:";
        for (const auto& s : m_stages) {
            std::cout << " " << s.name;
        }
        std::cout << std::endl;
    }

    for (auto& s : m_stages) {
        if (!s.fn) {
            continue;
        }

        try {
            if (s.enabled && !s.enabled()) {
                continue;
            }
            s.fn(ctx);
            ++s.runs;
        } catch (const std::exception& e) {
            ++s.faults;
            ++m_faults;
            m_lastFault = s.name + ": " + e.what();
            std::cerr << "[Scheduler] Stage '" << s.name << "' failed: " << e.what() << std::endl;
            if (m_debug) {
                std::cerr << "[Scheduler] frame " << ctx.frame() << " t=" << ctx.time()
                          << "ms, stage faults " << s.faults << ", total " << m_faults << std::endl;
            }
        } catch (...) {
            ++s.faults;
            ++m_faults;
            m_lastFault = s.name + ": unknown exception";
            std::cerr << "[Scheduler] Stage '" << s.name << "' failed: unknown exception" << std::endl;
        }
    }

    ++m_ticks;
}

} // namespace keepsake
