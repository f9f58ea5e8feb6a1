#pragma once

/**
 * @file session_state.h
 * @brief Orchestrator-owned state shared by reference with every component
 *
 * Each field has exactly one writer:
 * - scene:          SceneManager
 * - discovered:     DiscoveryLedger::unlock() / restore()
 * - audioMuted:     Experience::toggleMute() / restore
 * - audioUnlocked:  Experience gesture handling
 */

#include <set>
#include <string>

namespace keepsake {

/**
 * @brief Top-level presentation modes; exactly one is visible
 */
enum class Scene {
    Intro,
    World,
    Final
};

inline const char* sceneName(Scene s) {
    switch (s) {
        case Scene::Intro: return "intro";
        case Scene::World: return "world";
        case Scene::Final: return "final";
        default:           return "unknown";
    }
}

struct SessionState {
    explicit SessionState(size_t total = 0) : totalObjects(total) {}

    Scene scene = Scene::Intro;
    std::set<std::string> discovered;
    size_t totalObjects = 0;
    bool audioMuted = false;
    bool audioUnlocked = false;

    size_t discoveredCount() const { return discovered.size(); }
    bool isComplete() const { return totalObjects > 0 && discovered.size() >= totalObjects; }
    bool isDiscovered(const std::string& id) const { return discovered.count(id) > 0; }
};

} // namespace keepsake
