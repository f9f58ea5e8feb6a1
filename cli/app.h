// Keepsake Application
// Owns audio, storage and the experience, and runs the frame loop

#pragma once

#include <filesystem>
#include <string>

namespace keepsake {

struct TrackLabel {
    std::string title;
    std::string artist;
};

// Configuration from keepsake.json, then overridden by command-line arguments
struct AppConfig {
    std::filesystem::path configPath = "keepsake.json";
    std::filesystem::path profilePath = "keepsake_progress.json";
    std::filesystem::path contentPath;      // empty = built-in content

    // Audio files (empty = silent track)
    std::string ambientPath;
    std::string finalPath;
    std::string chimePath;
    TrackLabel ambientLabel{"4 O'Clock", "Instrumental"};
    TrackLabel finalLabel{"Beautiful", "Finale"};

    bool reducedMotion = false;
    bool headless = false;                  // fixed time step, no audio device
    std::filesystem::path scriptPath;       // commands to run; empty = read stdin

    float fps = 60.0f;
    int maxFrames = 0;                      // 0 = unlimited
    int viewportWidth = 1280;
    int viewportHeight = 720;
};

// Fill config from a JSON file; false (config untouched) if the file is
// missing or malformed
bool loadConfigFile(const std::filesystem::path& path, AppConfig& config, std::string& error);

// Main application class
class Application {
public:
    Application() = default;
    ~Application();

    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Run the main loop
    // Returns exit code (0 = success)
    int run();

    // Cleanup (called by destructor, can be called explicitly)
    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace keepsake
