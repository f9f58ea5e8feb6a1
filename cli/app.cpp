// Keepsake Application Implementation

#include "app.h"
#include "autopilot.h"
#include "command.h"
#include "console_presenter.h"

#include <keepsake/keepsake.h>
#include <keepsake/runtime/miniaudio_track.h>
#include <keepsake/storage/progress_store.h>

#include <nlohmann/json.hpp>

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

namespace keepsake {

using json = nlohmann::json;
namespace fs = std::filesystem;

// -----------------------------------------------------------------------------
// Config file
// -----------------------------------------------------------------------------

bool loadConfigFile(const fs::path& path, AppConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open " + path.string();
        return false;
    }

    AppConfig next = config;
    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error = path.string() + " must hold a JSON object";
            return false;
        }

        if (j.contains("profile")) next.profilePath = j["profile"].get<std::string>();
        if (j.contains("content")) next.contentPath = j["content"].get<std::string>();
        next.reducedMotion = j.value("reducedMotion", next.reducedMotion);
        next.fps = j.value("fps", next.fps);

        if (j.contains("audio")) {
            const json& audio = j["audio"];
            next.ambientPath = audio.value("ambient", next.ambientPath);
            next.finalPath = audio.value("final", next.finalPath);
            next.chimePath = audio.value("chime", next.chimePath);
        }

        if (j.contains("tracks")) {
            const json& tracks = j["tracks"];
            if (tracks.contains("ambient")) {
                next.ambientLabel.title = tracks["ambient"].value("title", next.ambientLabel.title);
                next.ambientLabel.artist = tracks["ambient"].value("artist", next.ambientLabel.artist);
            }
            if (tracks.contains("final")) {
                next.finalLabel.title = tracks["final"].value("title", next.finalLabel.title);
                next.finalLabel.artist = tracks["final"].value("artist", next.finalLabel.artist);
            }
        }

        if (j.contains("viewport")) {
            next.viewportWidth = j["viewport"].value("width", next.viewportWidth);
            next.viewportHeight = j["viewport"].value("height", next.viewportHeight);
        }
    } catch (const json::exception& e) {
        error = "Invalid config " + path.string() + ": " + e.what();
        return false;
    }

    config = std::move(next);
    return true;
}

// -----------------------------------------------------------------------------
// Application
// -----------------------------------------------------------------------------

struct Application::Impl {
    AppConfig appConfig;

    Context ctx;
    std::unique_ptr<runtime::AudioEngine> engine;
    std::unique_ptr<AudioTrack> ambientTrack;
    std::unique_ptr<AudioTrack> finaleTrack;
    std::unique_ptr<AudioTrack> chimeTrack;
    std::unique_ptr<AudioController> audio;
    std::unique_ptr<ProgressStorage> storage;
    std::unique_ptr<cli::ConsolePresenter> presenter;
    std::unique_ptr<Experience> experience;
    cli::Autopilot autopilot;

    // Input
    std::deque<std::string> pending;
    std::string stdinBuffer;
    bool readStdin = false;
    bool inputClosed = false;
    double waitUntil = 0.0;
    bool quit = false;

    std::unique_ptr<AudioTrack> makeTrack(const std::string& path, const char* what);
    void pumpStdin();
    void runCommands(double now);
    void execute(const cli::Command& cmd, double now);
    void printStatus() const;
};

std::unique_ptr<AudioTrack> Application::Impl::makeTrack(const std::string& path, const char* what) {
    if (path.empty() || !engine || !engine->isInitialized()) {
        return std::make_unique<NullTrack>();
    }

    auto track = std::make_unique<runtime::MiniaudioTrack>(*engine);
    if (!track->load(path)) {
        std::cerr << "[App] Using a silent " << what << " track" << std::endl;
        return std::make_unique<NullTrack>();
    }
    return track;
}

void Application::Impl::pumpStdin() {
    if (!readStdin || inputClosed) {
        return;
    }

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
        char buf[512];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            inputClosed = true;
            break;
        }
        stdinBuffer.append(buf, static_cast<size_t>(n));
    }

    size_t nl;
    while ((nl = stdinBuffer.find('\n')) != std::string::npos) {
        pending.push_back(stdinBuffer.substr(0, nl));
        stdinBuffer.erase(0, nl + 1);
    }
    if (inputClosed && !stdinBuffer.empty()) {
        pending.push_back(stdinBuffer);
        stdinBuffer.clear();
    }
}

void Application::Impl::runCommands(double now) {
    while (!pending.empty() && !quit && now >= waitUntil && !autopilot.busy()) {
        std::string line = pending.front();
        pending.pop_front();

        cli::Command cmd;
        std::string error;
        if (!cli::parseCommand(line, cmd, error)) {
            if (!error.empty()) {
                std::cerr << "[App] " << error << std::endl;
            }
            continue;
        }
        execute(cmd, now);
    }
}

void Application::Impl::execute(const cli::Command& cmd, double now) {
    Experience& exp = *experience;

    switch (cmd.kind) {
        case cli::CommandKind::Gesture: exp.userGesture(); break;
        case cli::CommandKind::Start: exp.startJourney(); break;
        case cli::CommandKind::Tap: {
            TapResult r = exp.tapObject(cmd.text);
            std::cout << "[App] tap " << cmd.text << ": " << tapResultName(r) << std::endl;
            break;
        }
        case cli::CommandKind::Press: exp.pressMiniGame(static_cast<int>(cmd.value)); break;
        case cli::CommandKind::Release: exp.releaseMiniGame(static_cast<int>(cmd.value)); break;
        case cli::CommandKind::Solve: autopilot.start(exp, now); break;
        case cli::CommandKind::CloseGame: exp.closeMiniGame(); break;
        case cli::CommandKind::DismissGame:
            if (!exp.dismissMiniGame()) {
                std::cout << "[App] dismiss ignored" << std::endl;
            }
            break;
        case cli::CommandKind::Mute: exp.toggleMute(); break;
        case cli::CommandKind::Volume: exp.setVolume(static_cast<float>(cmd.value)); break;
        case cli::CommandKind::DiaryOpen: exp.openDiary(); break;
        case cli::CommandKind::DiaryClose: exp.closeDiary(); break;
        case cli::CommandKind::DiaryPrev: exp.diaryPrev(); break;
        case cli::CommandKind::DiaryNext: exp.diaryNext(); break;
        case cli::CommandKind::FinaleRequest: exp.requestFinale(); break;
        case cli::CommandKind::FinaleAccept: exp.acceptFinale(); break;
        case cli::CommandKind::FinaleDismiss: exp.dismissCompletion(); break;
        case cli::CommandKind::FinaleClose: exp.closeFinale(); break;
        case cli::CommandKind::PlayerToggle: exp.togglePlayer(); break;
        case cli::CommandKind::Seek: exp.seekPlayer(static_cast<float>(cmd.value)); break;
        case cli::CommandKind::Resume: exp.hostResumed(); break;
        case cli::CommandKind::Wait: waitUntil = now + cmd.value; break;
        case cli::CommandKind::Status: printStatus(); break;
        case cli::CommandKind::Quit: quit = true; break;
    }
}

void Application::Impl::printStatus() const {
    const SessionState& s = experience->state();
    std::cout << "[App] scene=" << sceneName(s.scene)
              << " found=" << s.discoveredCount() << "/" << s.totalObjects
              << " audio=" << (s.audioUnlocked ? "unlocked" : "locked")
              << (s.audioMuted ? " muted" : "")
              << " ambient=" << audio->level(Channel::Ambient)
              << " final=" << audio->level(Channel::Final)
              << " faults=" << experience->scheduler().faultCount() << std::endl;
}

Application::~Application() {
    shutdown();
}

int Application::init(const AppConfig& config) {
    if (m_initialized) {
        return 0;  // Already initialized
    }

    m_impl = new Impl();
    m_impl->appConfig = config;
    const AppConfig& cfg = m_impl->appConfig;

    // Content
    Content content = defaultContent();
    if (!cfg.contentPath.empty()) {
        std::string error;
        if (!loadContent(cfg.contentPath, content, error)) {
            std::cerr << "[App] " << error << " (using built-in content)" << std::endl;
        }
    }

    // Audio
    if (!cfg.headless) {
        m_impl->engine = std::make_unique<runtime::AudioEngine>();
        if (!m_impl->engine->init()) {
            std::cerr << "[App] Continuing without sound" << std::endl;
        }
    }
    m_impl->ambientTrack = m_impl->makeTrack(cfg.ambientPath, "ambient");
    m_impl->finaleTrack = m_impl->makeTrack(cfg.finalPath, "final");
    m_impl->chimeTrack = m_impl->makeTrack(cfg.chimePath, "chime");
    m_impl->audio = std::make_unique<AudioController>(*m_impl->ambientTrack, *m_impl->finaleTrack,
                                                      m_impl->chimeTrack.get());

    // Storage
    if (cfg.profilePath.empty()) {
        m_impl->storage = std::make_unique<MemoryProgressStorage>();
    } else {
        m_impl->storage = std::make_unique<storage::JsonProgressStore>(cfg.profilePath);
    }

    // Script
    if (!cfg.scriptPath.empty()) {
        std::ifstream script(cfg.scriptPath);
        if (!script.is_open()) {
            std::cerr << "[App] Cannot open script " << cfg.scriptPath.string() << std::endl;
            return 1;
        }
        std::string line;
        while (std::getline(script, line)) {
            m_impl->pending.push_back(line);
        }
        m_impl->inputClosed = true;
    } else {
        m_impl->readStdin = true;
        std::cout << cli::commandHelp() << std::endl;
    }

    m_impl->presenter = std::make_unique<cli::ConsolePresenter>(std::cout);
    m_impl->ctx.setReducedMotion(cfg.reducedMotion);

    ExperienceOptions options;
    options.viewportWidth = static_cast<float>(cfg.viewportWidth);
    options.viewportHeight = static_cast<float>(cfg.viewportHeight);

    m_impl->experience = std::make_unique<Experience>(m_impl->ctx, std::move(content),
                                                      *m_impl->audio, *m_impl->storage,
                                                      *m_impl->presenter, options);
    m_impl->experience->player().setTrackInfo(Channel::Ambient,
                                              {cfg.ambientLabel.title, cfg.ambientLabel.artist});
    m_impl->experience->player().setTrackInfo(Channel::Final,
                                              {cfg.finalLabel.title, cfg.finalLabel.artist});

    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized || !m_impl) {
        return 1;
    }

    Impl& app = *m_impl;
    const AppConfig& cfg = app.appConfig;
    const double stepMs = 1000.0 / std::max(1.0f, cfg.fps);

    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    auto nextFrame = started;

    int frames = 0;
    while (!app.quit) {
        double now = cfg.headless
            ? frames * stepMs
            : std::chrono::duration<double, std::milli>(Clock::now() - started).count();

        app.ctx.beginFrame(now);
        app.pumpStdin();
        app.runCommands(app.ctx.time());
        app.autopilot.update(*app.experience, app.ctx.time());
        app.experience->tick();
        ++frames;

        if (cfg.maxFrames > 0 && frames >= cfg.maxFrames) {
            break;
        }
        // Script or stdin finished and nothing is still playing out
        if (app.inputClosed && app.pending.empty() && !app.autopilot.busy()
            && app.ctx.time() >= app.waitUntil) {
            break;
        }

        if (!cfg.headless) {
            nextFrame += std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double, std::milli>(stepMs));
            std::this_thread::sleep_until(nextFrame);
        }
    }

    std::cout << "[App] Stopped after " << frames << " frames" << std::endl;
    app.printStatus();
    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }

    // Experience before the tracks it drives, tracks before the engine
    m_impl->experience.reset();
    m_impl->audio.reset();
    m_impl->chimeTrack.reset();
    m_impl->finaleTrack.reset();
    m_impl->ambientTrack.reset();
    if (m_impl->engine) {
        m_impl->engine->shutdown();
    }

    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace keepsake
