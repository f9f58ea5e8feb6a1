#pragma once

/**
 * @file experience.h
 * @brief Orchestrator wiring scenes, discoveries, audio and overlays together
 */

#include <keepsake/audio_controller.h>
#include <keepsake/content.h>
#include <keepsake/context.h>
#include <keepsake/diary.h>
#include <keepsake/finale.h>
#include <keepsake/interactive_object.h>
#include <keepsake/ledger.h>
#include <keepsake/message_display.h>
#include <keepsake/minigame_manager.h>
#include <keepsake/particles.h>
#include <keepsake/player_panel.h>
#include <keepsake/presenter.h>
#include <keepsake/progress_record.h>
#include <keepsake/scene.h>
#include <keepsake/scheduler.h>
#include <keepsake/session_state.h>
#include <keepsake/task_queue.h>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace keepsake {

struct ExperienceOptions {
    float viewportWidth = 1280.0f;      ///< Particle field size, px
    float viewportHeight = 720.0f;
    PlaySurface surface{480.0f, 360.0f};
    uint32_t seed = std::random_device{}();
};

enum class TapResult {
    Ignored,            ///< Not accepted in the current state
    MiniGameOpened,     ///< Undiscovered object; its mini-game is running
    AlreadyDiscovered   ///< Acknowledged without a mini-game
};

const char* tapResultName(TapResult r);

/**
 * @brief One running experience
 *
 * The host owns the Context, the audio tracks, the storage and the presenter.
 * Each frame it calls ctx.beginFrame() followed by tick(); input methods may be
 * called at any point between ticks and read the current frame time.
 *
 * The experience always starts at the Intro scene. Saved progress is restored
 * at construction but never skips ahead.
 *
 * @par Example
 * @code
 * Context ctx;
 * Experience exp(ctx, defaultContent(), audio, storage, presenter);
 * exp.startJourney();
 * while (running) {
 *     ctx.beginFrame(clockMs());
 *     exp.tick();
 * }
 * @endcode
 */
class Experience {
public:
    static constexpr double UNLOCK_HOLD_MS = 2800.0;
    static constexpr double REPEAT_HOLD_MS = 1500.0;
    static constexpr double FINALE_DARK_MS = 1100.0;

    Experience(Context& ctx, Content content, AudioController& audio, ProgressStorage& storage,
               Presenter& presenter, ExperienceOptions options = {});

    Experience(const Experience&) = delete;
    Experience& operator=(const Experience&) = delete;

    /// @brief Run one frame at ctx.time()
    void tick();

    // -------------------------------------------------------------------------
    /// @name Input
    /// @{

    /// @brief Any pointer-down on the intro or world scene
    void userGesture();

    /// @brief Intro start button
    void startJourney();

    TapResult tapObject(const std::string& id);

    void pressMiniGame(int target);
    void releaseMiniGame(int target);
    void closeMiniGame();
    bool dismissMiniGame();

    void toggleMute();
    void setVolume(float volume);

    void openDiary();
    void closeDiary();
    void diaryPrev();
    void diaryNext();

    /// @brief Final button in the world scene
    void requestFinale();

    /// @brief "Go" on the completion prompt
    void acceptFinale();

    /// @brief "Stay", close or backdrop on the completion prompt
    void dismissCompletion();

    void closeFinale();

    void togglePlayer();
    void previewSeek(float fraction);
    void seekPlayer(float fraction);

    /// @brief Host regained visibility or focus
    void hostResumed();

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    const SessionState& state() const { return m_state; }
    const Content& content() const { return m_content; }
    const DiscoveryLedger& ledger() const { return m_ledger; }
    const std::vector<InteractiveObject>& objects() const { return m_objects; }

    /// @throws std::runtime_error for ids not in the catalogue
    const InteractiveObject& object(const std::string& id) const;

    bool completionOpen() const { return m_completionOpen; }
    bool finaleEntering() const { return m_finaleEntering; }

    SceneManager& scenes() { return m_scenes; }
    MiniGameManager& miniGames() { return m_miniGames; }
    ParticleField& particles() { return m_particles; }
    MessageDisplay& messages() { return m_messages; }
    Diary& diary() { return m_diary; }
    FinaleTimeline& finale() { return m_finale; }
    PlayerPanel& player() { return m_player; }
    FrameScheduler& scheduler() { return m_scheduler; }
    Timers& timers() { return m_timers; }
    AudioController& audio() { return m_audio; }

    /// @brief Snapshot of the persisted profile
    ProgressRecord record() const;

    /// @brief Write the profile through the storage
    bool persist();

    /// @}

private:
    void registerStages();
    void restore();

    bool unlockAudio();
    Channel sceneChannel() const { return PlayerPanel::channelFor(m_state.scene); }

    void completeDiscovery(const std::string& id);
    void showMessage(const std::string& text, double holdMs);

    void openCompletion();
    void closeCompletion();
    void beginFinale();
    void enterFinale();

    void refreshProgress();
    void refreshDiary();
    void refreshFinalButton();
    void refreshPlayer();

    InteractiveObject* findObject(const std::string& id);

    Context& m_ctx;
    Content m_content;
    AudioController& m_audio;
    ProgressStorage& m_storage;
    Presenter& m_presenter;
    ExperienceOptions m_options;

    SessionState m_state;
    DiscoveryLedger m_ledger;
    std::vector<InteractiveObject> m_objects;

    Timers m_timers;
    ParticleField m_particles;
    MessageDisplay m_messages;
    SceneManager m_scenes;
    MiniGameManager m_miniGames;
    Diary m_diary;
    FinaleTimeline m_finale;
    PlayerPanel m_player;
    FrameScheduler m_scheduler;

    std::mt19937 m_rng;
    bool m_completionOpen = false;
    bool m_finaleEntering = false;
    bool m_gestureSeen = false;     ///< A gesture asked for audio, granted or not
};

} // namespace keepsake
