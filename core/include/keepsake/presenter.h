#pragma once

/**
 * @file presenter.h
 * @brief Presentation boundary
 *
 * The core never lays anything out. It tells the presenter what became visible
 * or what value changed; per-frame visuals (particles, idle poses, message
 * opacity, mini-game state) are read from the components directly.
 *
 * Every method has an empty default so a presenter only implements what it
 * draws. The base class itself is a valid headless presenter.
 */

#include <keepsake/diary.h>
#include <keepsake/player_panel.h>
#include <keepsake/session_state.h>

#include <string>
#include <vector>

namespace keepsake {

class Presenter {
public:
    virtual ~Presenter() = default;

    // -------------------------------------------------------------------------
    /// @name Scenes and overlays
    /// @{

    /// @brief Make exactly this scene visible
    virtual void showScene(Scene scene) { (void)scene; }

    /// @brief Full-screen transition cover
    virtual void setCover(bool on) { (void)on; }

    /// @brief Mood overlay used before the finale
    virtual void setDarkness(bool on) { (void)on; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name World read-outs
    /// @{

    virtual void setProgress(size_t discovered, size_t total) { (void)discovered; (void)total; }
    virtual void setObjectDiscovered(const std::string& id) { (void)id; }
    virtual void showMessage(const std::string& text) { (void)text; }
    virtual void setFinalButton(bool visible) { (void)visible; }
    virtual void setCompletionPrompt(bool open) { (void)open; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Audio controls
    /// @{

    virtual void setMuted(bool muted) { (void)muted; }
    virtual void setVolume(float volume) { (void)volume; }
    virtual void setPlayer(const PlayerReadout& readout) { (void)readout; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Overlays
    /// @{

    virtual void showMiniGame(const std::string& title, const std::string& hint) { (void)title; (void)hint; }
    virtual void setMiniGameHint(const std::string& hint) { (void)hint; }
    virtual void hideMiniGame() {}

    virtual void setDiaryOpen(bool open) { (void)open; }
    virtual void setDiaryPage(const DiaryPage& page) { (void)page; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Finale
    /// @{

    virtual void setFinaleText(const std::vector<std::string>& segments) { (void)segments; }
    virtual void revealFinaleSegment(size_t index) { (void)index; }

    /// @}
};

} // namespace keepsake
