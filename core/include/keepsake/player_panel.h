#pragma once

/**
 * @file player_panel.h
 * @brief Now-playing read-out and transport for the current scene's track
 *
 * The panel never touches tracks directly; play/pause and seek go through the
 * AudioController like every other level change.
 */

#include <keepsake/audio_controller.h>
#include <keepsake/session_state.h>

#include <array>
#include <string>

namespace keepsake {

struct TrackInfo {
    std::string title;
    std::string artist;
};

/**
 * @brief Snapshot pushed to the presenter
 */
struct PlayerReadout {
    Channel channel = Channel::Ambient;
    std::string title;
    std::string artist;
    std::string elapsed = "0:00";
    std::string duration = "0:00";
    bool playing = false;
    float seekFraction = 0.0f;      ///< Position / duration, or the pending seek
};

class PlayerPanel {
public:
    explicit PlayerPanel(AudioController& audio);

    void setTrackInfo(Channel ch, TrackInfo info);
    const TrackInfo& trackInfo(Channel ch) const { return m_info[static_cast<size_t>(ch)]; }

    /// @brief Channel shown for a scene (finale track only in Final)
    static Channel channelFor(Scene scene) {
        return scene == Scene::Final ? Channel::Final : Channel::Ambient;
    }

    /// @brief Format seconds as m:ss ("0:00" for invalid input)
    static std::string formatTime(double seconds);

    PlayerReadout readout(Scene scene) const;

    /// @return true if playing afterwards
    bool toggle(Scene scene);

    /// @brief Preview a seek position while the slider is dragged
    void beginSeek(float fraction);

    /// @brief Apply the previewed position
    void commitSeek(Scene scene);

    bool isSeeking() const { return m_seeking; }

private:
    AudioController& m_audio;
    std::array<TrackInfo, CHANNEL_COUNT> m_info;
    bool m_seeking = false;
    float m_seekFraction = 0.0f;
};

} // namespace keepsake
