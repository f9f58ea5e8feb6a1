#pragma once

/**
 * @file audio_controller.h
 * @brief Ambient/finale audio continuity: unlock, crossfade, mute, recovery
 *
 * AudioController is the single source of truth for "what level should this
 * channel be at". Scene changes, user toggles and the recovery watchdog all go
 * through it; nothing else touches track volumes.
 */

#include <keepsake/audio_track.h>
#include <keepsake/fade.h>

#include <array>

namespace keepsake {

/**
 * @brief Observable state of one channel
 */
enum class ChannelState {
    Stopped,    ///< Paused or silent
    FadingIn,   ///< Ramp towards a higher level in flight
    Holding,    ///< Playing at a steady audible level
    FadingOut   ///< Ramp towards a lower level in flight
};

inline const char* channelStateName(ChannelState s) {
    switch (s) {
        case ChannelState::Stopped:   return "Stopped";
        case ChannelState::FadingIn:  return "FadingIn";
        case ChannelState::Holding:   return "Holding";
        case ChannelState::FadingOut: return "FadingOut";
        default:                      return "Unknown";
    }
}

/**
 * @brief Target levels and fade timings
 */
struct AudioTuning {
    float ambientLevel = 0.14f;         ///< Base level of the ambient track
    float finalLevel = 0.18f;           ///< Base level of the finale track
    double ambientUnlockMs = 2000.0;    ///< Fade-in after unlocking ambient
    double finalUnlockMs = 2400.0;      ///< Fade-in after unlocking final
    double toFinalMs = 2600.0;          ///< Crossfade towards final
    double toAmbientMs = 2200.0;        ///< Crossfade towards ambient
    double watchdogIntervalMs = 2500.0; ///< Minimum spacing of recovery checks
};

/**
 * @brief Two-channel audio controller
 *
 * Starts Locked. unlock() must only be called in response to a user gesture;
 * a refusal reverts to Locked and the next gesture may retry.
 *
 * @par Example
 * @code
 * AudioController audio(ambientTrack, finalTrack, &chimeTrack);
 * audio.unlock(Channel::Ambient, ctx.time());      // on the start button
 * ...
 * audio.switchTo(Channel::Final, ctx.time());      // entering the finale
 * audio.update(ctx.time());                        // every frame
 * @endcode
 */
class AudioController {
public:
    AudioController(AudioTrack& ambient, AudioTrack& final, AudioTrack* chime = nullptr,
                    AudioTuning tuning = {});

    // Non-copyable (holds references to host tracks)
    AudioController(const AudioController&) = delete;
    AudioController& operator=(const AudioController&) = delete;

    // -------------------------------------------------------------------------
    /// @name Transitions
    /// @{

    /**
     * @brief Unlock playback and fade the target channel in
     * @return true if unlocked (or already unlocked), false if the host refused
     *
     * While muted this only records the permission; playback starts on unmute.
     */
    bool unlock(Channel target, double now);

    /**
     * @brief Crossfade to the target channel
     * @return false if locked, muted, or the target refused to start
     */
    bool switchTo(Channel target, double now);

    /**
     * @brief Restart a channel from silence after unmuting
     *
     * Fades the channel in from 0 and silences the other one.
     */
    bool resume(Channel target, double now);

    /**
     * @brief Mute or unmute
     *
     * Muting cancels every fade, zeroes both levels and pauses both tracks
     * immediately. Unmuting only clears the flag; call resume() to restart.
     */
    void setMuted(bool muted);

    /// @brief Set master volume (clamped to [0, 1]); rescales current levels
    void setMasterVolume(float volume);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Per-frame
    /// @{

    /// @brief Advance active fades and apply levels
    void update(double now);

    /// @brief True while a fade is in flight
    bool needsUpdate() const { return m_fades.needsUpdate(); }

    /**
     * @brief Rate-limited recovery check
     * @return true if a check ran (not necessarily a replay)
     */
    bool watchdog(double now);

    /**
     * @brief Replay any channel that should be audible but is paused
     * @return Number of channels restarted
     */
    int ensurePlayback();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Player controls
    /// @{

    /// @brief Short unlock cue on the chime track
    void playChime();

    /**
     * @brief Play/pause the channel's track directly (player panel)
     * @return true if the track is playing afterwards
     *
     * A channel paused here is left alone by the watchdog until it is played
     * again by any path.
     */
    bool togglePlayback(Channel ch);

    /// @brief Seek the channel's track to a fraction of its duration
    void seek(Channel ch, float fraction);

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    bool isEnabled() const { return m_enabled; }
    bool isMuted() const { return m_muted; }
    float masterVolume() const { return m_master; }

    /// @brief Level before master volume is applied
    float base(Channel ch) const { return m_base[idx(ch)]; }

    /// @brief Level applied to the track
    float level(Channel ch) const;

    ChannelState state(Channel ch) const;
    bool isPlaying(Channel ch) const;

    float targetLevel(Channel ch) const;
    const FadeEngine& fades() const { return m_fades; }
    const AudioTuning& tuning() const { return m_tuning; }

    AudioTrack& track(Channel ch) { return ch == Channel::Ambient ? m_ambient : m_final; }
    const AudioTrack& track(Channel ch) const { return ch == Channel::Ambient ? m_ambient : m_final; }

    /// @}

private:
    static size_t idx(Channel ch) { return static_cast<size_t>(ch); }

    bool tryPlay(AudioTrack& track, const char* what);
    void tryPause(AudioTrack& track, const char* what);
    void applyLevel(Channel ch);
    void startFade(Channel ch, float from, float to, double durationMs, double now);

    AudioTrack& m_ambient;
    AudioTrack& m_final;
    AudioTrack* m_chime = nullptr;
    AudioTuning m_tuning;

    FadeEngine m_fades;
    std::array<float, CHANNEL_COUNT> m_base{};
    std::array<bool, CHANNEL_COUNT> m_userPaused{};

    bool m_enabled = false;
    bool m_muted = false;
    float m_master = 1.0f;
    double m_lastWatchdog = 0.0;
    bool m_watchdogRan = false;
};

} // namespace keepsake
