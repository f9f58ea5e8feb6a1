#pragma once

/**
 * @file audio_track.h
 * @brief Playback primitive the audio controller drives
 *
 * A track is one looping (or one-shot) sound owned by the host. The runtime
 * implements it with miniaudio; tests use a fake that can refuse playback.
 */

namespace keepsake {

/**
 * @brief Abstract playable sound
 *
 * Implementations may throw from play(); AudioController catches it and
 * treats it the same as a refused start.
 */
class AudioTrack {
public:
    virtual ~AudioTrack() = default;

    /**
     * @brief Start or resume playback
     * @return false if the host refused (e.g. no qualifying user gesture yet)
     */
    virtual bool play() = 0;

    /// @brief Pause playback, keeping the position
    virtual void pause() = 0;

    virtual bool isPaused() const = 0;

    /// @brief Audible level in [0, 1]
    virtual void setVolume(float volume) = 0;
    virtual float volume() const = 0;

    virtual void setLooping(bool looping) { (void)looping; }

    /// @brief Playback position in seconds
    virtual double position() const { return 0.0; }

    /// @brief Length in seconds, 0 if unknown
    virtual double duration() const { return 0.0; }

    virtual void seek(double seconds) { (void)seconds; }
};

/**
 * @brief Silent track used when no audio device is available
 */
class NullTrack : public AudioTrack {
public:
    bool play() override { m_paused = false; return true; }
    void pause() override { m_paused = true; }
    bool isPaused() const override { return m_paused; }
    void setVolume(float volume) override { m_volume = volume; }
    float volume() const override { return m_volume; }

private:
    bool m_paused = true;
    float m_volume = 0.0f;
};

} // namespace keepsake
