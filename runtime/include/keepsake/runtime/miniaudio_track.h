#pragma once

/**
 * @file miniaudio_track.h
 * @brief AudioTrack backed by a miniaudio engine and sound
 */

#include <keepsake/audio_track.h>

#include <memory>
#include <string>

namespace keepsake::runtime {

/**
 * @brief Shared playback engine for every track
 *
 * Must outlive the tracks created from it.
 */
class AudioEngine {
public:
    AudioEngine();
    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    /// @return false if no playback device could be opened
    bool init();
    void shutdown();

    bool isInitialized() const { return initialized_; }

private:
    friend class MiniaudioTrack;

    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_ = false;
};

/**
 * @brief Streams one audio file through the engine
 *
 * A track whose file failed to load behaves as a silent track that refuses
 * to play, which the AudioController treats like a blocked autoplay.
 */
class MiniaudioTrack : public AudioTrack {
public:
    explicit MiniaudioTrack(AudioEngine& engine);
    ~MiniaudioTrack() override;

    MiniaudioTrack(const MiniaudioTrack&) = delete;
    MiniaudioTrack& operator=(const MiniaudioTrack&) = delete;

    /// @return false if the file can't be opened or decoded
    bool load(const std::string& path);
    bool isLoaded() const { return loaded_; }
    const std::string& path() const { return path_; }

    bool play() override;
    void pause() override;
    bool isPaused() const override;
    void setVolume(float volume) override;
    float volume() const override { return volume_; }
    void setLooping(bool loop) override;
    double position() const override;
    double duration() const override;
    void seek(double seconds) override;

private:
    void unload();

    struct Impl;
    std::unique_ptr<Impl> impl_;
    AudioEngine& engine_;
    std::string path_;
    float volume_ = 0.0f;
    bool looping_ = false;
    bool loaded_ = false;
};

} // namespace keepsake::runtime
