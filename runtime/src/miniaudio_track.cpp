// Prevent Windows.h from defining min/max macros (must be before miniaudio.h)
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include <keepsake/runtime/miniaudio_track.h>
#include <algorithm>
#include <iostream>

namespace keepsake::runtime {

// -----------------------------------------------------------------------------
// AudioEngine
// -----------------------------------------------------------------------------

struct AudioEngine::Impl {
    ma_engine engine;
};

AudioEngine::AudioEngine() : impl_(std::make_unique<Impl>()) {}

AudioEngine::~AudioEngine() {
    shutdown();
}

bool AudioEngine::init() {
    if (initialized_) {
        return true;
    }

    if (ma_engine_init(nullptr, &impl_->engine) != MA_SUCCESS) {
        std::cerr << "[AudioEngine] Failed to initialize audio device\n";
        return false;
    }

    initialized_ = true;
    std::cout << "[AudioEngine] Initialized: " << ma_engine_get_sample_rate(&impl_->engine)
              << "Hz, " << ma_engine_get_channels(&impl_->engine) << " channel(s)\n";
    return true;
}

void AudioEngine::shutdown() {
    if (initialized_) {
        ma_engine_uninit(&impl_->engine);
        initialized_ = false;
    }
}

// -----------------------------------------------------------------------------
// MiniaudioTrack
// -----------------------------------------------------------------------------

struct MiniaudioTrack::Impl {
    ma_sound sound;
};

MiniaudioTrack::MiniaudioTrack(AudioEngine& engine)
    : impl_(std::make_unique<Impl>())
    , engine_(engine) {
}

MiniaudioTrack::~MiniaudioTrack() {
    unload();
}

bool MiniaudioTrack::load(const std::string& path) {
    unload();
    path_ = path;

    if (!engine_.isInitialized()) {
        std::cerr << "[MiniaudioTrack] No audio engine for " << path << "\n";
        return false;
    }

    ma_result result = ma_sound_init_from_file(&engine_.impl_->engine, path.c_str(),
                                               MA_SOUND_FLAG_STREAM, nullptr, nullptr,
                                               &impl_->sound);
    if (result != MA_SUCCESS) {
        std::cerr << "[MiniaudioTrack] Failed to load " << path << " ("
                  << ma_result_description(result) << ")\n";
        return false;
    }

    loaded_ = true;
    ma_sound_set_volume(&impl_->sound, volume_);
    ma_sound_set_looping(&impl_->sound, looping_ ? MA_TRUE : MA_FALSE);
    std::cout << "[MiniaudioTrack] Loaded " << path << "\n";
    return true;
}

void MiniaudioTrack::unload() {
    if (loaded_) {
        ma_sound_uninit(&impl_->sound);
        loaded_ = false;
    }
}

bool MiniaudioTrack::play() {
    if (!loaded_) {
        return false;
    }
    if (ma_sound_start(&impl_->sound) != MA_SUCCESS) {
        std::cerr << "[MiniaudioTrack] Failed to start " << path_ << "\n";
        return false;
    }
    return true;
}

void MiniaudioTrack::pause() {
    if (!loaded_) {
        return;
    }
    // Stopping keeps the cursor, so a later start resumes in place
    if (ma_sound_stop(&impl_->sound) != MA_SUCCESS) {
        std::cerr << "[MiniaudioTrack] Failed to stop " << path_ << "\n";
    }
}

bool MiniaudioTrack::isPaused() const {
    if (!loaded_) {
        return true;
    }
    return ma_sound_is_playing(&impl_->sound) == MA_FALSE;
}

void MiniaudioTrack::setVolume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    if (loaded_) {
        ma_sound_set_volume(&impl_->sound, volume_);
    }
}

void MiniaudioTrack::setLooping(bool loop) {
    looping_ = loop;
    if (loaded_) {
        ma_sound_set_looping(&impl_->sound, loop ? MA_TRUE : MA_FALSE);
    }
}

double MiniaudioTrack::position() const {
    if (!loaded_) {
        return 0.0;
    }
    float seconds = 0.0f;
    if (ma_sound_get_cursor_in_seconds(&impl_->sound, &seconds) != MA_SUCCESS) {
        return 0.0;
    }
    return seconds;
}

double MiniaudioTrack::duration() const {
    if (!loaded_) {
        return 0.0;
    }
    float seconds = 0.0f;
    if (ma_sound_get_length_in_seconds(&impl_->sound, &seconds) != MA_SUCCESS) {
        return 0.0;
    }
    return seconds;
}

void MiniaudioTrack::seek(double seconds) {
    if (!loaded_) {
        return;
    }

    ma_uint32 sampleRate = 0;
    if (ma_sound_get_data_format(&impl_->sound, nullptr, nullptr, &sampleRate, nullptr, 0) != MA_SUCCESS
        || sampleRate == 0) {
        return;
    }

    auto frame = static_cast<ma_uint64>(std::max(0.0, seconds) * sampleRate);
    if (ma_sound_seek_to_pcm_frame(&impl_->sound, frame) != MA_SUCCESS) {
        std::cerr << "[MiniaudioTrack] Seek failed on " << path_ << "\n";
    }
}

} // namespace keepsake::runtime
