// Keepsake - Audio Controller Implementation

#include <keepsake/audio_controller.h>
#include <keepsake/easing.h>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

namespace keepsake {

namespace {
constexpr float SILENT = 0.0001f;
constexpr float AUDIBLE = 0.0005f;
constexpr float CHIME_LEVEL = 0.35f;
} // namespace

AudioController::AudioController(AudioTrack& ambient, AudioTrack& final, AudioTrack* chime,
                                 AudioTuning tuning)
    : m_ambient(ambient)
    , m_final(final)
    , m_chime(chime)
    , m_tuning(tuning)
{
    m_ambient.setLooping(true);
    m_final.setLooping(true);
    m_ambient.setVolume(0.0f);
    m_final.setVolume(0.0f);
    if (m_chime) {
        m_chime->setLooping(false);
    }
}

float AudioController::targetLevel(Channel ch) const {
    return ch == Channel::Ambient ? m_tuning.ambientLevel : m_tuning.finalLevel;
}

// -----------------------------------------------------------------------------
// Transitions
// -----------------------------------------------------------------------------

bool AudioController::unlock(Channel target, double now) {
    if (m_enabled) {
        return true;
    }
    m_enabled = true;

    if (m_muted) {
        std::cout << "[Audio] Unlocked while muted, playback deferred" << std::endl;
        return true;
    }

    if (!tryPlay(track(target), channelName(target))) {
        // Host refused; stay locked so the next gesture can retry
        m_enabled = false;
        return false;
    }

    m_userPaused[idx(target)] = false;
    double dur = target == Channel::Ambient ? m_tuning.ambientUnlockMs : m_tuning.finalUnlockMs;
    startFade(target, 0.0f, targetLevel(target), dur, now);
    std::cout << "[Audio] Unlocked (" << channelName(target) << ")" << std::endl;
    return true;
}

bool AudioController::switchTo(Channel target, double now) {
    if (!m_enabled || m_muted) {
        return false;
    }

    AudioTrack& t = track(target);
    if (t.isPaused() && !tryPlay(t, channelName(target))) {
        // Keep the current mix
        return false;
    }
    m_userPaused[idx(target)] = false;

    Channel other = otherChannel(target);
    double dur = target == Channel::Final ? m_tuning.toFinalMs : m_tuning.toAmbientMs;
    startFade(other, base(other), 0.0f, dur, now);
    startFade(target, base(target), targetLevel(target), dur, now);
    return true;
}

bool AudioController::resume(Channel target, double now) {
    if (!m_enabled || m_muted) {
        return false;
    }
    if (!tryPlay(track(target), channelName(target))) {
        return false;
    }
    m_userPaused[idx(target)] = false;

    Channel other = otherChannel(target);
    double dur = target == Channel::Ambient ? m_tuning.ambientUnlockMs : m_tuning.finalUnlockMs;
    startFade(other, base(other), 0.0f, dur, now);
    startFade(target, base(target), targetLevel(target), dur, now);
    return true;
}

void AudioController::setMuted(bool muted) {
    m_muted = muted;
    if (!muted) {
        return;
    }

    m_fades.cancelAll();
    for (Channel ch : {Channel::Ambient, Channel::Final}) {
        m_base[idx(ch)] = 0.0f;
        track(ch).setVolume(0.0f);
        tryPause(track(ch), channelName(ch));
    }
}

void AudioController::setMasterVolume(float volume) {
    m_master = clamp01(volume);
    if (!m_enabled || m_muted) {
        return;
    }
    applyLevel(Channel::Ambient);
    applyLevel(Channel::Final);
}

// -----------------------------------------------------------------------------
// Per-frame
// -----------------------------------------------------------------------------

void AudioController::update(double now) {
    if (!m_enabled || m_muted) {
        return;
    }

    for (const FadeSample& s : m_fades.update(now)) {
        m_base[idx(s.channel)] = s.value;
        applyLevel(s.channel);

        if (s.finished && m_fades.descriptor(s.channel).to <= SILENT) {
            // Silent is not enough; release the stream
            tryPause(track(s.channel), channelName(s.channel));
        }
    }
}

bool AudioController::watchdog(double now) {
    if (m_watchdogRan && now - m_lastWatchdog < m_tuning.watchdogIntervalMs) {
        return false;
    }
    m_watchdogRan = true;
    m_lastWatchdog = now;
    ensurePlayback();
    return true;
}

int AudioController::ensurePlayback() {
    if (!m_enabled || m_muted || m_master <= SILENT) {
        return 0;
    }

    int restarted = 0;
    for (Channel ch : {Channel::Ambient, Channel::Final}) {
        const FadeDescriptor& f = m_fades.descriptor(ch);
        bool need = m_base[idx(ch)] * m_master > AUDIBLE || (f.active && f.to > AUDIBLE);
        if (!need || m_userPaused[idx(ch)]) {
            continue;
        }
        AudioTrack& t = track(ch);
        if (t.isPaused() && tryPlay(t, channelName(ch))) {
            std::cout << "[Audio] Recovered suspended " << channelName(ch) << " playback" << std::endl;
            ++restarted;
        }
    }
    return restarted;
}

// -----------------------------------------------------------------------------
// Player controls
// -----------------------------------------------------------------------------

void AudioController::playChime() {
    if (!m_enabled || m_muted || !m_chime) {
        return;
    }
    m_chime->seek(0.0);
    m_chime->setVolume(clamp01(CHIME_LEVEL * m_master));
    tryPlay(*m_chime, "chime");
}

bool AudioController::togglePlayback(Channel ch) {
    if (!m_enabled || m_muted) {
        return isPlaying(ch);
    }

    AudioTrack& t = track(ch);
    if (t.isPaused()) {
        if (tryPlay(t, channelName(ch))) {
            m_userPaused[idx(ch)] = false;
        }
    } else {
        tryPause(t, channelName(ch));
        m_userPaused[idx(ch)] = true;
    }
    return isPlaying(ch);
}

void AudioController::seek(Channel ch, float fraction) {
    AudioTrack& t = track(ch);
    double dur = t.duration();
    if (dur > 0.0) {
        t.seek(clamp01(fraction) * dur);
    }
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------

float AudioController::level(Channel ch) const {
    if (m_muted) {
        return 0.0f;
    }
    return clamp01(m_base[idx(ch)] * m_master);
}

bool AudioController::isPlaying(Channel ch) const {
    return !track(ch).isPaused();
}

ChannelState AudioController::state(Channel ch) const {
    if (m_fades.isActive(ch)) {
        const FadeDescriptor& f = m_fades.descriptor(ch);
        if (f.to > f.from) return ChannelState::FadingIn;
        if (f.to < f.from) return ChannelState::FadingOut;
    }
    if (track(ch).isPaused() || level(ch) <= SILENT) {
        return ChannelState::Stopped;
    }
    return ChannelState::Holding;
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

bool AudioController::tryPlay(AudioTrack& t, const char* what) {
    bool ok = false;
    try {
        ok = t.play();
    } catch (const std::exception& e) {
        std::cerr << "[Audio] " << what << " play() threw: " << e.what() << std::endl;
        ok = false;
    }
    if (!ok) {
        std::cerr << "[Audio] Playback refused for " << what << std::endl;
    }
    return ok;
}

void AudioController::tryPause(AudioTrack& t, const char* what) {
    try {
        t.pause();
    } catch (const std::exception& e) {
        std::cerr << "[Audio] " << what << " pause() threw: " << e.what() << std::endl;
    }
}

void AudioController::applyLevel(Channel ch) {
    track(ch).setVolume(level(ch));
}

void AudioController::startFade(Channel ch, float from, float to, double durationMs, double now) {
    if (!m_fades.startFade(ch, from, to, durationMs, now)) {
        // Snapped: apply immediately
        m_base[idx(ch)] = to;
        applyLevel(ch);
        if (to <= SILENT) {
            tryPause(track(ch), channelName(ch));
        }
        return;
    }
    m_base[idx(ch)] = from;
    applyLevel(ch);
}

} // namespace keepsake
