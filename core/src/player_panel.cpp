// Keepsake - Player Panel Implementation

#include <keepsake/player_panel.h>
#include <keepsake/easing.h>
#include <cmath>
#include <utility>

namespace keepsake {

PlayerPanel::PlayerPanel(AudioController& audio)
    : m_audio(audio)
{
    m_info[static_cast<size_t>(Channel::Ambient)] = {"4 O'Clock", "Instrumental"};
    m_info[static_cast<size_t>(Channel::Final)] = {"Beautiful", "Finale"};
}

void PlayerPanel::setTrackInfo(Channel ch, TrackInfo info) {
    m_info[static_cast<size_t>(ch)] = std::move(info);
}

std::string PlayerPanel::formatTime(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "0:00";
    }
    long total = static_cast<long>(std::floor(seconds));
    long m = total / 60;
    long s = total % 60;
    return std::to_string(m) + ":" + (s < 10 ? "0" : "") + std::to_string(s);
}

PlayerReadout PlayerPanel::readout(Scene scene) const {
    Channel ch = channelFor(scene);
    const AudioTrack& track = m_audio.track(ch);

    PlayerReadout r;
    r.channel = ch;
    r.title = trackInfo(ch).title;
    r.artist = trackInfo(ch).artist;

    double dur = track.duration();
    double cur = track.position();
    if (!std::isfinite(dur) || dur < 0.0) dur = 0.0;
    if (!std::isfinite(cur) || cur < 0.0) cur = 0.0;

    r.duration = formatTime(dur);
    if (m_seeking && dur > 0.0) {
        r.elapsed = formatTime(m_seekFraction * dur);
        r.seekFraction = m_seekFraction;
    } else {
        r.elapsed = formatTime(cur);
        r.seekFraction = dur > 0.0 ? static_cast<float>(clamp01(cur / dur)) : 0.0f;
    }
    r.playing = m_audio.isPlaying(ch);
    return r;
}

bool PlayerPanel::toggle(Scene scene) {
    return m_audio.togglePlayback(channelFor(scene));
}

void PlayerPanel::beginSeek(float fraction) {
    m_seeking = true;
    m_seekFraction = clamp01(fraction);
}

void PlayerPanel::commitSeek(Scene scene) {
    if (!m_seeking) {
        return;
    }
    m_audio.seek(channelFor(scene), m_seekFraction);
    m_seeking = false;
}

} // namespace keepsake
