#pragma once

/**
 * @file fade.h
 * @brief Per-channel eased value ramps
 *
 * The fade engine owns one descriptor per audio channel. Starting a fade on a
 * channel replaces whatever that channel was doing (last writer wins).
 */

#include <array>
#include <cstddef>
#include <vector>

namespace keepsake {

/**
 * @brief Logical audio channels
 */
enum class Channel {
    Ambient = 0,    ///< World/intro music
    Final = 1       ///< Finale music
};

constexpr size_t CHANNEL_COUNT = 2;

inline const char* channelName(Channel ch) {
    switch (ch) {
        case Channel::Ambient: return "ambient";
        case Channel::Final:   return "final";
        default:               return "unknown";
    }
}

inline Channel otherChannel(Channel ch) {
    return ch == Channel::Ambient ? Channel::Final : Channel::Ambient;
}

/**
 * @brief One in-flight ramp
 */
struct FadeDescriptor {
    float from = 0.0f;
    float to = 0.0f;
    double startTime = 0.0;     ///< ms
    double duration = 0.0;      ///< ms
    bool active = false;

    /**
     * @brief Evaluate the ramp at a point in time
     *
     * Returns exactly `from` at startTime and exactly `to` from
     * startTime + duration onwards.
     */
    float sample(double now) const;

    /// @brief Linear progress in [0, 1]
    double progress(double now) const;
};

/**
 * @brief Value produced for one channel by FadeEngine::update()
 */
struct FadeSample {
    Channel channel;
    float value;
    bool finished;      ///< This update completed the fade
};

/**
 * @brief Eased fades for the two audio channels
 *
 * @par Example
 * @code
 * FadeEngine fades;
 * fades.startFade(Channel::Ambient, 0.0f, 0.14f, 2000.0, ctx.time());
 * for (const auto& s : fades.update(ctx.time())) {
 *     track(s.channel).setVolume(s.value);
 * }
 * @endcode
 */
class FadeEngine {
public:
    /**
     * @brief Start (or replace) the fade on a channel
     * @param durationMs Non-positive durations snap to `to` immediately
     * @return true if the fade is running, false if it snapped
     */
    bool startFade(Channel ch, float from, float to, double durationMs, double now);

    /**
     * @brief Advance every active fade
     * @return One sample per channel that was active before this call
     */
    std::vector<FadeSample> update(double now);

    void cancel(Channel ch) { m_fades[index(ch)].active = false; }
    void cancelAll();

    /// @brief False once no fade is active, so callers can skip per-frame work
    bool needsUpdate() const;

    bool isActive(Channel ch) const { return m_fades[index(ch)].active; }
    const FadeDescriptor& descriptor(Channel ch) const { return m_fades[index(ch)]; }

    /// @brief Last value produced for the channel
    float value(Channel ch) const { return m_values[index(ch)]; }

private:
    static size_t index(Channel ch) { return static_cast<size_t>(ch); }

    std::array<FadeDescriptor, CHANNEL_COUNT> m_fades{};
    std::array<float, CHANNEL_COUNT> m_values{};
};

} // namespace keepsake
