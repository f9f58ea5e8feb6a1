// Keepsake - Fade Engine Implementation

#include <keepsake/fade.h>
#include <keepsake/easing.h>

namespace keepsake {

double FadeDescriptor::progress(double now) const {
    if (duration <= 0.0) {
        return 1.0;
    }
    return clamp01((now - startTime) / duration);
}

float FadeDescriptor::sample(double now) const {
    double p = progress(now);
    if (p >= 1.0) {
        return to;
    }
    if (p <= 0.0) {
        return from;
    }
    return lerp(from, to, easeInOut(static_cast<float>(p)));
}

bool FadeEngine::startFade(Channel ch, float from, float to, double durationMs, double now) {
    FadeDescriptor& f = m_fades[index(ch)];
    f.from = from;
    f.to = to;
    f.startTime = now;
    f.duration = durationMs;

    if (durationMs <= 0.0) {
        f.active = false;
        m_values[index(ch)] = to;
        return false;
    }

    f.active = true;
    m_values[index(ch)] = from;
    return true;
}

std::vector<FadeSample> FadeEngine::update(double now) {
    std::vector<FadeSample> samples;
    for (size_t i = 0; i < CHANNEL_COUNT; ++i) {
        FadeDescriptor& f = m_fades[i];
        if (!f.active) {
            continue;
        }
        float v = f.sample(now);
        m_values[i] = v;
        bool finished = f.progress(now) >= 1.0;
        if (finished) {
            f.active = false;
        }
        samples.push_back({static_cast<Channel>(i), v, finished});
    }
    return samples;
}

void FadeEngine::cancelAll() {
    for (auto& f : m_fades) {
        f.active = false;
    }
}

bool FadeEngine::needsUpdate() const {
    for (const auto& f : m_fades) {
        if (f.active) {
            return true;
        }
    }
    return false;
}

} // namespace keepsake
