#pragma once

/**
 * @file easing.h
 * @brief Scalar helpers shared by every time-based animation
 */

#include <algorithm>

namespace keepsake {

inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

inline double clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

inline float lerp(float a, float b, float t) { return a + (b - a) * t; }

/**
 * @brief Quadratic ease-in-out
 * @param t Progress in [0, 1]
 * @return 0 at t=0, 1 at t=1, symmetric around 0.5
 */
inline float easeInOut(float t) {
    if (t < 0.5f) {
        return 2.0f * t * t;
    }
    float u = -2.0f * t + 2.0f;
    return 1.0f - (u * u) / 2.0f;
}

} // namespace keepsake
