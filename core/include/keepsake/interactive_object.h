#pragma once

/**
 * @file interactive_object.h
 * @brief Tappable memory objects and their idle motion
 */

#include <string>

namespace keepsake {

/**
 * @brief Visual offsets applied on top of an object's layout position
 */
struct IdlePose {
    float offsetY = 0.0f;       ///< px
    float rotation = 0.0f;      ///< degrees
    float scale = 1.0f;
    float opacity = 1.0f;
};

/**
 * @brief One discoverable object in the World scene
 *
 * The idle seed desynchronizes the float/sway/breathe cycles between objects.
 * Discovery is one-way: once discovered, an object never reverts.
 */
class InteractiveObject {
public:
    /// @brief Length of the tap bounce
    static constexpr double TAP_ANIM_MS = 620.0;

    InteractiveObject(std::string id, float idleSeed);

    const std::string& id() const { return m_id; }
    float idleSeed() const { return m_idleSeed; }

    bool isDiscovered() const { return m_discovered; }
    void markDiscovered() { m_discovered = true; }

    /// @brief Start the short bounce shown on every tap
    void playTapAnimation(double now);
    bool isTapAnimating() const { return m_tapActive; }

    /**
     * @brief Recompute the idle pose
     * @param reducedMotion Skip float/sway/breathe; keep the tap bounce
     */
    void update(double now, bool reducedMotion = false);

    const IdlePose& pose() const { return m_pose; }

private:
    std::string m_id;
    float m_idleSeed = 0.0f;
    bool m_discovered = false;

    bool m_tapActive = false;
    double m_tapStart = 0.0;

    IdlePose m_pose;
};

} // namespace keepsake
