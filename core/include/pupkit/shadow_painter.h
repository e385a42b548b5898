#pragma once

/**
 * @file shadow_painter.h
 * @brief Soft ground shadow that contracts and fades as the dog lifts
 */

#include <pupkit/breed_skeleton.h>
#include <glm/glm.hpp>

namespace pupkit {

class Canvas;

/// @brief Resolved shadow ellipse for a canvas size
struct ShadowGeometry {
    glm::vec2 center;
    float width;
    float height;
    float alpha;
};

/**
 * @brief Translucent ellipse under the dog, painted before the body
 */
class ShadowPainter {
public:
    ShadowPainter(const BreedSkeleton& skeleton, float verticalOffset);
    ShadowPainter(BreedSkeleton&&, float) = delete;

    /// @brief 1 on the ground, shrinking to 0.3 at 21 or more units of lift
    static float liftFactor(float verticalOffset);

    ShadowGeometry geometry(const glm::vec2& size) const;

    void paint(Canvas& canvas, const glm::vec2& size) const;

private:
    const BreedSkeleton* m_skeleton;
    float m_verticalOffset;
};

} // namespace pupkit
