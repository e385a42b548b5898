#pragma once

/**
 * @file dog_body_painter.h
 * @brief Layered clay-toy renderer for one companion pose
 *
 * Every shape is drawn twice: a dark outline stroke, then the fill. Far-side
 * parts (back legs, far ear) are darkened and thinned by kDepthMultiplier.
 *
 * Draw order, back to front:
 * 1. back legs
 * 2. torso, belly patch, breed markings
 * 3. tail
 * 4. neck and head (far ear, head, muzzle, face, near ear)
 * 5. front legs
 */

#include <pupkit/breed_skeleton.h>
#include <pupkit/dog_bone_transform.h>
#include <pupkit/dog_expression.h>
#include <glm/glm.hpp>

namespace pupkit {

class Canvas;

/**
 * @brief Layout metrics derived once per paint from canvas size and breed ratios
 */
struct BodyMetrics {
    float torsoW = 0;
    float torsoH = 0;
    float legLen = 0;
    float legThick = 0;
    float headR = 0;
    float earW = 0;
    float earH = 0;
    float tailLen = 0;
    float muzzleW = 0;
    float outlineW = 0;
    /// Pixels per verticalOffset unit (offsets are authored for a 200px canvas)
    float offsetScale = 1;

    /// Uniform shrink applied to the lengths above so the figure fits the region
    float fit = 1;
    /// Distance from the torso center down to the bottom of a standing paw
    float reachBelow = 0;
    /// Y of the ground line the paws stand on at zero verticalOffset
    float groundY = 0;

    static BodyMetrics compute(const glm::vec2& size, const BreedSkeleton& skeleton);
};

/**
 * @brief Pure renderer of (skeleton, transform, expression)
 *
 * Holds no state beyond its three inputs. The skeleton is borrowed.
 * The figure is drawn facing +x; a transform facing left is mirrored
 * across the region's vertical center line.
 *
 * @par Example
 * @code
 * DogBodyPainter painter(controller.skeleton(), controller.transform(),
 *                        controller.expression());
 * if (painter.shouldRepaint(lastPainter)) {
 *     painter.paint(canvas, {canvas.width(), canvas.height()});
 * }
 * @endcode
 */
class DogBodyPainter {
public:
    static constexpr float kDepthMultiplier = 0.88f;

    DogBodyPainter(const BreedSkeleton& skeleton, const DogBoneTransform& transform,
                   DogExpression expression);
    DogBodyPainter(BreedSkeleton&&, const DogBoneTransform&, DogExpression) = delete;

    /**
     * @brief Draw the dog into a canvas region starting at the origin
     * @param canvas Target canvas; its state is restored afterwards
     * @param size Region size in pixels
     */
    void paint(Canvas& canvas, const glm::vec2& size) const;

    /// @brief True if the skeleton, transform or expression differs from old
    bool shouldRepaint(const DogBodyPainter& old) const;

    const BreedSkeleton& skeleton() const { return *m_skeleton; }
    const DogBoneTransform& transform() const { return m_transform; }
    DogExpression expression() const { return m_expression; }

private:
    void drawLeg(Canvas& canvas, const BodyMetrics& m, float angle, float kneeAngle,
                 float offsetX, bool isBack) const;
    void drawPaw(Canvas& canvas, const BodyMetrics& m, float depth, float outlineW) const;
    void drawTorso(Canvas& canvas, const BodyMetrics& m) const;
    void drawMarkings(Canvas& canvas, const BodyMetrics& m) const;
    void drawTail(Canvas& canvas, const BodyMetrics& m) const;
    void drawHead(Canvas& canvas, const BodyMetrics& m) const;
    void drawEar(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc, float side, bool far) const;
    void drawMuzzle(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const;
    void drawFace(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const;
    void drawMouth(Canvas& canvas, const BodyMetrics& m, const glm::vec2& hc) const;

    const BreedSkeleton* m_skeleton;
    DogBoneTransform m_transform;
    DogExpression m_expression;
};

} // namespace pupkit
