#pragma once

/**
 * @file dog_bone_transform.h
 * @brief One frame's pose snapshot
 */

namespace pupkit {

/**
 * @brief Pose of every animated bone for one frame
 *
 * Angles are radians. Positive leg angles swing the paw forward, positive
 * knee angles bend the lower leg back. verticalOffset lifts the body, in
 * reference pixels of a 200px tall canvas.
 */
struct DogBoneTransform {
    float torsoAngle = 0.0f;
    float headAngle = 0.0f;
    float tailAngle = 0.0f;

    float frontLeftLegAngle = 0.0f;
    float frontRightLegAngle = 0.0f;
    float backLeftLegAngle = 0.0f;
    float backRightLegAngle = 0.0f;

    float frontLeftKneeAngle = 0.0f;
    float frontRightKneeAngle = 0.0f;
    float backLeftKneeAngle = 0.0f;
    float backRightKneeAngle = 0.0f;

    float verticalOffset = 0.0f;
    bool isFacingRight = true;

    /// @brief All-zero pose facing right
    static DogBoneTransform neutral() { return DogBoneTransform{}; }

    /**
     * @brief Interpolate between two poses
     * @param a Pose at t = 0
     * @param b Pose at t = 1
     * @param t Clamped to [0, 1]; isFacingRight switches at t >= 0.5
     */
    static DogBoneTransform lerp(const DogBoneTransform& a, const DogBoneTransform& b, float t);

    /// @brief True if every float field is finite
    bool isFinite() const;

    bool operator==(const DogBoneTransform& o) const;
    bool operator!=(const DogBoneTransform& o) const { return !(*this == o); }
};

} // namespace pupkit
