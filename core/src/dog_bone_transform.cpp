#include <pupkit/dog_bone_transform.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace pupkit {

using glm::mix;

DogBoneTransform DogBoneTransform::lerp(const DogBoneTransform& a, const DogBoneTransform& b, float t) {
    // NaN collapses to the start pose
    if (!(t > 0.0f)) {
        t = 0.0f;
    }
    t = glm::clamp(t, 0.0f, 1.0f);

    DogBoneTransform r;
    r.torsoAngle = mix(a.torsoAngle, b.torsoAngle, t);
    r.headAngle = mix(a.headAngle, b.headAngle, t);
    r.tailAngle = mix(a.tailAngle, b.tailAngle, t);
    r.frontLeftLegAngle = mix(a.frontLeftLegAngle, b.frontLeftLegAngle, t);
    r.frontRightLegAngle = mix(a.frontRightLegAngle, b.frontRightLegAngle, t);
    r.backLeftLegAngle = mix(a.backLeftLegAngle, b.backLeftLegAngle, t);
    r.backRightLegAngle = mix(a.backRightLegAngle, b.backRightLegAngle, t);
    r.frontLeftKneeAngle = mix(a.frontLeftKneeAngle, b.frontLeftKneeAngle, t);
    r.frontRightKneeAngle = mix(a.frontRightKneeAngle, b.frontRightKneeAngle, t);
    r.backLeftKneeAngle = mix(a.backLeftKneeAngle, b.backLeftKneeAngle, t);
    r.backRightKneeAngle = mix(a.backRightKneeAngle, b.backRightKneeAngle, t);
    r.verticalOffset = mix(a.verticalOffset, b.verticalOffset, t);
    r.isFacingRight = t >= 0.5f ? b.isFacingRight : a.isFacingRight;
    return r;
}

bool DogBoneTransform::isFinite() const {
    const float fields[] = {
        torsoAngle, headAngle, tailAngle,
        frontLeftLegAngle, frontRightLegAngle, backLeftLegAngle, backRightLegAngle,
        frontLeftKneeAngle, frontRightKneeAngle, backLeftKneeAngle, backRightKneeAngle,
        verticalOffset,
    };
    return std::all_of(std::begin(fields), std::end(fields),
                       [](float v) { return std::isfinite(v); });
}

bool DogBoneTransform::operator==(const DogBoneTransform& o) const {
    return torsoAngle == o.torsoAngle &&
           headAngle == o.headAngle &&
           tailAngle == o.tailAngle &&
           frontLeftLegAngle == o.frontLeftLegAngle &&
           frontRightLegAngle == o.frontRightLegAngle &&
           backLeftLegAngle == o.backLeftLegAngle &&
           backRightLegAngle == o.backRightLegAngle &&
           frontLeftKneeAngle == o.frontLeftKneeAngle &&
           frontRightKneeAngle == o.frontRightKneeAngle &&
           backLeftKneeAngle == o.backLeftKneeAngle &&
           backRightKneeAngle == o.backRightKneeAngle &&
           verticalOffset == o.verticalOffset &&
           isFacingRight == o.isFacingRight;
}

} // namespace pupkit
