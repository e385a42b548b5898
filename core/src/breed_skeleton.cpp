#include <pupkit/breed_skeleton.h>
#include <cmath>
#include <sstream>

namespace pupkit {

bool BreedSkeleton::operator==(const BreedSkeleton& o) const {
    return breedId == o.breedId &&
           heightScale == o.heightScale &&
           torsoAspectRatio == o.torsoAspectRatio &&
           legLengthRatio == o.legLengthRatio &&
           legThicknessRatio == o.legThicknessRatio &&
           headSizeRatio == o.headSizeRatio &&
           snoutLengthRatio == o.snoutLengthRatio &&
           earHeightRatio == o.earHeightRatio &&
           tailLengthRatio == o.tailLengthRatio &&
           earsFloppy == o.earsFloppy &&
           tailCurledOverBack == o.tailCurledOverBack &&
           hasFlatFace == o.hasFlatFace &&
           hasSpots == o.hasSpots &&
           hasPoodleFuzz == o.hasPoodleFuzz &&
           primaryColor == o.primaryColor &&
           secondaryColor == o.secondaryColor &&
           accentColor == o.accentColor &&
           animationSpeedMultiplier == o.animationSpeedMultiplier;
}

namespace {

struct RangeCheck {
    const char* field;
    float value;
    float min;
    float max;
    bool minExclusive;
};

} // namespace

bool validateSkeleton(const BreedSkeleton& s, std::string& error) {
    if (s.breedId.empty()) {
        error = "breed id is empty";
        return false;
    }

    const RangeCheck checks[] = {
        {"heightScale",              s.heightScale,              0.4f, 1.1f, false},
        {"torsoAspectRatio",         s.torsoAspectRatio,         0.0f, 4.0f, true},
        {"legLengthRatio",           s.legLengthRatio,           0.1f, 0.7f, false},
        {"legThicknessRatio",        s.legThicknessRatio,        0.0f, 1.0f, true},
        {"headSizeRatio",            s.headSizeRatio,            0.0f, 1.0f, true},
        {"snoutLengthRatio",         s.snoutLengthRatio,         0.0f, 1.0f, true},
        {"earHeightRatio",           s.earHeightRatio,           0.0f, 1.0f, true},
        {"tailLengthRatio",          s.tailLengthRatio,          0.0f, 1.0f, true},
        {"animationSpeedMultiplier", s.animationSpeedMultiplier, 0.5f, 2.0f, false},
    };

    for (const auto& c : checks) {
        bool belowMin = c.minExclusive ? c.value <= c.min : c.value < c.min;
        if (!std::isfinite(c.value) || belowMin || c.value > c.max) {
            std::ostringstream msg;
            msg << "breed '" << s.breedId << "': " << c.field << " = " << c.value
                << " is outside " << (c.minExclusive ? "(" : "[")
                << c.min << ", " << c.max << "]";
            error = msg.str();
            return false;
        }
    }
    return true;
}

} // namespace pupkit
