#pragma once

/**
 * @file breed_skeleton.h
 * @brief Immutable per-breed proportions and colors
 *
 * A BreedSkeleton is plain data. The animation controller and the body
 * painter read it and contain no breed-specific constants of their own; every
 * visual difference between breeds comes from these fields.
 */

#include <pupkit/color.h>
#include <string>

namespace pupkit {

/**
 * @brief Proportions, markings and colors of one breed
 *
 * Ratios are relative to a reference dog (German Shepherd, heightScale 1.0).
 * Instances are owned by a BreedRegistry and shared read-only.
 *
 * | Field | Range | Notes |
 * |-------|-------|-------|
 * | heightScale | 0.4-1.1 | overall size |
 * | torsoAspectRatio | 0-4 | torso width / height (Dachshund 3.2) |
 * | legLengthRatio | 0.1-0.7 | fraction of reference height (Corgi 0.2) |
 * | legThicknessRatio | 0-1 | fraction of torso width |
 * | headSizeRatio | 0-1 | head diameter / torso height |
 * | snoutLengthRatio | 0-1 | muzzle length / head diameter (Bulldog 0.05) |
 * | earHeightRatio | 0-1 | ear height / head diameter |
 * | tailLengthRatio | 0-1 | tail length / torso height |
 * | animationSpeedMultiplier | 0.5-2.0 | scales every oscillator |
 */
struct BreedSkeleton {
    std::string breedId;

    float heightScale = 1.0f;
    float torsoAspectRatio = 1.4f;
    float legLengthRatio = 0.45f;
    float legThicknessRatio = 0.18f;
    float headSizeRatio = 0.45f;
    float snoutLengthRatio = 0.45f;
    float earHeightRatio = 0.6f;
    float tailLengthRatio = 0.45f;

    bool earsFloppy = false;
    bool tailCurledOverBack = false;
    bool hasFlatFace = false;
    bool hasSpots = false;
    bool hasPoodleFuzz = false;

    Color primaryColor;    ///< Main body coat
    Color secondaryColor;  ///< Belly, muzzle, paws, markings
    Color accentColor;     ///< Nose, brows, inner ears

    float animationSpeedMultiplier = 1.0f;

    bool operator==(const BreedSkeleton& o) const;
    bool operator!=(const BreedSkeleton& o) const { return !(*this == o); }
};

/**
 * @brief Check a skeleton against the documented ranges
 * @param skeleton Skeleton to check
 * @param error Receives a description of the first violation
 * @return true if every field is in range and the id is non-empty
 */
bool validateSkeleton(const BreedSkeleton& skeleton, std::string& error);

} // namespace pupkit
