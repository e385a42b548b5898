#pragma once

/**
 * @file dog_animation_state.h
 * @brief Closed set of companion animation states
 */

#include <string>

namespace pupkit {

/**
 * @brief Animation state of a companion
 *
 * States change only through explicit DogAnimationController calls. There
 * are no time-based transitions.
 */
enum class DogAnimationState {
    Idle,
    Walking,
    Sitting,
    TailWag,
    HeadTilt,
    Petting,
    Zoomies,
    Sleeping
};

/// @brief Number of DogAnimationState values
constexpr int kAnimationStateCount = 8;

/// @brief Stable lowercase name ("idle", "tail_wag", ...)
const char* stateName(DogAnimationState state);

/**
 * @brief Parse a state name produced by stateName()
 * @param name Lowercase state name
 * @param out Parsed state (untouched on failure)
 * @return false if the name is not a state
 */
bool parseState(const std::string& name, DogAnimationState& out);

/**
 * @brief Map an ambient mood key to a state
 *
 * tail_wag and head_tilt select their states, zoomies sets the dog walking,
 * sit and nap select Sitting and Sleeping. yawn, idle and any other key map
 * to Idle.
 */
DogAnimationState stateFromMoodKey(const std::string& key);

} // namespace pupkit
