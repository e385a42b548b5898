#include <pupkit/dog_animation_state.h>

namespace pupkit {

namespace {

const DogAnimationState kAllStates[kAnimationStateCount] = {
    DogAnimationState::Idle,
    DogAnimationState::Walking,
    DogAnimationState::Sitting,
    DogAnimationState::TailWag,
    DogAnimationState::HeadTilt,
    DogAnimationState::Petting,
    DogAnimationState::Zoomies,
    DogAnimationState::Sleeping,
};

} // namespace

const char* stateName(DogAnimationState state) {
    switch (state) {
        case DogAnimationState::Idle:     return "idle";
        case DogAnimationState::Walking:  return "walking";
        case DogAnimationState::Sitting:  return "sitting";
        case DogAnimationState::TailWag:  return "tail_wag";
        case DogAnimationState::HeadTilt: return "head_tilt";
        case DogAnimationState::Petting:  return "petting";
        case DogAnimationState::Zoomies:  return "zoomies";
        case DogAnimationState::Sleeping: return "sleeping";
    }
    return "idle";
}

bool parseState(const std::string& name, DogAnimationState& out) {
    for (auto state : kAllStates) {
        if (name == stateName(state)) {
            out = state;
            return true;
        }
    }
    return false;
}

DogAnimationState stateFromMoodKey(const std::string& key) {
    if (key == "tail_wag") return DogAnimationState::TailWag;
    if (key == "head_tilt") return DogAnimationState::HeadTilt;
    if (key == "zoomies") return DogAnimationState::Walking;
    if (key == "sit") return DogAnimationState::Sitting;
    if (key == "nap") return DogAnimationState::Sleeping;
    // "idle", "yawn" and anything unrecognized
    return DogAnimationState::Idle;
}

} // namespace pupkit
