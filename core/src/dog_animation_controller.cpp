// Dog Animation Controller
// Procedural gait, breathing and wag synthesis

#include <pupkit/dog_animation_controller.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pupkit {

namespace {

const float kTwoPi = glm::two_pi<float>();
const float kPi = glm::pi<float>();

// Every frequency below is a multiple of 0.1 Hz so the 10 s wrap is seamless

inline float wave(float hz, float t, float phase = 0.0f) {
    return std::sin(kTwoPi * hz * t + phase);
}

// 0..amplitude breathing rise
inline float breath(float amplitude, float hz, float t) {
    return amplitude * (1.0f + wave(hz, t)) * 0.5f;
}

struct GaitParams {
    float hz;
    float legSwing;
    float kneeBend;
    float bounce;
    float torsoRock;
    float headBob;
    float tailSwing;
};

constexpr GaitParams kWalkGait    {1.0f, 0.45f, 0.25f, 4.0f, 0.04f, 0.05f, 0.5f};
constexpr GaitParams kZoomiesGait {2.0f, 0.60f, 0.40f, 8.0f, 0.06f, 0.08f, 0.8f};

// Back legs trail their diagonal front leg slightly
const float kBackLegLag = kPi / 8.0f;
// Knees bend during the forward swing of their parent leg
const float kKneeLead = kPi / 4.0f;

void trot(const GaitParams& p, float t, DogBoneTransform& out) {
    float g = kTwoPi * p.hz * t;

    float frontRight = g;
    float frontLeft = g + kPi;
    float backLeft = frontRight - kBackLegLag;
    float backRight = frontLeft - kBackLegLag;

    out.frontRightLegAngle = p.legSwing * std::sin(frontRight);
    out.frontLeftLegAngle = p.legSwing * std::sin(frontLeft);
    out.backLeftLegAngle = p.legSwing * std::sin(backLeft);
    out.backRightLegAngle = p.legSwing * std::sin(backRight);

    out.frontRightKneeAngle = p.kneeBend * std::max(0.0f, std::sin(frontRight + kKneeLead));
    out.frontLeftKneeAngle = p.kneeBend * std::max(0.0f, std::sin(frontLeft + kKneeLead));
    out.backLeftKneeAngle = p.kneeBend * std::max(0.0f, std::sin(backLeft + kKneeLead));
    out.backRightKneeAngle = p.kneeBend * std::max(0.0f, std::sin(backRight + kKneeLead));

    // Body rises twice per stride
    out.torsoAngle = p.torsoRock * std::sin(2.0f * g);
    out.headAngle = p.headBob * std::sin(2.0f * g);
    out.tailAngle = p.tailSwing * std::sin(g);
    out.verticalOffset = p.bounce * (1.0f + std::sin(2.0f * g)) * 0.5f;
}

} // namespace

// -------------------------------------------------------------------------
// Construction
// -------------------------------------------------------------------------

DogAnimationController::DogAnimationController(const BreedSkeleton& skeleton)
    : DogAnimationController(skeleton, Settings{}) {}

DogAnimationController::DogAnimationController(const BreedSkeleton& skeleton,
                                               const Settings& settings)
    : m_skeleton(&skeleton)
    , m_settings(settings) {
    if (!std::isfinite(settings.blendDuration) || settings.blendDuration < 0.0f) {
        throw std::runtime_error("DogAnimationController: blendDuration must be >= 0");
    }
    if (!std::isfinite(settings.maxFrameDelta) || settings.maxFrameDelta <= 0.0f) {
        throw std::runtime_error("DogAnimationController: maxFrameDelta must be > 0");
    }
    commit();
}

// -------------------------------------------------------------------------
// Pose synthesis
// -------------------------------------------------------------------------

DogBoneTransform DogAnimationController::poseFor(DogAnimationState state, float t, bool facingRight) {
    DogBoneTransform p;
    p.isFacingRight = facingRight;

    switch (state) {
        case DogAnimationState::Idle:
            p.verticalOffset = breath(3.0f, 0.6f, t);
            p.tailAngle = 0.08f * wave(0.5f, t);
            break;

        case DogAnimationState::Walking:
            trot(kWalkGait, t, p);
            break;

        case DogAnimationState::Zoomies:
            trot(kZoomiesGait, t, p);
            break;

        case DogAnimationState::Sitting:
            // Haunches folded under, front legs planted
            p.backLeftLegAngle = 1.2f;
            p.backRightLegAngle = 1.2f;
            p.backLeftKneeAngle = 0.8f;
            p.backRightKneeAngle = 0.8f;
            p.torsoAngle = 0.08f;
            p.headAngle = -0.05f;
            p.tailAngle = 0.15f * wave(0.5f, t);
            p.verticalOffset = -4.0f + breath(1.0f, 0.6f, t);
            break;

        case DogAnimationState::TailWag:
            p.tailAngle = 0.9f * wave(4.0f, t);
            p.torsoAngle = 0.03f * wave(4.0f, t, kPi);
            p.headAngle = 0.04f * wave(2.0f, t);
            p.verticalOffset = breath(2.0f, 0.6f, t);
            break;

        case DogAnimationState::HeadTilt:
            p.headAngle = 0.35f * wave(0.5f, t);
            p.tailAngle = 0.15f * wave(1.0f, t);
            p.verticalOffset = breath(2.0f, 0.6f, t);
            break;

        case DogAnimationState::Petting:
            // Leaning into the hand, tail at full wag
            p.tailAngle = 1.1f * wave(5.0f, t);
            p.headAngle = -0.10f;
            p.verticalOffset = breath(3.0f, 0.6f, t);
            break;

        case DogAnimationState::Sleeping:
            p.verticalOffset = -6.0f + breath(1.0f, 0.3f, t);
            break;
    }
    return p;
}

// -------------------------------------------------------------------------
// Frame update
// -------------------------------------------------------------------------

void DogAnimationController::tick(float dt) {
    if (m_disposed || !std::isfinite(dt) || dt < 0.0f) {
        return;
    }
    dt = std::min(dt, m_settings.maxFrameDelta);

    m_elapsed += dt;
    m_stateTime = std::fmod(m_stateTime + dt * m_skeleton->animationSpeedMultiplier, kPhasePeriod);
    if (m_blending) {
        m_blendTime += dt;
    }
    commit();
}

void DogAnimationController::commit() {
    DogBoneTransform pose = poseFor(m_state, m_stateTime, m_facingRight);
    if (m_blending) {
        float k = glm::smoothstep(0.0f, m_settings.blendDuration, m_blendTime);
        if (k >= 1.0f) {
            m_blending = false;
        } else {
            DogBoneTransform target = pose;
            pose = DogBoneTransform::lerp(m_blendFrom, pose, k);
            pose.isFacingRight = m_facingRight;
            if (m_state == DogAnimationState::Sitting) {
                // The haunch fold is fixed, only the rest of the body eases in
                pose.backLeftLegAngle = target.backLeftLegAngle;
                pose.backRightLegAngle = target.backRightLegAngle;
                pose.backLeftKneeAngle = target.backLeftKneeAngle;
                pose.backRightKneeAngle = target.backRightKneeAngle;
            }
        }
    }
    m_transform = pose;
}

// -------------------------------------------------------------------------
// Transitions
// -------------------------------------------------------------------------

void DogAnimationController::setAnimationState(DogAnimationState state) {
    if (m_disposed || state == m_state) {
        return;
    }
    DogAnimationState previous = m_state;
    m_state = state;
    m_stateTime = 0.0f;

    if (m_settings.blendDuration > 0.0f) {
        m_blendFrom = m_transform;
        m_blendTime = 0.0f;
        m_blending = true;
    }
    commit();
    notify(previous, state);
}

void DogAnimationController::setWalkVelocity(float dx) {
    if (m_disposed || !std::isfinite(dx) || dx == 0.0f) {
        return;
    }
    m_facingRight = dx > 0.0f;
    if (m_state == DogAnimationState::Walking) {
        // Direction change mid-stride keeps the gait phase
        commit();
    } else {
        setAnimationState(DogAnimationState::Walking);
    }
}

void DogAnimationController::triggerTap() {
    if (m_disposed) {
        return;
    }
    DogAnimationState next = m_nextTapWags ? DogAnimationState::TailWag : DogAnimationState::HeadTilt;
    m_nextTapWags = !m_nextTapWags;
    setAnimationState(next);
}

void DogAnimationController::triggerHold() {
    setAnimationState(DogAnimationState::Petting);
}

void DogAnimationController::triggerRelease() {
    setAnimationState(DogAnimationState::Idle);
}

// -------------------------------------------------------------------------
// Listeners
// -------------------------------------------------------------------------

int DogAnimationController::addStateListener(StateListener listener) {
    if (m_disposed || !listener) {
        return 0;
    }
    int id = m_nextListenerId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void DogAnimationController::removeStateListener(int id) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_listeners.end());
}

void DogAnimationController::notify(DogAnimationState previous, DogAnimationState next) {
    // Listeners may add or remove listeners
    auto listeners = m_listeners;
    for (auto& entry : listeners) {
        entry.second(previous, next);
    }
}

void DogAnimationController::dispose() {
    m_disposed = true;
    m_blending = false;
    m_listeners.clear();
}

} // namespace pupkit
