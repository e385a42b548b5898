#pragma once

/**
 * @file dog_animation_controller.h
 * @brief Procedural pose synthesis for one companion
 *
 * The controller owns the animation clock and the current state. The host
 * calls tick() once per frame and then reads transform() and expression().
 *
 * @par Example
 * @code
 * DogAnimationController controller(configFor("dachshund"));
 * controller.setWalkVelocity(-3.0f);       // walk left
 * controller.tick(1.0f / 60.0f);
 * painter.paint(canvas, controller.skeleton(), controller.transform(),
 *               controller.expression(), size);
 * @endcode
 */

#include <pupkit/breed_skeleton.h>
#include <pupkit/dog_animation_state.h>
#include <pupkit/dog_bone_transform.h>
#include <pupkit/dog_expression.h>
#include <functional>
#include <utility>
#include <vector>

namespace pupkit {

/**
 * @brief Maps (state, elapsed time, skeleton) to a DogBoneTransform
 *
 * Every pose is a deterministic function of the time spent in the current
 * state, scaled by the breed's animationSpeedMultiplier. State time wraps at
 * kPhasePeriod, a common multiple of every oscillator period, so the
 * wrap never shows.
 *
 * The skeleton is borrowed and must outlive the controller.
 */
class DogAnimationController {
public:
    /// @brief Tunables supplied at construction
    struct Settings {
        /// Seconds to smoothstep from the previous pose after a state change (0 = hard cut).
        /// The sitting haunch fold is applied at once and never blended.
        float blendDuration = 0.0f;
        /// Largest time step a single tick may contribute
        float maxFrameDelta = 1.0f;
    };

    /// @brief Called with (previous, next) on every state change
    using StateListener = std::function<void(DogAnimationState, DogAnimationState)>;

    /// Seconds after which the per-state clock wraps
    static constexpr float kPhasePeriod = 10.0f;

    /**
     * @brief Create a controller in the Idle state, facing right
     * @throw std::runtime_error if the settings are negative or non-finite
     */
    explicit DogAnimationController(const BreedSkeleton& skeleton);
    DogAnimationController(const BreedSkeleton& skeleton, const Settings& settings);
    explicit DogAnimationController(BreedSkeleton&&) = delete;
    DogAnimationController(BreedSkeleton&&, const Settings&) = delete;

    DogAnimationController(const DogAnimationController&) = delete;
    DogAnimationController& operator=(const DogAnimationController&) = delete;

    // -------------------------------------------------------------------------
    /// @name Frame Update
    /// @{

    /**
     * @brief Advance the clock and recompute the committed transform
     * @param dt Seconds since the previous frame. Clamped to maxFrameDelta;
     *           negative or non-finite values contribute nothing.
     */
    void tick(float dt);

    /// @}
    // -------------------------------------------------------------------------
    /// @name State Transitions
    /// @{

    /**
     * @brief Hard transition to a state
     *
     * Resets the state clock, recomputes the transform and notifies
     * listeners once. Requesting the current state does nothing.
     */
    void setAnimationState(DogAnimationState state);

    /**
     * @brief Face the sign of dx and start walking
     *
     * Zero or non-finite dx is ignored. Only the sign is used.
     */
    void setWalkVelocity(float dx);

    /// @brief Tap impulse. Alternates TailWag and HeadTilt, starting with TailWag.
    void triggerTap();

    /// @brief Long-press start: Petting
    void triggerHold();

    /// @brief Long-press end or drag end: Idle
    void triggerRelease();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Observation
    /// @{

    const DogBoneTransform& transform() const { return m_transform; }
    DogAnimationState state() const { return m_state; }
    DogExpression expression() const { return expressionFromState(m_state); }
    const BreedSkeleton& skeleton() const { return *m_skeleton; }
    const Settings& settings() const { return m_settings; }

    /// @brief Total clamped wall-clock time consumed by tick()
    double elapsed() const { return m_elapsed; }

    /// @brief Time in the current state, scaled by the speed multiplier and wrapped
    float stateTime() const { return m_stateTime; }

    /**
     * @brief Register a state-change listener
     * @return Id for removeStateListener()
     */
    int addStateListener(StateListener listener);

    /// @brief Remove a listener; unknown ids are ignored
    void removeStateListener(int id);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /// @brief Drop listeners and turn every later call into a no-op
    void dispose();
    bool isDisposed() const { return m_disposed; }

    /// @}

    /**
     * @brief Pose of a state at a given state time
     *
     * Pure function used by tick(); exposed for tests and tools.
     */
    static DogBoneTransform poseFor(DogAnimationState state, float stateTime, bool facingRight);

private:
    void commit();
    void notify(DogAnimationState previous, DogAnimationState next);

    const BreedSkeleton* m_skeleton;
    Settings m_settings;

    DogAnimationState m_state = DogAnimationState::Idle;
    DogBoneTransform m_transform;
    float m_stateTime = 0.0f;
    double m_elapsed = 0.0;
    bool m_facingRight = true;
    bool m_nextTapWags = true;

    // Blend from the pose committed before the last transition
    DogBoneTransform m_blendFrom;
    float m_blendTime = 0.0f;
    bool m_blending = false;

    std::vector<std::pair<int, StateListener>> m_listeners;
    int m_nextListenerId = 1;
    bool m_disposed = false;
};

} // namespace pupkit
