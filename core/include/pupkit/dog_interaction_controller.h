#pragma once

/**
 * @file dog_interaction_controller.h
 * @brief Arbitrates gestures and ambient moods into controller calls
 *
 * Priority, high to low: petting (active long-press), tap, drag, ambient
 * mood. While petting, taps, drags and moods are ignored.
 */

#include <pupkit/dog_animation_controller.h>
#include <string>

namespace pupkit {

/// @brief Gesture arbitration mode
enum class InteractionMode {
    Free,     ///< Taps, drags and moods reach the controller
    Petting   ///< Long-press in progress; only onLongPressEnd is honored
};

/**
 * @brief Gesture front-end for one DogAnimationController
 *
 * Borrows the controller; dispose() detaches before the controller goes away.
 */
class DogInteractionController {
public:
    explicit DogInteractionController(DogAnimationController& controller);

    DogInteractionController(const DogInteractionController&) = delete;
    DogInteractionController& operator=(const DogInteractionController&) = delete;

    /// @name Gestures
    /// @{
    void onTap();
    void onLongPressStart();
    void onLongPressEnd();
    /// @brief Horizontal drag; only the sign of dx matters
    void onPanUpdate(float dx);
    void onPanEnd();
    /// @}

    /**
     * @brief Apply an ambient mood key
     *
     * Unknown keys resolve to Idle. Never throws.
     */
    void applyMoodState(const std::string& key);

    InteractionMode mode() const { return m_mode; }
    bool isPetting() const { return m_mode == InteractionMode::Petting; }

    /// @brief Detach from the controller; later events are ignored
    void dispose();
    bool isDisposed() const { return m_controller == nullptr; }

private:
    bool accepting() const;

    DogAnimationController* m_controller;
    InteractionMode m_mode = InteractionMode::Free;
};

} // namespace pupkit
