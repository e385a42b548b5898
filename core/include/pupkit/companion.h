#pragma once

/**
 * @file companion.h
 * @brief One companion instance: breed, controllers and painters
 *
 * Drives the per-frame order: update(dt) ticks the animation controller,
 * render() paints the shadow and then the body from the committed transform
 * and the expression derived from the current state.
 *
 * @par Example
 * @code
 * Companion dog(BreedRegistry::builtin(), "corgi");
 * dog.interaction().onTap();
 * Canvas canvas(256, 256);
 * for (int i = 0; i < 60; ++i) {
 *     dog.update(1.0f / 30.0f);
 *     canvas.clear(1, 1, 1, 1);
 *     dog.render(canvas, {256, 256});
 * }
 * @endcode
 */

#include <pupkit/breed_registry.h>
#include <pupkit/dog_animation_controller.h>
#include <pupkit/dog_body_painter.h>
#include <pupkit/dog_interaction_controller.h>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pupkit {

class Canvas;

class Companion {
public:
    using Settings = DogAnimationController::Settings;

    /**
     * @brief Create a companion of a registered breed
     * @throw std::runtime_error if the breed is unknown or the settings are invalid
     */
    Companion(const BreedRegistry& registry, const std::string& breedId,
              const Settings& settings = Settings{});

    Companion(const Companion&) = delete;
    Companion& operator=(const Companion&) = delete;

    /**
     * @brief Switch breed, rebuilding both controllers
     *
     * The new controller starts in Idle; the last mood key is re-applied.
     * @throw std::runtime_error if the breed is unknown (the companion is unchanged)
     */
    void setBreed(const std::string& breedId);

    /// @brief Advance the animation clock
    void update(float dt);

    /// @brief Paint shadow then body into the region [0, size)
    void render(Canvas& canvas, const glm::vec2& size);

    /// @brief True if the pose, expression or breed changed since the last render()
    bool needsRepaint() const;

    /// @brief Apply an ambient mood and remember it across breed changes
    void applyMood(const std::string& key);
    const std::string& lastMood() const { return m_lastMood; }

    /**
     * @brief Observe state changes across breed changes
     * @return Id for removeStateListener()
     */
    int addStateListener(DogAnimationController::StateListener listener);
    void removeStateListener(int id);

    const BreedSkeleton& skeleton() const { return *m_skeleton; }
    DogAnimationController& animation() { return *m_animation; }
    const DogAnimationController& animation() const { return *m_animation; }
    DogInteractionController& interaction() { return *m_interaction; }

    DogAnimationState state() const { return m_animation->state(); }
    DogExpression expression() const { return m_animation->expression(); }
    const DogBoneTransform& transform() const { return m_animation->transform(); }

private:
    DogBodyPainter currentPainter() const;
    void attach(const BreedSkeleton& skeleton);

    const BreedRegistry* m_registry;
    Settings m_settings;
    const BreedSkeleton* m_skeleton = nullptr;

    std::unique_ptr<DogAnimationController> m_animation;
    std::unique_ptr<DogInteractionController> m_interaction;
    std::optional<DogBodyPainter> m_lastPainter;
    std::string m_lastMood;

    std::vector<std::pair<int, DogAnimationController::StateListener>> m_listeners;
    int m_nextListenerId = 1;
};

} // namespace pupkit
