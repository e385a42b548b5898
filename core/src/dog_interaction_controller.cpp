#include <pupkit/dog_interaction_controller.h>

namespace pupkit {

DogInteractionController::DogInteractionController(DogAnimationController& controller)
    : m_controller(&controller) {}

bool DogInteractionController::accepting() const {
    return m_controller && m_mode == InteractionMode::Free;
}

void DogInteractionController::onTap() {
    if (!accepting()) return;
    m_controller->triggerTap();
}

void DogInteractionController::onLongPressStart() {
    if (!m_controller) return;
    m_mode = InteractionMode::Petting;
    m_controller->triggerHold();
}

void DogInteractionController::onLongPressEnd() {
    if (!m_controller) return;
    m_mode = InteractionMode::Free;
    m_controller->triggerRelease();
}

void DogInteractionController::onPanUpdate(float dx) {
    if (!accepting()) return;
    m_controller->setWalkVelocity(dx);
}

void DogInteractionController::onPanEnd() {
    if (!accepting()) return;
    m_controller->triggerRelease();
}

void DogInteractionController::applyMoodState(const std::string& key) {
    if (!accepting()) return;
    m_controller->setAnimationState(stateFromMoodKey(key));
}

void DogInteractionController::dispose() {
    m_controller = nullptr;
    m_mode = InteractionMode::Free;
}

} // namespace pupkit
