#include <pupkit/companion.h>
#include <pupkit/canvas.h>
#include <pupkit/shadow_painter.h>
#include <algorithm>
#include <iostream>

namespace pupkit {

Companion::Companion(const BreedRegistry& registry, const std::string& breedId,
                     const Settings& settings)
    : m_registry(&registry)
    , m_settings(settings) {
    attach(m_registry->configFor(breedId));
}

void Companion::attach(const BreedSkeleton& skeleton) {
    // Build the replacements before touching the current controllers
    auto animation = std::make_unique<DogAnimationController>(skeleton, m_settings);
    auto interaction = std::make_unique<DogInteractionController>(*animation);

    animation->addStateListener([this](DogAnimationState from, DogAnimationState to) {
        auto listeners = m_listeners;
        for (auto& entry : listeners) {
            entry.second(from, to);
        }
    });

    if (m_interaction) {
        m_interaction->dispose();
    }
    if (m_animation) {
        m_animation->dispose();
    }

    m_skeleton = &skeleton;
    m_animation = std::move(animation);
    m_interaction = std::move(interaction);
}

void Companion::setBreed(const std::string& breedId) {
    const BreedSkeleton& skeleton = m_registry->configFor(breedId);
    if (&skeleton == m_skeleton) {
        return;
    }
    attach(skeleton);
    std::cout << "[Companion] Breed changed to " << breedId << "\n";

    if (!m_lastMood.empty()) {
        m_interaction->applyMoodState(m_lastMood);
    }
}

void Companion::update(float dt) {
    m_animation->tick(dt);
}

DogBodyPainter Companion::currentPainter() const {
    return DogBodyPainter(*m_skeleton, m_animation->transform(), m_animation->expression());
}

void Companion::render(Canvas& canvas, const glm::vec2& size) {
    ShadowPainter shadow(*m_skeleton, m_animation->transform().verticalOffset);
    shadow.paint(canvas, size);

    DogBodyPainter painter = currentPainter();
    painter.paint(canvas, size);
    m_lastPainter = painter;
}

bool Companion::needsRepaint() const {
    if (!m_lastPainter) {
        return true;
    }
    return currentPainter().shouldRepaint(*m_lastPainter);
}

void Companion::applyMood(const std::string& key) {
    m_lastMood = key;
    m_interaction->applyMoodState(key);
}

int Companion::addStateListener(DogAnimationController::StateListener listener) {
    if (!listener) {
        return 0;
    }
    int id = m_nextListenerId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void Companion::removeStateListener(int id) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_listeners.end());
}

} // namespace pupkit
