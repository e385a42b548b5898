// pupkit Application Implementation
// Registry setup, companion construction and the fixed-step frame loop

#include "app.h"

#include <pupkit/pupkit.h>

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace pupkit {

namespace {

std::string stateNameList() {
    std::string names;
    for (int i = 0; i < kAnimationStateCount; ++i) {
        if (!names.empty()) names += ", ";
        names += stateName(static_cast<DogAnimationState>(i));
    }
    return names;
}

std::string framePath(const std::string& dir, int frame) {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%04d.png", frame);
    return (fs::path(dir) / name).string();
}

} // namespace

// -----------------------------------------------------------------------------
// Application::Impl
// -----------------------------------------------------------------------------

struct Application::Impl {
    AppConfig config;

    BreedRegistry registry = BreedRegistry::withBuiltins();
    std::unique_ptr<Companion> companion;
    std::unique_ptr<Canvas> canvas;

    GestureScript script;
    bool hasScript = false;

    // Frame loop bookkeeping, read by the state listener
    int frame = 0;
    double clock = 0.0;
    int stateChanges = 0;
    int repaints = 0;
    size_t eventsDispatched = 0;
    int listenerId = 0;
};

Application::~Application() {
    shutdown();
}

int Application::init(const AppConfig& config) {
    if (m_initialized) {
        std::cerr << "[pupkit] Application already initialized" << std::endl;
        return 1;
    }

    if (config.frames <= 0 || !(config.fps > 0.0f) || config.width <= 0 || config.height <= 0) {
        std::cerr << "[pupkit] Frames, fps and size must be positive" << std::endl;
        return 1;
    }

    m_impl = new Impl();
    m_impl->config = config;

    if (!config.breedsPath.empty()) {
        std::string error;
        if (!m_impl->registry.loadFile(config.breedsPath, error)) {
            shutdown();
            return 1;
        }
    }

    if (config.listBreeds) {
        m_initialized = true;
        return 0;
    }

    DogAnimationState initialState = DogAnimationState::Idle;
    if (!config.state.empty() && !parseState(config.state, initialState)) {
        std::cerr << "[pupkit] Unknown state '" << config.state
                  << "' (expected one of: " << stateNameList() << ")" << std::endl;
        shutdown();
        return 1;
    }

    try {
        Companion::Settings settings;
        settings.blendDuration = config.blendDuration;
        m_impl->companion = std::make_unique<Companion>(m_impl->registry, config.breed, settings);
        m_impl->canvas = std::make_unique<Canvas>(config.width, config.height);
    } catch (const std::runtime_error& e) {
        std::cerr << "[pupkit] " << e.what() << std::endl;
        shutdown();
        return 1;
    }

    if (!config.scriptPath.empty()) {
        std::string error;
        if (!GestureScript::loadFile(config.scriptPath, m_impl->script, error)) {
            shutdown();
            return 1;
        }
        m_impl->hasScript = true;
    }

    if (!config.outputDir.empty()) {
        std::error_code ec;
        fs::create_directories(config.outputDir, ec);
        if (ec) {
            std::cerr << "[pupkit] Failed to create output directory " << config.outputDir
                      << ": " << ec.message() << std::endl;
            shutdown();
            return 1;
        }
    }

    Impl* impl = m_impl;
    impl->listenerId = impl->companion->addStateListener(
        [impl](DogAnimationState from, DogAnimationState to) {
            impl->stateChanges++;
            std::cout << "[pupkit] " << std::fixed << std::setprecision(2) << impl->clock
                      << "s frame " << impl->frame << ": " << stateName(from) << " -> "
                      << stateName(to) << " (" << expressionName(expressionFromState(to)) << ")"
                      << std::endl;
        });

    if (!config.mood.empty()) {
        m_impl->companion->applyMood(config.mood);
    }
    if (!config.state.empty()) {
        m_impl->companion->animation().setAnimationState(initialState);
    }

    const BreedSkeleton& skeleton = m_impl->companion->skeleton();
    std::cout << "[pupkit] " << skeleton.breedId << " at " << config.width << "x" << config.height
              << ", " << config.frames << " frame(s) at " << config.fps << " fps";
    if (m_impl->hasScript) {
        std::cout << ", " << m_impl->script.events().size() << " scripted event(s)";
    }
    std::cout << std::endl;

    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized) {
        std::cerr << "[pupkit] Application not initialized" << std::endl;
        return 1;
    }

    const AppConfig& config = m_impl->config;

    if (config.listBreeds) {
        for (const auto& id : m_impl->registry.breedIds()) {
            std::cout << id << "\n";
        }
        std::cout.flush();
        return 0;
    }

    Companion& companion = *m_impl->companion;
    Canvas& canvas = *m_impl->canvas;
    const float dt = 1.0f / config.fps;
    const glm::vec2 size(static_cast<float>(config.width), static_cast<float>(config.height));

    for (int i = 0; i < config.frames; ++i) {
        m_impl->frame = i;

        // Gestures land before the tick so this frame's pose reflects them
        if (m_impl->hasScript) {
            m_impl->eventsDispatched += m_impl->script.advance(dt, companion);
        }
        companion.update(dt);
        m_impl->clock += dt;

        if (companion.needsRepaint()) {
            canvas.clear(1.0f, 1.0f, 1.0f, 1.0f);
            companion.render(canvas, size);
            m_impl->repaints++;
        }

        if (!config.outputDir.empty()) {
            std::string error;
            if (!canvas.savePNG(framePath(config.outputDir, i), error)) {
                return 1;
            }
        }
    }

    if (!config.snapshotPath.empty()) {
        std::string error;
        if (!canvas.savePNG(config.snapshotPath, error)) {
            return 1;
        }
        std::cout << "[pupkit] Snapshot saved to " << config.snapshotPath << std::endl;
    }

    std::ostringstream summary;
    summary << "[pupkit] Rendered " << config.frames << " frame(s) of "
            << companion.skeleton().breedId << ": " << m_impl->repaints << " repaint(s), "
            << m_impl->stateChanges << " state change(s)";
    if (m_impl->hasScript) {
        summary << ", " << m_impl->eventsDispatched << " event(s) dispatched";
    }
    summary << ", final state " << stateName(companion.state())
            << " (" << expressionName(companion.expression()) << ")";
    std::cout << summary.str() << std::endl;

    if (!config.outputDir.empty()) {
        std::cout << "[pupkit] Frames written to " << config.outputDir << std::endl;
    }
    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }
    if (m_impl->companion && m_impl->listenerId) {
        m_impl->companion->removeStateListener(m_impl->listenerId);
    }
    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace pupkit
