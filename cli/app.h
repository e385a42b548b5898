// pupkit Application
// Headless host loop: builds a companion, replays gestures and writes frames

#pragma once

#include <string>

namespace pupkit {

// Configuration passed from command-line arguments
struct AppConfig {
    std::string breed = "goldenRetriever";
    std::string breedsPath;     // extra JSON breed file, loaded before lookup
    std::string mood;           // initial mood key
    std::string state;          // initial state name
    std::string scriptPath;     // gesture timeline

    int frames = 60;
    float fps = 30.0f;
    int width = 256;
    int height = 256;
    float blendDuration = 0.0f;

    std::string outputDir;      // frame_0000.png ... when set
    std::string snapshotPath;   // last frame only

    bool listBreeds = false;
};

// Main application class
// Owns the breed registry, the companion, the canvas and the gesture script
class Application {
public:
    Application() = default;
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Initialize the application with given config
    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Run the frame loop
    // Returns exit code (0 = success)
    int run();

    // Cleanup (called by destructor, can be called explicitly)
    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace pupkit
