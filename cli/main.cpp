// pupkit - Entry Point
// Parses command-line arguments and runs the headless companion host

#include "app.h"
#include <pupkit/pupkit.h>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

// Helper to parse WxH format
static bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= s.size()) {
        return false;
    }
    char* end = nullptr;
    long pw = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + x) {
        return false;
    }
    long ph = std::strtol(s.c_str() + x + 1, &end, 10);
    if (*end != '\0' || pw <= 0 || ph <= 0 || pw > 8192 || ph > 8192) {
        return false;
    }
    w = static_cast<int>(pw);
    h = static_cast<int>(ph);
    return true;
}

int main(int argc, char** argv) {
    pupkit::AppConfig config;
    std::string size = "256x256";

    CLI::App app{"pupkit - Procedural companion dog animation"};
    app.set_version_flag("-v,--version", std::string(pupkit::version()));
    app.set_help_flag("-h,--help", "Show this help");

    app.add_flag("--list-breeds", config.listBreeds, "Print registered breed ids and exit");
    app.add_option("-b,--breed", config.breed, "Breed id")->default_val("goldenRetriever");
    app.add_option("--breeds", config.breedsPath, "Extra breeds (JSON file)");
    app.add_option("-m,--mood", config.mood, "Initial mood: tail_wag, head_tilt, zoomies, sit, nap, yawn, idle");
    app.add_option("-s,--state", config.state,
                   "Initial state: idle, walking, sitting, tail_wag, head_tilt, petting, zoomies, sleeping");
    app.add_option("--script", config.scriptPath, "Gesture timeline (JSON file)");
    app.add_option("-n,--frames", config.frames, "Number of frames to render")
        ->default_val(60)
        ->check(CLI::PositiveNumber);
    app.add_option("--fps", config.fps, "Frame rate")
        ->default_val(30.0f)
        ->check(CLI::PositiveNumber);
    app.add_option("--size", size, "Canvas size as WxH")->default_val("256x256");
    app.add_option("--blend", config.blendDuration, "State blend duration in seconds")
        ->default_val(0.0f)
        ->check(CLI::NonNegativeNumber);
    app.add_option("-o,--output", config.outputDir, "Write frame_0000.png ... to this directory");
    app.add_option("--snapshot", config.snapshotPath, "Write the last frame to this PNG");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!parseSize(size, config.width, config.height)) {
        std::cerr << "[pupkit] Invalid --size '" << size << "' (expected WxH, e.g. 256x256)" << std::endl;
        return 1;
    }

    pupkit::Application application;
    int result = application.init(config);
    if (result != 0) {
        return result;
    }

    result = application.run();
    application.shutdown();
    return result;
}
