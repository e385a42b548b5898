// Image Writer
// PNG saving via stb_image_write

#include <pupkit/image_writer.h>
#include <iostream>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace pupkit {

bool writePNG(const std::string& path, int width, int height,
              const std::vector<uint8_t>& rgba, std::string& error) {
    if (width <= 0 || height <= 0 ||
        rgba.size() != static_cast<size_t>(width) * height * 4) {
        error = "PNG buffer does not match " + std::to_string(width) + "x" +
                std::to_string(height) + " RGBA";
        return false;
    }

    int result = stbi_write_png(path.c_str(), width, height, 4, rgba.data(), width * 4);
    if (result == 0) {
        error = "Failed to write PNG: " + path;
        std::cerr << "[Canvas] " << error << "\n";
        return false;
    }
    return true;
}

} // namespace pupkit
