#pragma once

/**
 * @file image_writer.h
 * @brief PNG export of RGBA8 pixel buffers
 */

#include <cstdint>
#include <string>
#include <vector>

namespace pupkit {

/**
 * @brief Write a row-major RGBA8 buffer as a PNG file
 * @param path Output file
 * @param width Image width in pixels
 * @param height Image height in pixels
 * @param rgba width * height * 4 bytes, top row first
 * @param error Receives the failure reason
 * @return false on a size mismatch or write failure
 */
bool writePNG(const std::string& path, int width, int height,
              const std::vector<uint8_t>& rgba, std::string& error);

} // namespace pupkit
