#pragma once

/**
 * @file canvas_renderer.h
 * @brief Software triangle rasterizer behind Canvas
 *
 * Triangles of one shape are accumulated into a 4-sample coverage mask and
 * composited once with a CanvasPaint, so overlapping stroke quads and joins
 * never blend twice.
 */

#include <pupkit/canvas.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace pupkit {

/**
 * @brief Source color of one shape
 *
 * Gradients are sampled per pixel in user space: the pixel center is mapped
 * back through inverseTransform before sampling.
 */
struct CanvasPaint {
    glm::vec4 color = {0, 0, 0, 1};
    std::shared_ptr<const CanvasGradient> gradient;
    glm::mat3 inverseTransform = glm::mat3(1.0f);
    float alpha = 1.0f;   ///< Global alpha, applied to solid and gradient colors
};

/**
 * @brief CPU rasterizer with source-over blending
 */
class CanvasRenderer {
public:
    CanvasRenderer() = default;

    /**
     * @brief Resize and clear the target
     * @param width Canvas width in pixels
     * @param height Canvas height in pixels
     * @param clearColor Clear color (RGBA)
     */
    void begin(int width, int height, const glm::vec4& clearColor);

    // -------------------------------------------------------------------------
    /// @name Shape Batch
    /// @{

    /// @brief Add a device-space triangle to the current shape
    void triangleFilled(glm::vec2 a, glm::vec2 b, glm::vec2 c);

    /**
     * @brief Add a quad to the current shape
     * @param p0 First vertex
     * @param p1 Second vertex
     * @param p2 Third vertex
     * @param p3 Fourth vertex
     */
    void addSolidQuad(glm::vec2 p0, glm::vec2 p1, glm::vec2 p2, glm::vec2 p3);

    /**
     * @brief Composite the current shape and start a new one
     * @return false if the shape covered no samples
     */
    bool flush(const CanvasPaint& paint);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Target Access
    /// @{

    int width() const { return m_width; }
    int height() const { return m_height; }

    glm::vec4 pixel(int x, int y) const;
    std::vector<uint8_t> readPixels() const;

    CanvasStats& stats() { return m_stats; }
    const CanvasStats& stats() const { return m_stats; }

    /// @}

    static constexpr int SAMPLES_PER_PIXEL = 4;

private:
    void blendPixel(size_t index, const glm::vec4& src, float coverage);

    int m_width = 0;
    int m_height = 0;
    std::vector<glm::vec4> m_pixels;

    // One bit per sample
    std::vector<uint8_t> m_coverage;
    int m_dirtyMinX = 0;
    int m_dirtyMinY = 0;
    int m_dirtyMaxX = -1;
    int m_dirtyMaxY = -1;

    CanvasStats m_stats;
};

} // namespace pupkit
