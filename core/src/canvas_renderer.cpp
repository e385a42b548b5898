// Canvas Renderer
// Coverage-mask triangle rasterizer with non-premultiplied source-over blending

#include "canvas_renderer.h"
#include <algorithm>
#include <cmath>

namespace pupkit {

namespace {

// Rotated-grid sample offsets within a pixel
const glm::vec2 kSampleOffsets[CanvasRenderer::SAMPLES_PER_PIXEL] = {
    {0.375f, 0.125f},
    {0.875f, 0.375f},
    {0.125f, 0.625f},
    {0.625f, 0.875f},
};

const uint8_t kBitCount[16] = {0, 1, 1, 2, 1, 2, 2, 3, 1, 2, 2, 3, 2, 3, 3, 4};

inline float edge(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p) {
    return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
}

inline uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

} // namespace

void CanvasRenderer::begin(int width, int height, const glm::vec4& clearColor) {
    m_width = width;
    m_height = height;
    m_pixels.assign(static_cast<size_t>(width) * height, clearColor);
    m_coverage.assign(static_cast<size_t>(width) * height, 0);
    m_dirtyMinX = m_width;
    m_dirtyMinY = m_height;
    m_dirtyMaxX = -1;
    m_dirtyMaxY = -1;
    m_stats = CanvasStats{};
}

// -------------------------------------------------------------------------
// Shape batch
// -------------------------------------------------------------------------

void CanvasRenderer::triangleFilled(glm::vec2 a, glm::vec2 b, glm::vec2 c) {
    if (!std::isfinite(a.x) || !std::isfinite(a.y) ||
        !std::isfinite(b.x) || !std::isfinite(b.y) ||
        !std::isfinite(c.x) || !std::isfinite(c.y)) {
        return;
    }

    float area = edge(a, b, c);
    if (std::abs(area) < 1e-6f) {
        return;
    }
    // Normalize winding so inside is positive
    if (area < 0.0f) {
        std::swap(b, c);
    }

    int minX = std::max(0, static_cast<int>(std::floor(std::min({a.x, b.x, c.x}))));
    int minY = std::max(0, static_cast<int>(std::floor(std::min({a.y, b.y, c.y}))));
    int maxX = std::min(m_width - 1, static_cast<int>(std::floor(std::max({a.x, b.x, c.x}))));
    int maxY = std::min(m_height - 1, static_cast<int>(std::floor(std::max({a.y, b.y, c.y}))));
    if (minX > maxX || minY > maxY) {
        return;
    }

    m_stats.triangles++;

    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            uint8_t bits = 0;
            for (int s = 0; s < SAMPLES_PER_PIXEL; ++s) {
                glm::vec2 p(x + kSampleOffsets[s].x, y + kSampleOffsets[s].y);
                if (edge(a, b, p) >= 0.0f && edge(b, c, p) >= 0.0f && edge(c, a, p) >= 0.0f) {
                    bits |= static_cast<uint8_t>(1u << s);
                }
            }
            if (bits) {
                m_coverage[static_cast<size_t>(y) * m_width + x] |= bits;
            }
        }
    }

    m_dirtyMinX = std::min(m_dirtyMinX, minX);
    m_dirtyMinY = std::min(m_dirtyMinY, minY);
    m_dirtyMaxX = std::max(m_dirtyMaxX, maxX);
    m_dirtyMaxY = std::max(m_dirtyMaxY, maxY);
}

void CanvasRenderer::addSolidQuad(glm::vec2 p0, glm::vec2 p1, glm::vec2 p2, glm::vec2 p3) {
    triangleFilled(p0, p1, p2);
    triangleFilled(p0, p2, p3);
}

bool CanvasRenderer::flush(const CanvasPaint& paint) {
    bool any = false;

    for (int y = m_dirtyMinY; y <= m_dirtyMaxY; ++y) {
        for (int x = m_dirtyMinX; x <= m_dirtyMaxX; ++x) {
            size_t index = static_cast<size_t>(y) * m_width + x;
            uint8_t bits = m_coverage[index];
            if (!bits) {
                continue;
            }
            m_coverage[index] = 0;
            any = true;

            glm::vec4 src = paint.color;
            if (paint.gradient) {
                glm::vec3 user = paint.inverseTransform * glm::vec3(x + 0.5f, y + 0.5f, 1.0f);
                src = paint.gradient->sample(glm::vec2(user.x, user.y));
            }
            src.a *= paint.alpha;

            float coverage = kBitCount[bits & 0x0F] / static_cast<float>(SAMPLES_PER_PIXEL);
            blendPixel(index, src, coverage);
        }
    }

    m_dirtyMinX = m_width;
    m_dirtyMinY = m_height;
    m_dirtyMaxX = -1;
    m_dirtyMaxY = -1;
    return any;
}

void CanvasRenderer::blendPixel(size_t index, const glm::vec4& src, float coverage) {
    float srcA = std::clamp(src.a * coverage, 0.0f, 1.0f);
    if (srcA <= 0.0f) {
        return;
    }
    glm::vec4& dst = m_pixels[index];

    float outA = srcA + dst.a * (1.0f - srcA);
    if (outA <= 0.0f) {
        dst = glm::vec4(0.0f);
        return;
    }
    glm::vec3 rgb = (glm::vec3(src) * srcA + glm::vec3(dst) * dst.a * (1.0f - srcA)) / outA;
    dst = glm::vec4(rgb, outA);
    m_stats.pixelsBlended++;
}

// -------------------------------------------------------------------------
// Target access
// -------------------------------------------------------------------------

glm::vec4 CanvasRenderer::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return glm::vec4(0.0f);
    }
    return m_pixels[static_cast<size_t>(y) * m_width + x];
}

std::vector<uint8_t> CanvasRenderer::readPixels() const {
    std::vector<uint8_t> out(m_pixels.size() * 4);
    for (size_t i = 0; i < m_pixels.size(); ++i) {
        const glm::vec4& p = m_pixels[i];
        out[i * 4 + 0] = toByte(p.r);
        out[i * 4 + 1] = toByte(p.g);
        out[i * 4 + 2] = toByte(p.b);
        out[i * 4 + 3] = toByte(p.a);
    }
    return out;
}

} // namespace pupkit
