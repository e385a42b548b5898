#include <pupkit/shadow_painter.h>
#include <pupkit/canvas.h>
#include <algorithm>
#include <cmath>

namespace pupkit {

ShadowPainter::ShadowPainter(const BreedSkeleton& skeleton, float verticalOffset)
    : m_skeleton(&skeleton)
    , m_verticalOffset(std::isfinite(verticalOffset) ? verticalOffset : 0.0f) {}

float ShadowPainter::liftFactor(float verticalOffset) {
    return std::clamp(1.0f - verticalOffset / 30.0f, 0.3f, 1.0f);
}

ShadowGeometry ShadowPainter::geometry(const glm::vec2& size) const {
    float lift = liftFactor(m_verticalOffset);
    ShadowGeometry g;
    g.width = size.x * 0.55f * m_skeleton->torsoAspectRatio * 0.4f * lift;
    g.height = g.width * 0.3f;
    g.center = {size.x * 0.5f, size.y - 4.0f};
    g.alpha = 0.18f * lift;
    return g;
}

void ShadowPainter::paint(Canvas& canvas, const glm::vec2& size) const {
    ShadowGeometry g = geometry(size);
    if (!(g.width > 0.0f)) {
        return;
    }
    float radius = g.width * 0.5f;

    canvas.save();
    canvas.translate(g.center.x, g.center.y);
    canvas.scale(1.0f, g.height / g.width);

    // Soft rim in place of a blur
    auto gradient = canvas.createRadialGradient(0.0f, 0.0f, 0.0f, 0.0f, 0.0f, radius);
    gradient.addColorStop(0.0f, {0.0f, 0.0f, 0.0f, g.alpha});
    gradient.addColorStop(0.6f, {0.0f, 0.0f, 0.0f, g.alpha});
    gradient.addColorStop(1.0f, {0.0f, 0.0f, 0.0f, 0.0f});
    canvas.fillStyle(gradient);
    canvas.fillCircle(0.0f, 0.0f, radius, 48);

    canvas.restore();
}

} // namespace pupkit
