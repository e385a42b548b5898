#include <pupkit/canvas.h>
#include <pupkit/image_writer.h>
#include "canvas_renderer.h"
#include <mapbox/earcut.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pupkit {

// Constants
static constexpr float PI = 3.14159265358979323846f;
static constexpr float TAU = 2.0f * PI;

// -------------------------------------------------------------------------
// CanvasGradient implementation
// -------------------------------------------------------------------------

void CanvasGradient::addColorStop(float offset, const glm::vec4& color) {
    offset = std::max(0.0f, std::min(1.0f, offset));

    if (colorStops.size() >= MAX_COLOR_STOPS) {
        std::cerr << "[Canvas] Warning: Maximum " << MAX_COLOR_STOPS
                  << " color stops allowed, ignoring additional stops\n";
        return;
    }

    // Insert in sorted order; equal offsets keep insertion order
    ColorStop stop{offset, color};
    auto it = std::upper_bound(colorStops.begin(), colorStops.end(), stop,
        [](const ColorStop& a, const ColorStop& b) { return a.offset < b.offset; });
    colorStops.insert(it, stop);
}

void CanvasGradient::addColorStop(float offset, float r, float g, float b, float a) {
    addColorStop(offset, {r, g, b, a});
}

glm::vec4 CanvasGradient::sample(const glm::vec2& pos) const {
    if (colorStops.empty()) {
        return {0, 0, 0, 0};
    }
    if (colorStops.size() == 1) {
        return colorStops[0].color;
    }

    float t = 0.0f;

    switch (type) {
        case GradientType::Linear: {
            // Project position onto gradient line
            glm::vec2 dir = p1 - p0;
            float len2 = glm::dot(dir, dir);
            if (len2 > 0.0001f) {
                t = glm::dot(pos - p0, dir) / len2;
            }
            break;
        }
        case GradientType::Radial: {
            // Distance from the center, [r0, r1] mapped to [0, 1]
            float dist = glm::length(pos - p0);
            float range = r1 - r0;
            if (std::abs(range) > 0.0001f) {
                t = (dist - r0) / range;
            } else {
                t = dist <= r0 ? 0.0f : 1.0f;
            }
            break;
        }
    }

    t = std::max(0.0f, std::min(1.0f, t));

    const auto& stops = colorStops;
    if (t <= stops.front().offset) {
        return stops.front().color;
    }
    if (t >= stops.back().offset) {
        return stops.back().color;
    }

    for (size_t i = 0; i < stops.size() - 1; ++i) {
        if (t >= stops[i].offset && t <= stops[i + 1].offset) {
            float range = stops[i + 1].offset - stops[i].offset;
            float localT = (range > 0.0001f) ? (t - stops[i].offset) / range : 0.0f;
            return glm::mix(stops[i].color, stops[i + 1].color, localT);
        }
    }

    return stops.back().color;
}

// -------------------------------------------------------------------------
// Canvas implementation
// -------------------------------------------------------------------------

Canvas::Canvas(int width, int height)
    : m_width(width)
    , m_height(height)
    , m_renderer(std::make_unique<CanvasRenderer>())
{
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("Canvas size must be positive, got " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }
    m_renderer->begin(m_width, m_height, {0, 0, 0, 0});
}

Canvas::~Canvas() = default;

// -------------------------------------------------------------------------
// Helper methods
// -------------------------------------------------------------------------

glm::vec2 Canvas::transformPoint(const glm::vec2& p) const {
    glm::vec3 result = m_state.transform * glm::vec3(p, 1.0f);
    return glm::vec2(result.x, result.y);
}

float Canvas::deviceLineWidth() const {
    const glm::mat3& m = m_state.transform;
    float det = m[0][0] * m[1][1] - m[1][0] * m[0][1];
    return m_state.lineWidth * std::sqrt(std::abs(det));
}

static CanvasPaint makePaint(const CanvasState& state, const glm::vec4& color,
                             const std::shared_ptr<const CanvasGradient>& gradient) {
    CanvasPaint paint;
    paint.color = color;
    if (gradient && !gradient->colorStops.empty()) {
        paint.gradient = gradient;
        paint.inverseTransform = glm::inverse(state.transform);
    }
    paint.alpha = state.globalAlpha;
    return paint;
}

// -------------------------------------------------------------------------
// Frame Control
// -------------------------------------------------------------------------

void Canvas::clear(float r, float g, float b, float a) {
    clear(glm::vec4(r, g, b, a));
}

void Canvas::clear(const glm::vec4& color) {
    m_renderer->begin(m_width, m_height, color);
}

// -------------------------------------------------------------------------
// State Management
// -------------------------------------------------------------------------

void Canvas::fillStyle(const glm::vec4& color) {
    m_state.fillColor = color;
    m_state.fillGradient = nullptr;  // Clear gradient when setting solid color
}

void Canvas::fillStyle(float r, float g, float b, float a) {
    fillStyle(glm::vec4(r, g, b, a));
}

void Canvas::fillStyle(const CanvasGradient& gradient) {
    m_state.fillGradient = std::make_shared<const CanvasGradient>(gradient);
}

void Canvas::strokeStyle(const glm::vec4& color) {
    m_state.strokeColor = color;
    m_state.strokeGradient = nullptr;
}

void Canvas::strokeStyle(float r, float g, float b, float a) {
    strokeStyle(glm::vec4(r, g, b, a));
}

void Canvas::strokeStyle(const CanvasGradient& gradient) {
    m_state.strokeGradient = std::make_shared<const CanvasGradient>(gradient);
}

void Canvas::lineWidth(float width) {
    if (std::isfinite(width) && width > 0.0f) {
        m_state.lineWidth = width;
    }
}

void Canvas::lineCap(LineCap cap) {
    m_state.lineCap = cap;
}

void Canvas::lineJoin(LineJoin join) {
    m_state.lineJoin = join;
}

void Canvas::globalAlpha(float alpha) {
    if (std::isfinite(alpha)) {
        m_state.globalAlpha = std::max(0.0f, std::min(1.0f, alpha));
    }
}

void Canvas::save() {
    m_stateStack.push_back(m_state);
}

void Canvas::restore() {
    if (!m_stateStack.empty()) {
        m_state = m_stateStack.back();
        m_stateStack.pop_back();
    }
}

// -------------------------------------------------------------------------
// Gradients
// -------------------------------------------------------------------------

CanvasGradient Canvas::createLinearGradient(float x0, float y0, float x1, float y1) {
    CanvasGradient gradient;
    gradient.type = GradientType::Linear;
    gradient.p0 = {x0, y0};
    gradient.p1 = {x1, y1};
    return gradient;
}

CanvasGradient Canvas::createRadialGradient(float x0, float y0, float r0,
                                            float x1, float y1, float r1) {
    CanvasGradient gradient;
    gradient.type = GradientType::Radial;
    gradient.p0 = {x0, y0};
    gradient.r0 = r0;
    gradient.p1 = {x1, y1};
    gradient.r1 = r1;
    return gradient;
}

// -------------------------------------------------------------------------
// Transforms
// -------------------------------------------------------------------------

void Canvas::translate(float x, float y) {
    glm::mat3 translation(1.0f);
    translation[2][0] = x;
    translation[2][1] = y;
    m_state.transform = m_state.transform * translation;
}

void Canvas::rotate(float radians) {
    float c = std::cos(radians);
    float s = std::sin(radians);
    glm::mat3 rotation(1.0f);
    rotation[0][0] = c;  rotation[1][0] = -s;
    rotation[0][1] = s;  rotation[1][1] = c;
    m_state.transform = m_state.transform * rotation;
}

void Canvas::scale(float x, float y) {
    glm::mat3 scaling(1.0f);
    scaling[0][0] = x;
    scaling[1][1] = y;
    m_state.transform = m_state.transform * scaling;
}

void Canvas::scale(float uniform) {
    scale(uniform, uniform);
}

void Canvas::setTransform(const glm::mat3& matrix) {
    m_state.transform = matrix;
}

void Canvas::resetTransform() {
    m_state.transform = glm::mat3(1.0f);
}

glm::mat3 Canvas::getTransform() const {
    return m_state.transform;
}

void Canvas::flipHorizontal(float regionWidth) {
    translate(regionWidth, 0.0f);
    scale(-1.0f, 1.0f);
}

// -------------------------------------------------------------------------
// Path API
// -------------------------------------------------------------------------

void Canvas::beginPath() {
    m_currentPath.clear();
    m_pathCursor = {0, 0};
    m_pathStart = {0, 0};
}

void Canvas::closePath() {
    if (!m_currentPath.empty()) {
        m_currentPath.push_back({PathCommandType::ClosePath, {}});
        m_pathCursor = m_pathStart;
    }
}

void Canvas::moveTo(float x, float y) {
    m_currentPath.push_back({PathCommandType::MoveTo, {x, y}});
    m_pathCursor = {x, y};
    m_pathStart = m_pathCursor;
}

void Canvas::lineTo(float x, float y) {
    if (m_currentPath.empty()) {
        m_pathStart = {x, y};
    }
    m_currentPath.push_back({PathCommandType::LineTo, {x, y}});
    m_pathCursor = {x, y};
}

void Canvas::arc(float x, float y, float radius, float startAngle, float endAngle, bool counterclockwise) {
    if (!(radius > 0.0f)) {
        return;
    }
    if (m_currentPath.empty()) {
        m_pathStart = {x + radius * std::cos(startAngle), y + radius * std::sin(startAngle)};
    }
    m_currentPath.push_back({PathCommandType::Arc, {x, y, radius, startAngle, endAngle, counterclockwise ? 1.0f : 0.0f}});
    m_pathCursor = {x + radius * std::cos(endAngle), y + radius * std::sin(endAngle)};
}

void Canvas::ellipse(float x, float y, float radiusX, float radiusY, float rotation,
                     float startAngle, float endAngle, bool counterclockwise) {
    if (!(radiusX > 0.0f) || !(radiusY > 0.0f)) {
        return;
    }
    float c = std::cos(rotation);
    float s = std::sin(rotation);
    auto pointAt = [&](float angle) {
        float ex = radiusX * std::cos(angle);
        float ey = radiusY * std::sin(angle);
        return glm::vec2(x + ex * c - ey * s, y + ex * s + ey * c);
    };
    if (m_currentPath.empty()) {
        m_pathStart = pointAt(startAngle);
    }
    m_currentPath.push_back({PathCommandType::Ellipse,
        {x, y, radiusX, radiusY, rotation, startAngle, endAngle, counterclockwise ? 1.0f : 0.0f}});
    m_pathCursor = pointAt(endAngle);
}

void Canvas::quadraticCurveTo(float cpx, float cpy, float x, float y) {
    m_currentPath.push_back({PathCommandType::QuadraticCurveTo, {cpx, cpy, x, y}});
    m_pathCursor = {x, y};
}

void Canvas::bezierCurveTo(float cp1x, float cp1y, float cp2x, float cp2y, float x, float y) {
    m_currentPath.push_back({PathCommandType::BezierCurveTo, {cp1x, cp1y, cp2x, cp2y, x, y}});
    m_pathCursor = {x, y};
}

void Canvas::pathRect(float x, float y, float w, float h) {
    moveTo(x, y);
    lineTo(x + w, y);
    lineTo(x + w, y + h);
    lineTo(x, y + h);
    closePath();
}

void Canvas::roundRect(float x, float y, float w, float h, float radius) {
    // Normalize negative extents
    if (w < 0.0f) { x += w; w = -w; }
    if (h < 0.0f) { y += h; h = -h; }

    float r = std::max(0.0f, std::min(radius, std::min(w, h) * 0.5f));
    if (r <= 0.0f) {
        pathRect(x, y, w, h);
        return;
    }

    moveTo(x + r, y);
    lineTo(x + w - r, y);
    arc(x + w - r, y + r, r, -PI * 0.5f, 0.0f);
    lineTo(x + w, y + h - r);
    arc(x + w - r, y + h - r, r, 0.0f, PI * 0.5f);
    lineTo(x + r, y + h);
    arc(x + r, y + h - r, r, PI * 0.5f, PI);
    lineTo(x, y + r);
    arc(x + r, y + r, r, PI, PI * 1.5f);
    closePath();
}

// Tessellation helpers

static float arcSweep(float startAngle, float endAngle, bool ccw) {
    float sweep = endAngle - startAngle;
    if (std::abs(sweep) >= TAU) {
        return ccw ? -TAU : TAU;
    }
    if (ccw) {
        if (sweep > 0) sweep -= TAU;
    } else {
        if (sweep < 0) sweep += TAU;
    }
    return sweep;
}

void Canvas::tessellateArc(std::vector<glm::vec2>& points, float cx, float cy, float radius,
                           float startAngle, float endAngle, bool ccw) const {
    float sweep = arcSweep(startAngle, endAngle, ccw);

    // Segment count follows arc length
    int segments = std::max(8, static_cast<int>(std::abs(sweep * radius) / 4.0f));

    for (int i = 1; i <= segments; ++i) {
        float t = static_cast<float>(i) / segments;
        float angle = startAngle + sweep * t;
        float px = cx + radius * std::cos(angle);
        float py = cy + radius * std::sin(angle);
        points.push_back(transformPoint({px, py}));
    }
}

void Canvas::tessellateEllipse(std::vector<glm::vec2>& points, float cx, float cy,
                               float rx, float ry, float rotation,
                               float startAngle, float endAngle, bool ccw) const {
    float sweep = arcSweep(startAngle, endAngle, ccw);
    float c = std::cos(rotation);
    float s = std::sin(rotation);

    int segments = std::max(12, static_cast<int>(std::abs(sweep * std::max(rx, ry)) / 4.0f));

    for (int i = 1; i <= segments; ++i) {
        float t = static_cast<float>(i) / segments;
        float angle = startAngle + sweep * t;
        float ex = rx * std::cos(angle);
        float ey = ry * std::sin(angle);
        points.push_back(transformPoint({cx + ex * c - ey * s, cy + ex * s + ey * c}));
    }
}

void Canvas::tessellateQuadratic(std::vector<glm::vec2>& points, const glm::vec2& start,
                                  float cpx, float cpy, float x, float y) const {
    const int segments = 16;
    for (int i = 1; i <= segments; ++i) {
        float t = static_cast<float>(i) / segments;
        float t2 = t * t;
        float mt = 1.0f - t;
        float mt2 = mt * mt;

        float px = mt2 * start.x + 2.0f * mt * t * cpx + t2 * x;
        float py = mt2 * start.y + 2.0f * mt * t * cpy + t2 * y;
        points.push_back(transformPoint({px, py}));
    }
}

void Canvas::tessellateBezier(std::vector<glm::vec2>& points, const glm::vec2& start,
                               float cp1x, float cp1y, float cp2x, float cp2y, float x, float y) const {
    const int segments = 20;
    for (int i = 1; i <= segments; ++i) {
        float t = static_cast<float>(i) / segments;
        float t2 = t * t;
        float t3 = t2 * t;
        float mt = 1.0f - t;
        float mt2 = mt * mt;
        float mt3 = mt2 * mt;

        float px = mt3 * start.x + 3.0f * mt2 * t * cp1x + 3.0f * mt * t2 * cp2x + t3 * x;
        float py = mt3 * start.y + 3.0f * mt2 * t * cp1y + 3.0f * mt * t2 * cp2y + t3 * y;
        points.push_back(transformPoint({px, py}));
    }
}

std::vector<Canvas::Subpath> Canvas::pathToPolygons() const {
    std::vector<Subpath> subpaths;
    glm::vec2 cursor = {0, 0};
    glm::vec2 subpathStart = {0, 0};
    bool open = false;
    bool hasCursor = false;

    // Starts a subpath at p unless one is already open
    auto ensureOpen = [&](const glm::vec2& p) {
        if (!open) {
            subpaths.push_back({});
            subpaths.back().points.push_back(transformPoint(p));
            subpathStart = p;
            open = true;
        }
    };

    for (const auto& cmd : m_currentPath) {
        switch (cmd.type) {
            case PathCommandType::MoveTo:
                open = false;
                cursor = {cmd.params[0], cmd.params[1]};
                ensureOpen(cursor);
                hasCursor = true;
                break;

            case PathCommandType::LineTo:
                if (!open && hasCursor) {
                    ensureOpen(cursor);
                }
                cursor = {cmd.params[0], cmd.params[1]};
                if (!open) {
                    ensureOpen(cursor);
                } else {
                    subpaths.back().points.push_back(transformPoint(cursor));
                }
                hasCursor = true;
                break;

            case PathCommandType::Arc: {
                float cx = cmd.params[0];
                float cy = cmd.params[1];
                float radius = cmd.params[2];
                float startAngle = cmd.params[3];
                float endAngle = cmd.params[4];
                bool ccw = cmd.params[5] > 0.5f;

                // Line to start of arc if needed
                glm::vec2 arcStart = {cx + radius * std::cos(startAngle), cy + radius * std::sin(startAngle)};
                if (!open) {
                    ensureOpen(arcStart);
                } else if (glm::length(transformPoint(cursor) - transformPoint(arcStart)) > 0.01f) {
                    subpaths.back().points.push_back(transformPoint(arcStart));
                }

                tessellateArc(subpaths.back().points, cx, cy, radius, startAngle, endAngle, ccw);
                cursor = {cx + radius * std::cos(endAngle), cy + radius * std::sin(endAngle)};
                hasCursor = true;
                break;
            }

            case PathCommandType::Ellipse: {
                float cx = cmd.params[0];
                float cy = cmd.params[1];
                float rx = cmd.params[2];
                float ry = cmd.params[3];
                float rotation = cmd.params[4];
                float startAngle = cmd.params[5];
                float endAngle = cmd.params[6];
                bool ccw = cmd.params[7] > 0.5f;

                float c = std::cos(rotation);
                float s = std::sin(rotation);
                auto pointAt = [&](float angle) {
                    float ex = rx * std::cos(angle);
                    float ey = ry * std::sin(angle);
                    return glm::vec2(cx + ex * c - ey * s, cy + ex * s + ey * c);
                };

                glm::vec2 arcStart = pointAt(startAngle);
                if (!open) {
                    ensureOpen(arcStart);
                } else if (glm::length(transformPoint(cursor) - transformPoint(arcStart)) > 0.01f) {
                    subpaths.back().points.push_back(transformPoint(arcStart));
                }

                tessellateEllipse(subpaths.back().points, cx, cy, rx, ry, rotation, startAngle, endAngle, ccw);
                cursor = pointAt(endAngle);
                hasCursor = true;
                break;
            }

            case PathCommandType::QuadraticCurveTo: {
                ensureOpen(cursor);
                float x = cmd.params[2];
                float y = cmd.params[3];
                tessellateQuadratic(subpaths.back().points, cursor, cmd.params[0], cmd.params[1], x, y);
                cursor = {x, y};
                hasCursor = true;
                break;
            }

            case PathCommandType::BezierCurveTo: {
                ensureOpen(cursor);
                float x = cmd.params[4];
                float y = cmd.params[5];
                tessellateBezier(subpaths.back().points, cursor,
                                 cmd.params[0], cmd.params[1], cmd.params[2], cmd.params[3], x, y);
                cursor = {x, y};
                hasCursor = true;
                break;
            }

            case PathCommandType::ClosePath:
                if (open) {
                    subpaths.back().closed = true;
                    open = false;
                }
                cursor = subpathStart;
                break;
        }
    }

    return subpaths;
}

// Drop consecutive duplicates so every segment has a direction
static std::vector<glm::vec2> cleanPolyline(const std::vector<glm::vec2>& points, bool closed) {
    std::vector<glm::vec2> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            continue;
        }
        if (out.empty() || glm::length(p - out.back()) > 0.001f) {
            out.push_back(p);
        }
    }
    if (closed && out.size() > 2 && glm::length(out.back() - out.front()) <= 0.001f) {
        out.pop_back();
    }
    return out;
}

void Canvas::addRoundCap(const glm::vec2& center, const glm::vec2& dir, float halfWidth) {
    // Half disc facing dir
    int capSegments = std::max(8, std::min(32, static_cast<int>(halfWidth * 2.0f)));
    glm::vec2 perp = {-dir.y, dir.x};
    for (int j = 0; j < capSegments; ++j) {
        float a0 = -PI * 0.5f + PI * static_cast<float>(j) / capSegments;
        float a1 = -PI * 0.5f + PI * static_cast<float>(j + 1) / capSegments;
        glm::vec2 c0 = center + halfWidth * (dir * std::cos(a0) + perp * std::sin(a0));
        glm::vec2 c1 = center + halfWidth * (dir * std::cos(a1) + perp * std::sin(a1));
        m_renderer->triangleFilled(center, c0, c1);
    }
}

void Canvas::addJoin(const glm::vec2& p, const glm::vec2& dir, const glm::vec2& nextDir, float halfWidth) {
    glm::vec2 perp = {-dir.y, dir.x};
    glm::vec2 nextPerp = {-nextDir.y, nextDir.x};

    if (m_state.lineJoin == LineJoin::Round) {
        int joinSegments = std::max(8, std::min(32, static_cast<int>(halfWidth * 2.0f)));
        for (int j = 0; j < joinSegments; ++j) {
            float a0 = TAU * static_cast<float>(j) / joinSegments;
            float a1 = TAU * static_cast<float>(j + 1) / joinSegments;
            m_renderer->triangleFilled(p,
                p + halfWidth * glm::vec2(std::cos(a0), std::sin(a0)),
                p + halfWidth * glm::vec2(std::cos(a1), std::sin(a1)));
        }
        return;
    }

    // Outer side of the turn
    float cross = dir.x * nextDir.y - dir.y * nextDir.x;
    float side = cross > 0.0f ? -1.0f : 1.0f;
    glm::vec2 outerA = p + side * perp * halfWidth;
    glm::vec2 outerB = p + side * nextPerp * halfWidth;
    m_renderer->triangleFilled(p, outerA, outerB);
}

void Canvas::generateStrokeGeometry(const std::vector<glm::vec2>& rawPoints, bool closed) {
    std::vector<glm::vec2> points = cleanPolyline(rawPoints, closed);
    if (points.size() < 2) return;
    if (points.size() == 2) closed = false;

    float halfWidth = deviceLineWidth() * 0.5f;
    size_t n = points.size();
    size_t segmentCount = closed ? n : n - 1;

    for (size_t i = 0; i < segmentCount; ++i) {
        glm::vec2 p0 = points[i];
        glm::vec2 p1 = points[(i + 1) % n];
        glm::vec2 dir = glm::normalize(p1 - p0);
        glm::vec2 perp = {-dir.y, dir.x};

        if (!closed && m_state.lineCap == LineCap::Square) {
            if (i == 0) p0 -= dir * halfWidth;
            if (i == segmentCount - 1) p1 += dir * halfWidth;
        }

        m_renderer->addSolidQuad(p0 - perp * halfWidth, p0 + perp * halfWidth,
                                 p1 + perp * halfWidth, p1 - perp * halfWidth);
    }

    // Joins at interior vertices (every vertex of a closed path)
    size_t firstJoin = closed ? 0 : 1;
    size_t lastJoin = closed ? n : n - 1;
    for (size_t i = firstJoin; i < lastJoin; ++i) {
        glm::vec2 prev = points[(i + n - 1) % n];
        glm::vec2 cur = points[i];
        glm::vec2 next = points[(i + 1) % n];
        addJoin(cur, glm::normalize(cur - prev), glm::normalize(next - cur), halfWidth);
    }

    if (!closed && m_state.lineCap == LineCap::Round) {
        addRoundCap(points[0], glm::normalize(points[0] - points[1]), halfWidth);
        addRoundCap(points[n - 1], glm::normalize(points[n - 1] - points[n - 2]), halfWidth);
    }
}

void Canvas::fill() {
    auto polygons = pathToPolygons();

    using Point = std::array<float, 2>;
    for (const auto& subpath : polygons) {
        const auto& polygon = subpath.points;
        if (polygon.size() < 3) continue;
        bool finite = std::all_of(polygon.begin(), polygon.end(), [](const glm::vec2& p) {
            return std::isfinite(p.x) && std::isfinite(p.y);
        });
        if (!finite) continue;

        // Convert to earcut format
        std::vector<std::vector<Point>> polygonData(1);
        polygonData[0].reserve(polygon.size());
        for (const auto& p : polygon) {
            polygonData[0].push_back({p.x, p.y});
        }

        auto indices = mapbox::earcut<uint32_t>(polygonData);
        for (size_t i = 0; i + 2 < indices.size(); i += 3) {
            m_renderer->triangleFilled(polygon[indices[i]],
                                       polygon[indices[i + 1]],
                                       polygon[indices[i + 2]]);
        }
    }

    if (m_renderer->flush(makePaint(m_state, m_state.fillColor, m_state.fillGradient))) {
        m_renderer->stats().fills++;
    }
}

void Canvas::stroke() {
    auto polygons = pathToPolygons();
    for (const auto& subpath : polygons) {
        generateStrokeGeometry(subpath.points, subpath.closed);
    }

    if (m_renderer->flush(makePaint(m_state, m_state.strokeColor, m_state.strokeGradient))) {
        m_renderer->stats().strokes++;
    }
}

// -------------------------------------------------------------------------
// Convenience Methods
// -------------------------------------------------------------------------

void Canvas::fillRect(float x, float y, float w, float h) {
    glm::vec2 p0 = transformPoint({x, y});
    glm::vec2 p1 = transformPoint({x + w, y});
    glm::vec2 p2 = transformPoint({x + w, y + h});
    glm::vec2 p3 = transformPoint({x, y + h});

    m_renderer->addSolidQuad(p0, p1, p2, p3);
    if (m_renderer->flush(makePaint(m_state, m_state.fillColor, m_state.fillGradient))) {
        m_renderer->stats().fills++;
    }
}


void Canvas::fillCircle(float x, float y, float radius, int segments) {
    if (!(radius > 0.0f)) return;
    segments = std::max(3, segments);

    glm::vec2 center = transformPoint({x, y});

    // Generate fan triangles
    for (int i = 0; i < segments; ++i) {
        float a0 = TAU * static_cast<float>(i) / segments;
        float a1 = TAU * static_cast<float>(i + 1) / segments;

        glm::vec2 p0 = transformPoint({x + radius * std::cos(a0), y + radius * std::sin(a0)});
        glm::vec2 p1 = transformPoint({x + radius * std::cos(a1), y + radius * std::sin(a1)});
        m_renderer->triangleFilled(center, p0, p1);
    }

    if (m_renderer->flush(makePaint(m_state, m_state.fillColor, m_state.fillGradient))) {
        m_renderer->stats().fills++;
    }
}

void Canvas::strokeCircle(float x, float y, float radius, int segments) {
    if (!(radius > 0.0f)) return;
    segments = std::max(3, segments);

    beginPath();
    for (int i = 0; i < segments; ++i) {
        float a = TAU * static_cast<float>(i) / segments;
        if (i == 0) {
            moveTo(x + radius * std::cos(a), y + radius * std::sin(a));
        } else {
            lineTo(x + radius * std::cos(a), y + radius * std::sin(a));
        }
    }
    closePath();
    stroke();
}

// -------------------------------------------------------------------------
// Pixel Access
// -------------------------------------------------------------------------

glm::vec4 Canvas::pixel(int x, int y) const {
    return m_renderer->pixel(x, y);
}

std::vector<uint8_t> Canvas::readPixels() const {
    return m_renderer->readPixels();
}

bool Canvas::savePNG(const std::string& path, std::string& error) const {
    return writePNG(path, m_width, m_height, m_renderer->readPixels(), error);
}

const CanvasStats& Canvas::stats() const {
    return m_renderer->stats();
}

} // namespace pupkit
