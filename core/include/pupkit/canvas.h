#pragma once

/**
 * @file canvas.h
 * @brief Immediate-mode 2D drawing surface with a software rasterizer
 *
 * HTML Canvas 2D-style API over an RGBA float pixel buffer. Paths are
 * tessellated to polygons, filled by ear-clipping triangulation and stroked
 * as segment quads with caps and joins. Every fill or stroke covers each
 * pixel at most once, so translucent shapes blend exactly once.
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pupkit {

class CanvasRenderer;

// -------------------------------------------------------------------------
// Canvas State Types (HTML Canvas 2D-style)
// -------------------------------------------------------------------------

/// @brief Line cap style for stroke endpoints
enum class LineCap {
    Butt,   ///< Flat end at exactly the endpoint
    Round,  ///< Semicircle at endpoint
    Square  ///< Flat end extended by half line width
};

/// @brief Line join style for stroke corners
enum class LineJoin {
    Bevel,  ///< Flat diagonal corner
    Round   ///< Rounded corner
};

/// @brief Path command types for vector path construction
enum class PathCommandType {
    MoveTo,
    LineTo,
    Arc,
    Ellipse,
    QuadraticCurveTo,
    BezierCurveTo,
    ClosePath
};

/// @brief A single path command with parameters
struct PathCommand {
    PathCommandType type;
    std::vector<float> params;
};

// -------------------------------------------------------------------------
// Gradient Types
// -------------------------------------------------------------------------

/// @brief Gradient type
enum class GradientType {
    Linear,  ///< Linear gradient along a line
    Radial   ///< Radial gradient between two radii around a center
};

/// @brief A color stop in a gradient
struct ColorStop {
    float offset;    ///< Position in gradient (0.0 to 1.0)
    glm::vec4 color; ///< Color at this position (RGBA)
};

/**
 * @brief Gradient for Canvas fill/stroke styles
 *
 * Coordinates are in user space at the time of the fill, so a gradient
 * follows the shape through translate/rotate/scale.
 *
 * @par Example
 * @code
 * auto gradient = canvas.createRadialGradient(-10, -12, 0, -10, -12, 60);
 * gradient.addColorStop(0.0f, coat.lighter(0.14f));
 * gradient.addColorStop(1.0f, coat);
 * canvas.fillStyle(gradient);
 * @endcode
 */
class CanvasGradient {
public:
    /**
     * @brief Add a color stop to the gradient
     * @param offset Position in gradient (clamped to 0-1)
     * @param color Color at this position (RGBA, 0-1 range)
     */
    void addColorStop(float offset, const glm::vec4& color);

    void addColorStop(float offset, float r, float g, float b, float a = 1.0f);

    /// @brief Color at a user-space position
    glm::vec4 sample(const glm::vec2& pos) const;

    GradientType type = GradientType::Linear;
    glm::vec2 p0 = {0, 0};  ///< Start point (linear) or center (radial)
    glm::vec2 p1 = {0, 0};  ///< End point (linear)
    float r0 = 0.0f;        ///< Inner radius (radial only)
    float r1 = 0.0f;        ///< Outer radius (radial only)
    std::vector<ColorStop> colorStops;

    static constexpr int MAX_COLOR_STOPS = 8;
};

/// @brief Canvas drawing state (saved/restored with save()/restore())
struct CanvasState {
    glm::vec4 fillColor = {0.0f, 0.0f, 0.0f, 1.0f};
    glm::vec4 strokeColor = {0.0f, 0.0f, 0.0f, 1.0f};
    float lineWidth = 1.0f;
    LineCap lineCap = LineCap::Butt;
    LineJoin lineJoin = LineJoin::Bevel;
    float globalAlpha = 1.0f;
    glm::mat3 transform = glm::mat3(1.0f);

    // Gradient styles (optional, takes precedence over solid color when set)
    std::shared_ptr<const CanvasGradient> fillGradient;
    std::shared_ptr<const CanvasGradient> strokeGradient;
};

/// @brief Per-frame draw counters, reset by clear()
struct CanvasStats {
    int fills = 0;         ///< fill(), fillRect(), fillCircle() calls that produced triangles
    int strokes = 0;       ///< stroke() calls that produced triangles
    int triangles = 0;     ///< Triangles rasterized
    int64_t pixelsBlended = 0;
};

/**
 * @brief Immediate-mode 2D drawing surface
 *
 * @par Example
 * @code
 * Canvas canvas(256, 256);
 * canvas.clear(1, 1, 1, 1);
 *
 * canvas.fillStyle({0.2, 0.4, 0.8, 1.0});
 * canvas.fillRect(10, 10, 200, 50);
 *
 * canvas.save();
 * canvas.translate(128, 128);
 * canvas.rotate(0.3f);
 * canvas.beginPath();
 * canvas.roundRect(-40, -20, 80, 40, 12);
 * canvas.fill();
 * canvas.restore();
 *
 * std::string error;
 * canvas.savePNG("out.png", error);
 * @endcode
 */
class Canvas {
public:
    /**
     * @brief Create a transparent canvas
     * @throw std::runtime_error if either dimension is not positive
     */
    Canvas(int width, int height);
    ~Canvas();

    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    int width() const { return m_width; }
    int height() const { return m_height; }

    // -------------------------------------------------------------------------
    /// @name Frame Control
    /// @{

    /**
     * @brief Fill every pixel with a color and reset draw statistics
     *
     * Does not touch the state stack or the current path.
     */
    void clear(float r, float g, float b, float a = 1.0f);
    void clear(const glm::vec4& color);

    /// @}
    // -------------------------------------------------------------------------
    /// @name State Management (HTML Canvas 2D-style)
    /// @{

    void fillStyle(const glm::vec4& color);
    void fillStyle(float r, float g, float b, float a = 1.0f);
    void fillStyle(const CanvasGradient& gradient);

    void strokeStyle(const glm::vec4& color);
    void strokeStyle(float r, float g, float b, float a = 1.0f);
    void strokeStyle(const CanvasGradient& gradient);

    /**
     * @brief Set line width for stroke operations
     * @param width Line width in user units (scaled by the current transform)
     */
    void lineWidth(float width);
    void lineCap(LineCap cap);
    void lineJoin(LineJoin join);

    /**
     * @brief Set global alpha for all drawing operations
     * @param alpha Alpha multiplier (0-1)
     */
    void globalAlpha(float alpha);

    /// @brief Push current state onto stack
    void save();

    /// @brief Pop state from stack (ignored when the stack is empty)
    void restore();

    const CanvasState& state() const { return m_state; }
    size_t stateDepth() const { return m_stateStack.size(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Gradients
    /// @{

    CanvasGradient createLinearGradient(float x0, float y0, float x1, float y1);

    /**
     * @brief Create a radial gradient
     *
     * Colors run from radius r0 to r1 around (x0, y0). The second center is
     * accepted for API compatibility and ignored.
     */
    CanvasGradient createRadialGradient(float x0, float y0, float r0,
                                        float x1, float y1, float r1);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Transforms
    /// @{

    void translate(float x, float y);
    void rotate(float radians);
    void scale(float x, float y);
    void scale(float uniform);
    void setTransform(const glm::mat3& matrix);
    void resetTransform();
    glm::mat3 getTransform() const;

    /**
     * @brief Mirror the x axis around the vertical center of a region
     * @param regionWidth Width of the region being mirrored (usually width())
     */
    void flipHorizontal(float regionWidth);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Path API
    /// @{

    void beginPath();
    void closePath();
    void moveTo(float x, float y);
    void lineTo(float x, float y);

    /**
     * @brief Add a circular arc
     * @param startAngle Start angle in radians (0 = right, PI/2 = down)
     * @param counterclockwise Sweep direction
     */
    void arc(float x, float y, float radius, float startAngle, float endAngle,
             bool counterclockwise = false);

    /**
     * @brief Add an elliptical arc
     * @param rotation Rotation of the ellipse axes in radians
     */
    void ellipse(float x, float y, float radiusX, float radiusY, float rotation,
                 float startAngle, float endAngle, bool counterclockwise = false);

    void quadraticCurveTo(float cpx, float cpy, float x, float y);
    void bezierCurveTo(float cp1x, float cp1y, float cp2x, float cp2y, float x, float y);

    /// @brief Add a closed rectangle subpath
    void pathRect(float x, float y, float w, float h);

    /// @brief Add a closed rounded rectangle subpath (radius clamped to half the short side)
    void roundRect(float x, float y, float w, float h, float radius);

    /// @brief Fill the current path
    void fill();

    /// @brief Stroke the current path
    void stroke();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Convenience Methods
    /// @{

    void fillRect(float x, float y, float w, float h);
    void fillCircle(float x, float y, float radius, int segments = 32);
    void strokeCircle(float x, float y, float radius, int segments = 32);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Pixel Access
    /// @{

    /// @brief Non-premultiplied RGBA at a pixel (transparent outside the canvas)
    glm::vec4 pixel(int x, int y) const;

    /// @brief Row-major RGBA8 copy of the pixels, top row first
    std::vector<uint8_t> readPixels() const;

    /**
     * @brief Write the pixels as a PNG
     * @param path Output file
     * @param error Receives the failure reason
     * @return false if the file could not be written
     */
    bool savePNG(const std::string& path, std::string& error) const;

    const CanvasStats& stats() const;

    /// @}

private:
    struct Subpath {
        std::vector<glm::vec2> points;
        bool closed = false;
    };

    glm::vec2 transformPoint(const glm::vec2& p) const;
    float deviceLineWidth() const;

    void tessellateArc(std::vector<glm::vec2>& points, float cx, float cy, float radius,
                       float startAngle, float endAngle, bool ccw) const;
    void tessellateEllipse(std::vector<glm::vec2>& points, float cx, float cy,
                           float rx, float ry, float rotation,
                           float startAngle, float endAngle, bool ccw) const;
    void tessellateQuadratic(std::vector<glm::vec2>& points, const glm::vec2& start,
                             float cpx, float cpy, float x, float y) const;
    void tessellateBezier(std::vector<glm::vec2>& points, const glm::vec2& start,
                          float cp1x, float cp1y, float cp2x, float cp2y, float x, float y) const;
    std::vector<Subpath> pathToPolygons() const;

    void generateStrokeGeometry(const std::vector<glm::vec2>& points, bool closed);
    void addRoundCap(const glm::vec2& center, const glm::vec2& dir, float halfWidth);
    void addJoin(const glm::vec2& p, const glm::vec2& dir, const glm::vec2& nextDir, float halfWidth);

    int m_width;
    int m_height;
    std::unique_ptr<CanvasRenderer> m_renderer;

    CanvasState m_state;
    std::vector<CanvasState> m_stateStack;

    std::vector<PathCommand> m_currentPath;
    glm::vec2 m_pathCursor = {0, 0};
    glm::vec2 m_pathStart = {0, 0};
};

} // namespace pupkit
