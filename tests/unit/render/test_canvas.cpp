/**
 * @file test_canvas.cpp
 * @brief Unit tests for the software Canvas
 *
 * Shapes are placed on whole pixels so coverage at the tested pixels is
 * either full or empty.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pupkit/canvas.h>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>

using namespace pupkit;
using Catch::Matchers::WithinAbs;

namespace {

const glm::vec4 kWhite(1.0f, 1.0f, 1.0f, 1.0f);
const glm::vec4 kRed(1.0f, 0.0f, 0.0f, 1.0f);
const glm::vec4 kBlue(0.0f, 0.0f, 1.0f, 1.0f);

bool isColor(const glm::vec4& a, const glm::vec4& b, float eps = 1e-4f) {
    return std::abs(a.r - b.r) < eps && std::abs(a.g - b.g) < eps &&
           std::abs(a.b - b.b) < eps && std::abs(a.a - b.a) < eps;
}

} // namespace

TEST_CASE("Canvas construction", "[canvas]") {
    SECTION("new canvas is transparent") {
        Canvas canvas(16, 8);
        REQUIRE(canvas.width() == 16);
        REQUIRE(canvas.height() == 8);
        REQUIRE(isColor(canvas.pixel(3, 3), glm::vec4(0.0f)));
        REQUIRE(canvas.stateDepth() == 0);
    }

    SECTION("non-positive size throws") {
        REQUIRE_THROWS_AS(Canvas(0, 10), std::runtime_error);
        REQUIRE_THROWS_AS(Canvas(10, -1), std::runtime_error);
    }

    SECTION("pixels outside the canvas are transparent") {
        Canvas canvas(4, 4);
        canvas.clear(kWhite);
        REQUIRE(isColor(canvas.pixel(-1, 0), glm::vec4(0.0f)));
        REQUIRE(isColor(canvas.pixel(0, 4), glm::vec4(0.0f)));
    }
}

TEST_CASE("Canvas fillRect", "[canvas]") {
    Canvas canvas(20, 20);
    canvas.clear(kWhite);
    canvas.fillStyle(kRed);
    canvas.fillRect(2, 2, 4, 4);

    REQUIRE(isColor(canvas.pixel(2, 2), kRed));
    REQUIRE(isColor(canvas.pixel(5, 5), kRed));
    REQUIRE(isColor(canvas.pixel(6, 3), kWhite));
    REQUIRE(isColor(canvas.pixel(3, 1), kWhite));
    REQUIRE(canvas.stats().fills == 1);
}

TEST_CASE("Canvas global alpha blends once", "[canvas]") {
    Canvas canvas(40, 40);
    canvas.clear(kWhite);

    SECTION("translucent fill") {
        canvas.globalAlpha(0.5f);
        canvas.fillStyle(kRed);
        canvas.fillRect(0, 0, 10, 10);
        REQUIRE(isColor(canvas.pixel(5, 5), glm::vec4(1.0f, 0.5f, 0.5f, 1.0f)));
    }

    SECTION("stroke joins do not double-blend") {
        canvas.strokeStyle(0.0f, 0.0f, 0.0f, 0.5f);
        canvas.lineWidth(4.0f);
        canvas.lineJoin(LineJoin::Round);
        canvas.beginPath();
        canvas.pathRect(10, 10, 20, 20);
        canvas.stroke();

        REQUIRE(isColor(canvas.pixel(10, 10), glm::vec4(0.5f, 0.5f, 0.5f, 1.0f)));
        REQUIRE(isColor(canvas.pixel(20, 10), glm::vec4(0.5f, 0.5f, 0.5f, 1.0f)));
        REQUIRE(isColor(canvas.pixel(20, 20), kWhite));
        REQUIRE(canvas.stats().strokes == 1);
    }

    SECTION("alpha is clamped") {
        canvas.globalAlpha(3.0f);
        REQUIRE(canvas.state().globalAlpha == 1.0f);
        canvas.globalAlpha(-1.0f);
        REQUIRE(canvas.state().globalAlpha == 0.0f);
    }
}

TEST_CASE("Canvas transforms", "[canvas]") {
    Canvas canvas(40, 40);
    canvas.clear(kWhite);
    canvas.fillStyle(kBlue);

    SECTION("translate moves shapes") {
        canvas.translate(10, 10);
        canvas.fillRect(0, 0, 4, 4);
        REQUIRE(isColor(canvas.pixel(11, 11), kBlue));
        REQUIRE(isColor(canvas.pixel(1, 1), kWhite));
    }

    SECTION("scale grows shapes") {
        canvas.scale(2.0f);
        canvas.fillRect(1, 1, 2, 2);
        REQUIRE(isColor(canvas.pixel(2, 2), kBlue));
        REQUIRE(isColor(canvas.pixel(5, 5), kBlue));
        REQUIRE(isColor(canvas.pixel(6, 6), kWhite));
    }

    SECTION("rotate by a quarter turn") {
        canvas.translate(20, 20);
        canvas.rotate(glm::half_pi<float>());
        canvas.fillRect(0, 0, 10, 2);
        // +x maps to +y
        REQUIRE(isColor(canvas.pixel(19, 25), kBlue));
        REQUIRE(isColor(canvas.pixel(25, 20), kWhite));
    }

    SECTION("flipHorizontal mirrors the region") {
        canvas.flipHorizontal(40.0f);
        canvas.fillRect(0, 0, 4, 4);
        REQUIRE(isColor(canvas.pixel(37, 1), kBlue));
        REQUIRE(isColor(canvas.pixel(1, 1), kWhite));
    }

    SECTION("reset and set transform") {
        canvas.translate(5, 5);
        canvas.resetTransform();
        REQUIRE(canvas.getTransform() == glm::mat3(1.0f));

        glm::mat3 m(1.0f);
        m[2][0] = 30.0f;
        canvas.setTransform(m);
        canvas.fillRect(0, 0, 2, 2);
        REQUIRE(isColor(canvas.pixel(31, 1), kBlue));
    }
}

TEST_CASE("Canvas save and restore", "[canvas]") {
    Canvas canvas(20, 20);

    canvas.fillStyle(kRed);
    canvas.lineWidth(3.0f);
    canvas.save();
    REQUIRE(canvas.stateDepth() == 1);

    canvas.fillStyle(kBlue);
    canvas.lineWidth(9.0f);
    canvas.translate(4, 4);
    canvas.restore();

    REQUIRE(canvas.stateDepth() == 0);
    REQUIRE(isColor(canvas.state().fillColor, kRed));
    REQUIRE(canvas.state().lineWidth == 3.0f);
    REQUIRE(canvas.getTransform() == glm::mat3(1.0f));

    SECTION("restore on an empty stack is ignored") {
        canvas.restore();
        REQUIRE(isColor(canvas.state().fillColor, kRed));
    }
}

TEST_CASE("Canvas gradients", "[canvas]") {
    Canvas canvas(100, 10);

    SECTION("linear gradient samples along its axis") {
        CanvasGradient g = canvas.createLinearGradient(0, 0, 100, 0);
        g.addColorStop(0.0f, 0, 0, 0, 1);
        g.addColorStop(1.0f, 1, 1, 1, 1);

        REQUIRE_THAT(g.sample({50, 0}).r, WithinAbs(0.5f, 1e-4));
        REQUIRE_THAT(g.sample({-20, 5}).r, WithinAbs(0.0f, 1e-6));
        REQUIRE_THAT(g.sample({140, 5}).r, WithinAbs(1.0f, 1e-6));

        canvas.fillStyle(g);
        canvas.fillRect(0, 0, 100, 10);
        REQUIRE(canvas.pixel(10, 5).r < canvas.pixel(90, 5).r);
    }

    SECTION("radial gradient runs from r0 to r1") {
        CanvasGradient g = canvas.createRadialGradient(0, 0, 10, 0, 0, 20);
        g.addColorStop(0.0f, kRed);
        g.addColorStop(1.0f, kBlue);

        REQUIRE(isColor(g.sample({5, 0}), kRed));
        REQUIRE(isColor(g.sample({0, 25}), kBlue));
        REQUIRE_THAT(g.sample({15, 0}).b, WithinAbs(0.5f, 1e-4));
    }

    SECTION("stops stay sorted and are capped") {
        CanvasGradient g;
        g.addColorStop(0.8f, kBlue);
        g.addColorStop(0.2f, kRed);
        REQUIRE(g.colorStops.front().offset == 0.2f);

        for (int i = 0; i < 20; ++i) {
            g.addColorStop(0.5f, kWhite);
        }
        REQUIRE(g.colorStops.size() == static_cast<size_t>(CanvasGradient::MAX_COLOR_STOPS));
    }

    SECTION("gradient follows the transform") {
        CanvasGradient g = canvas.createLinearGradient(0, 0, 10, 0);
        g.addColorStop(0.0f, kRed);
        g.addColorStop(1.0f, kBlue);

        canvas.translate(80, 0);
        canvas.fillStyle(g);
        canvas.fillRect(0, 0, 10, 10);

        REQUIRE(canvas.pixel(80, 5).r > 0.9f);
        REQUIRE(canvas.pixel(89, 5).b > 0.9f);
    }

    SECTION("solid style clears the gradient") {
        CanvasGradient g = canvas.createLinearGradient(0, 0, 10, 0);
        g.addColorStop(0.0f, kRed);
        canvas.fillStyle(g);
        canvas.fillStyle(kBlue);
        REQUIRE(canvas.state().fillGradient == nullptr);
    }
}

TEST_CASE("Canvas path fills", "[canvas]") {
    Canvas canvas(100, 100);
    canvas.clear(kWhite);
    canvas.fillStyle(kRed);

    SECTION("triangle") {
        canvas.beginPath();
        canvas.moveTo(10, 10);
        canvas.lineTo(60, 10);
        canvas.lineTo(10, 60);
        canvas.closePath();
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(15, 15), kRed));
        REQUIRE(isColor(canvas.pixel(55, 55), kWhite));
    }

    SECTION("disjoint subpaths fill independently") {
        canvas.beginPath();
        canvas.pathRect(0, 0, 10, 10);
        canvas.pathRect(50, 50, 10, 10);
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(5, 5), kRed));
        REQUIRE(isColor(canvas.pixel(55, 55), kRed));
        REQUIRE(isColor(canvas.pixel(30, 30), kWhite));
        REQUIRE(canvas.stats().fills == 1);
    }

    SECTION("ellipse") {
        canvas.beginPath();
        canvas.ellipse(50, 50, 30, 10, 0.0f, 0.0f, glm::two_pi<float>());
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(50, 50), kRed));
        REQUIRE(isColor(canvas.pixel(75, 50), kRed));
        REQUIRE(isColor(canvas.pixel(50, 65), kWhite));
    }

    SECTION("round rect cuts its corners") {
        canvas.beginPath();
        canvas.roundRect(0, 0, 40, 40, 12);
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(20, 20), kRed));
        REQUIRE(isColor(canvas.pixel(20, 1), kRed));
        REQUIRE(isColor(canvas.pixel(0, 0), kWhite));
    }

    SECTION("arc closes into a wedge") {
        canvas.beginPath();
        canvas.moveTo(50, 50);
        canvas.arc(50, 50, 30, 0.0f, glm::half_pi<float>());
        canvas.closePath();
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(60, 60), kRed));
        REQUIRE(isColor(canvas.pixel(70, 55), kRed));
        REQUIRE(isColor(canvas.pixel(40, 60), kWhite));
        REQUIRE(isColor(canvas.pixel(60, 40), kWhite));
    }

    SECTION("zero radius arc adds nothing") {
        canvas.beginPath();
        canvas.arc(50, 50, 0.0f, 0.0f, glm::pi<float>());
        canvas.fill();
        REQUIRE(canvas.stats().fills == 0);
    }

    SECTION("quadratic curve fill") {
        canvas.beginPath();
        canvas.moveTo(10, 80);
        canvas.quadraticCurveTo(50, 0, 90, 80);
        canvas.closePath();
        canvas.fill();

        REQUIRE(isColor(canvas.pixel(50, 60), kRed));
        REQUIRE(isColor(canvas.pixel(50, 20), kWhite));
    }

    SECTION("empty path draws nothing") {
        canvas.beginPath();
        canvas.fill();
        canvas.stroke();
        REQUIRE(canvas.stats().fills == 0);
        REQUIRE(canvas.stats().strokes == 0);
    }

    SECTION("non-finite coordinates are ignored") {
        float nan = std::numeric_limits<float>::quiet_NaN();
        canvas.beginPath();
        canvas.moveTo(nan, 0);
        canvas.lineTo(10, nan);
        canvas.lineTo(nan, nan);
        canvas.fill();
        canvas.fillRect(nan, 0, 10, 10);
        REQUIRE(canvas.stats().fills == 0);
    }
}

TEST_CASE("Canvas circles", "[canvas]") {
    Canvas canvas(60, 60);
    canvas.clear(kWhite);
    canvas.fillStyle(kBlue);
    canvas.fillCircle(30, 30, 20);

    REQUIRE(isColor(canvas.pixel(30, 30), kBlue));
    REQUIRE(isColor(canvas.pixel(45, 30), kBlue));
    REQUIRE(isColor(canvas.pixel(12, 12), kWhite));

    SECTION("stroked circle leaves the center empty") {
        canvas.clear(kWhite);
        canvas.strokeStyle(kRed);
        canvas.lineWidth(2.0f);
        canvas.strokeCircle(30, 30, 20);
        REQUIRE(isColor(canvas.pixel(30, 30), kWhite));
        REQUIRE(canvas.pixel(49, 30).g < 0.5f);
    }
}

TEST_CASE("Canvas strokes", "[canvas]") {
    Canvas canvas(60, 60);
    canvas.clear(kWhite);
    canvas.strokeStyle(kRed);

    SECTION("line width scales with the transform") {
        canvas.scale(2.0f);
        canvas.lineWidth(2.0f);
        canvas.beginPath();
        canvas.moveTo(5, 10);
        canvas.lineTo(20, 10);
        canvas.stroke();

        REQUIRE(isColor(canvas.pixel(20, 18), kRed));
        REQUIRE(isColor(canvas.pixel(20, 21), kRed));
        REQUIRE(isColor(canvas.pixel(20, 17), kWhite));
        REQUIRE(isColor(canvas.pixel(20, 22), kWhite));
    }

    SECTION("square caps extend past the endpoints") {
        canvas.lineWidth(4.0f);
        canvas.lineCap(LineCap::Square);
        canvas.beginPath();
        canvas.moveTo(10, 30);
        canvas.lineTo(40, 30);
        canvas.stroke();
        REQUIRE(isColor(canvas.pixel(8, 30), kRed));
        REQUIRE(isColor(canvas.pixel(41, 30), kRed));
    }

    SECTION("butt caps stop at the endpoints") {
        canvas.lineWidth(4.0f);
        canvas.lineCap(LineCap::Butt);
        canvas.beginPath();
        canvas.moveTo(10, 30);
        canvas.lineTo(40, 30);
        canvas.stroke();
        REQUIRE(isColor(canvas.pixel(8, 30), kWhite));
        REQUIRE(isColor(canvas.pixel(10, 30), kRed));
    }

    SECTION("round caps add a half disc") {
        canvas.lineWidth(8.0f);
        canvas.lineCap(LineCap::Round);
        canvas.beginPath();
        canvas.moveTo(20, 30);
        canvas.lineTo(40, 30);
        canvas.stroke();
        REQUIRE(isColor(canvas.pixel(17, 30), kRed));
        REQUIRE(isColor(canvas.pixel(16, 26), kWhite));
    }

    SECTION("bezier strokes stay on the canvas") {
        canvas.lineWidth(3.0f);
        canvas.beginPath();
        canvas.moveTo(5, 55);
        canvas.bezierCurveTo(5, 5, 55, 5, 55, 55);
        canvas.stroke();
        REQUIRE(canvas.stats().strokes == 1);
        REQUIRE(canvas.stats().triangles > 0);
        REQUIRE(isColor(canvas.pixel(5, 54), kRed));
    }

    SECTION("bevel is the default join") {
        REQUIRE(canvas.state().lineJoin == LineJoin::Bevel);
        canvas.lineWidth(16.0f);
        canvas.beginPath();
        canvas.moveTo(5, 30);
        canvas.lineTo(30, 30);
        canvas.lineTo(30, 55);
        canvas.stroke();
        REQUIRE(isColor(canvas.pixel(30, 28), kRed));
        REQUIRE(isColor(canvas.pixel(33, 24), kWhite));
    }

    SECTION("round joins fill the outer corner") {
        canvas.lineWidth(16.0f);
        canvas.lineJoin(LineJoin::Round);
        canvas.beginPath();
        canvas.moveTo(5, 30);
        canvas.lineTo(30, 30);
        canvas.lineTo(30, 55);
        canvas.stroke();
        REQUIRE(isColor(canvas.pixel(33, 24), kRed));
    }

    SECTION("invalid line width keeps the previous one") {
        canvas.lineWidth(5.0f);
        canvas.lineWidth(-2.0f);
        canvas.lineWidth(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(canvas.state().lineWidth == 5.0f);
    }
}

TEST_CASE("Canvas clear resets statistics", "[canvas]") {
    Canvas canvas(10, 10);
    canvas.fillRect(0, 0, 5, 5);
    REQUIRE(canvas.stats().fills == 1);
    REQUIRE(canvas.stats().pixelsBlended == 25);

    canvas.clear(0, 0, 0, 0);
    REQUIRE(canvas.stats().fills == 0);
    REQUIRE(canvas.stats().pixelsBlended == 0);
    REQUIRE(isColor(canvas.pixel(1, 1), glm::vec4(0.0f)));
}

TEST_CASE("Canvas pixel export", "[canvas]") {
    Canvas canvas(3, 2);
    canvas.clear(kRed);

    SECTION("readPixels returns RGBA8 rows") {
        auto bytes = canvas.readPixels();
        REQUIRE(bytes.size() == 3u * 2u * 4u);
        REQUIRE(bytes[0] == 255);
        REQUIRE(bytes[1] == 0);
        REQUIRE(bytes[2] == 0);
        REQUIRE(bytes[3] == 255);
    }

    SECTION("savePNG writes a file") {
        auto path = std::filesystem::temp_directory_path() / "pupkit_canvas_test.png";
        std::string error;
        REQUIRE(canvas.savePNG(path.string(), error));
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::file_size(path) > 0);
        std::filesystem::remove(path);
    }

    SECTION("savePNG reports unwritable paths") {
        std::string error;
        REQUIRE_FALSE(canvas.savePNG("/nonexistent-pupkit-dir/out.png", error));
        REQUIRE_FALSE(error.empty());
    }
}
