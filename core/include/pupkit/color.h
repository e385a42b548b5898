#pragma once

/**
 * @file color.h
 * @brief Coat and paint colors for breed tables and the body painter
 *
 * Converts implicitly to glm::vec4 so it can be handed straight to the
 * Canvas API.
 *
 * @par Example
 * @code
 * Color coat = Color::fromHex(0xDAA520);
 * canvas.fillStyle(coat.lighter(0.06f));
 * Color backLeg = coat.scaled(0.88f);   // depth-shaded copy
 * @endcode
 */

#include <glm/glm.hpp>
#include <string>
#include <cstdint>
#include <cmath>
#include <cctype>
#include <algorithm>

namespace pupkit {

/**
 * @brief RGBA color in 0-1 range
 */
class Color {
public:
    float r, g, b, a;

    /// @brief Opaque white
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    // -------------------------------------------------------------------------
    /// @name Hex
    /// @{

    /**
     * @brief Color from 0xRRGGBB, or 0xRRGGBBAA when above 0xFFFFFF
     *
     * @code
     * Color gold = Color::fromHex(0xDAA520);
     * Color blush = Color::fromHex(0xFF999973);
     * @endcode
     */
    static constexpr Color fromHex(uint32_t hex) {
        if (hex > 0xFFFFFF) {
            return Color(((hex >> 24) & 0xFF) / 255.0f,
                         ((hex >> 16) & 0xFF) / 255.0f,
                         ((hex >> 8) & 0xFF) / 255.0f,
                         (hex & 0xFF) / 255.0f);
        }
        return Color(((hex >> 16) & 0xFF) / 255.0f,
                     ((hex >> 8) & 0xFF) / 255.0f,
                     (hex & 0xFF) / 255.0f);
    }

    /**
     * @brief Parse a breed file color ("#RRGGBB", "#RRGGBBAA", or either without '#')
     * @param hex Hex string
     * @param out Parsed color (untouched on failure)
     * @return false if the string is not a valid hex color
     */
    static bool parseHex(const std::string& hex, Color& out) {
        std::string s = hex;
        if (!s.empty() && s[0] == '#') {
            s = s.substr(1);
        }
        if (s.length() != 6 && s.length() != 8) {
            return false;
        }
        for (char c : s) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        uint32_t val = static_cast<uint32_t>(std::stoul(s, nullptr, 16));
        if (s.length() == 6) {
            out = fromHex(val);
        } else {
            // 8 digits always carries alpha, even when red is zero
            out = Color(((val >> 24) & 0xFF) / 255.0f,
                        ((val >> 16) & 0xFF) / 255.0f,
                        ((val >> 8) & 0xFF) / 255.0f,
                        (val & 0xFF) / 255.0f);
        }
        return true;
    }

    /// @brief Pack as 0xRRGGBB (alpha dropped), for logs and breed files
    uint32_t toHex() const {
        auto byte = [](float v) {
            return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        };
        return (byte(r) << 16) | (byte(g) << 8) | byte(b);
    }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Shading
    /// @{

    constexpr Color withAlpha(float newAlpha) const {
        return Color(r, g, b, newAlpha);
    }

    /// @brief Add amount to each RGB channel, saturating at 1
    Color lighter(float amount) const {
        return Color(std::min(1.0f, r + amount),
                     std::min(1.0f, g + amount),
                     std::min(1.0f, b + amount),
                     a);
    }

    /// @brief Multiply RGB by factor; far-side parts use kDepthMultiplier
    Color scaled(float factor) const {
        return Color(std::clamp(r * factor, 0.0f, 1.0f),
                     std::clamp(g * factor, 0.0f, 1.0f),
                     std::clamp(b * factor, 0.0f, 1.0f),
                     a);
    }

    /// @brief Warm clay highlight: +35/+25/+10 on the 0-255 scale
    Color highlight() const {
        return Color(std::min(1.0f, r + 35.0f / 255.0f),
                     std::min(1.0f, g + 25.0f / 255.0f),
                     std::min(1.0f, b + 10.0f / 255.0f),
                     a);
    }

    /// @}

    constexpr bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }

    static const Color White;
};

inline constexpr Color Color::White{1.0f, 1.0f, 1.0f};

} // namespace pupkit
