#pragma once

/**
 * @file color.h
 * @brief RGBA colour with hex parsing and WCAG luminance
 *
 * Palettes, control messages and the settings file all carry colours as
 * "#rrggbb" strings; scenes upload them to uniforms as glm::vec4.
 *
 * @par Example
 * @code
 * Color c = Color::fromHex("#22cc88");
 * Color mid = c.lerp(Color::fromHex("#cc2288"), 0.5f);
 * std::string s = mid.toHex();
 * @endcode
 */

#include <glm/glm.hpp>
#include <string>
#include <cstdint>
#include <cmath>
#include <algorithm>

namespace lucent {

/**
 * @brief RGBA colour stored in the 0-1 range
 */
class Color {
public:
    float r, g, b, a;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// @brief Default constructor (opaque black)
    constexpr Color() : r(0.0f), g(0.0f), b(0.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    // =========================================================================
    // Conversion
    // =========================================================================

    /// @brief Conversion to glm::vec4 for uniform upload
    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create color from hex integer (0xRRGGBB)
     */
    static constexpr Color fromHex(uint32_t hex) {
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Parse a hex string ("#RRGGBB", "RRGGBB", "#RGB")
     * @param hex Input string, case-insensitive
     * @param out Receives the colour on success
     * @return false if @p hex is not a valid colour; @p out is untouched
     */
    static bool parseHex(const std::string& hex, Color& out) {
        std::string s = hex;

        // Strip leading #
        if (!s.empty() && s[0] == '#') {
            s = s.substr(1);
        }

        // Expand #RGB shorthand
        if (s.length() == 3) {
            s = {s[0], s[0], s[1], s[1], s[2], s[2]};
        }
        if (s.length() != 6) {
            return false;
        }

        uint32_t val = 0;
        for (char c : s) {
            int digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else return false;
            val = (val << 4) | static_cast<uint32_t>(digit);
        }

        out = fromHex(val);
        return true;
    }

    /**
     * @brief Create color from hex string
     * @return Color (returns magenta on parse error for visibility)
     */
    static Color fromHex(const std::string& hex) {
        Color c;
        if (parseHex(hex, c)) {
            return c;
        }
        // Parse error - return visible magenta
        return Color(1.0f, 0.0f, 1.0f, 1.0f);
    }

    /**
     * @brief Create color from 0-255 byte values
     */
    static constexpr Color fromBytes(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
    }

    // =========================================================================
    // Luminance
    // =========================================================================

    /**
     * @brief WCAG 2.0 relative luminance (sRGB linearised, 0-1)
     */
    float relativeLuminance() const {
        auto channel = [](float c) {
            return c <= 0.03928f ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
        };
        return 0.2126f * channel(r) + 0.7152f * channel(g) + 0.0722f * channel(b);
    }

    // =========================================================================
    // Blending / Interpolation
    // =========================================================================

    /**
     * @brief Linear interpolation between two colors
     * @param t Interpolation factor (0 = this, 1 = other)
     */
    Color lerp(const Color& other, float t) const {
        return Color(
            r + (other.r - r) * t,
            g + (other.g - g) * t,
            b + (other.b - b) * t,
            a + (other.a - a) * t
        );
    }

    // =========================================================================
    // Data Access
    // =========================================================================

    /// @brief Component rounded to a byte
    static uint8_t toByte(float c) {
        return static_cast<uint8_t>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f));
    }

    /**
     * @brief Convert to lowercase "#rrggbb" (alpha dropped)
     */
    std::string toHex() const {
        static const char* digits = "0123456789abcdef";
        std::string out = "#";
        for (float c : {r, g, b}) {
            uint8_t v = toByte(c);
            out += digits[v >> 4];
            out += digits[v & 0x0F];
        }
        return out;
    }

    /// @brief Equality at 8-bit precision
    bool operator==(const Color& other) const {
        return toByte(r) == toByte(other.r) && toByte(g) == toByte(other.g) &&
               toByte(b) == toByte(other.b) && toByte(a) == toByte(other.a);
    }

    bool operator!=(const Color& other) const { return !(*this == other); }
};

} // namespace lucent
