/**
 * @file color.hpp
 * @brief RGB colour with HSL offsetting for particle tints
 */

#pragma once

#include <cstdint>

namespace Particles {

/**
 * @struct Color
 * @brief RGB colour, each channel in [0, 1]
 */
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;

    Color() = default;
    Color(float r, float g, float b) : r(r), g(g), b(b) {}

    /**
     * @brief Builds a colour from a 0xRRGGBB value
     */
    static Color fromHex(uint32_t hex);

    uint32_t toHex() const;

    /**
     * @brief Shifts the colour in HSL space
     *
     * Hue wraps around [0, 1); saturation and lightness are clamped to [0, 1].
     *
     * @param dh Hue offset, in turns
     * @param ds Saturation offset
     * @param dl Lightness offset
     */
    Color& offsetHSL(double dh, double ds, double dl);

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

} // namespace Particles
