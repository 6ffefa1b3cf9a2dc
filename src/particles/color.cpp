#include "reefsim/particles/color.hpp"

#include <algorithm>
#include <cmath>

namespace Particles {

namespace {

struct HSL {
    double h;
    double s;
    double l;
};

HSL toHSL(const Color& c)
{
    double const r = c.r;
    double const g = c.g;
    double const b = c.b;
    double const maxC = std::max({r, g, b});
    double const minC = std::min({r, g, b});
    double const l = (maxC + minC) / 2.0;

    if (maxC == minC) {
        return {0.0, 0.0, l};
    }

    double const delta = maxC - minC;
    double const s = l <= 0.5 ? delta / (maxC + minC) : delta / (2.0 - maxC - minC);

    double h = 0.0;
    if (maxC == r) {
        h = (g - b) / delta + (g < b ? 6.0 : 0.0);
    } else if (maxC == g) {
        h = (b - r) / delta + 2.0;
    } else {
        h = (r - g) / delta + 4.0;
    }
    return {h / 6.0, s, l};
}

double hueToRGB(double p, double q, double t)
{
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * 6.0 * (2.0 / 3.0 - t);
    return p;
}

Color fromHSL(double h, double s, double l)
{
    h = h - std::floor(h);
    s = std::clamp(s, 0.0, 1.0);
    l = std::clamp(l, 0.0, 1.0);

    if (s == 0.0) {
        auto const v = static_cast<float>(l);
        return {v, v, v};
    }

    double const q = l <= 0.5 ? l * (1.0 + s) : l + s - l * s;
    double const p = 2.0 * l - q;
    return {static_cast<float>(hueToRGB(p, q, h + 1.0 / 3.0)),
            static_cast<float>(hueToRGB(p, q, h)),
            static_cast<float>(hueToRGB(p, q, h - 1.0 / 3.0))};
}

} // namespace

Color Color::fromHex(uint32_t hex)
{
    return {static_cast<float>((hex >> 16) & 0xff) / 255.0f,
            static_cast<float>((hex >> 8) & 0xff) / 255.0f,
            static_cast<float>(hex & 0xff) / 255.0f};
}

uint32_t Color::toHex() const
{
    auto channel = [](float v) {
        return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
    };
    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

Color& Color::offsetHSL(double dh, double ds, double dl)
{
    HSL const hsl = toHSL(*this);
    *this = fromHSL(hsl.h + dh, hsl.s + ds, hsl.l + dl);
    return *this;
}

} // namespace Particles
