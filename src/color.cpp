#include "color.hpp"

#include <algorithm>
#include <cmath>

namespace pw {

const char* color_name(Color color) {
    switch (color) {
        case Color::Gray: return "gray";
        case Color::Rgb:  return "rgb";
        case Color::Rgba: return "rgba";
        case Color::Hsv:  return "hsv";
        case Color::Xyz:  return "xyz";
    }
    return "unknown";
}

std::optional<Color> color_from_name(const std::string& name) {
    if (name == "gray" || name == "grey") return Color::Gray;
    if (name == "rgb") return Color::Rgb;
    if (name == "rgba") return Color::Rgba;
    if (name == "hsv") return Color::Hsv;
    if (name == "xyz") return Color::Xyz;
    return std::nullopt;
}

namespace {

void hsv_to_rgb(double h, double s, double v, double* rgb) {
    if (s <= 0.0) {
        rgb[0] = rgb[1] = rgb[2] = v;
        return;
    }
    double hh = (h - std::floor(h)) * 6.0;
    int sector = static_cast<int>(hh) % 6;
    double f = hh - std::floor(hh);
    double p = v * (1.0 - s);
    double q = v * (1.0 - s * f);
    double t = v * (1.0 - s * (1.0 - f));
    switch (sector) {
        case 0: rgb[0] = v; rgb[1] = t; rgb[2] = p; break;
        case 1: rgb[0] = q; rgb[1] = v; rgb[2] = p; break;
        case 2: rgb[0] = p; rgb[1] = v; rgb[2] = t; break;
        case 3: rgb[0] = p; rgb[1] = q; rgb[2] = v; break;
        case 4: rgb[0] = t; rgb[1] = p; rgb[2] = v; break;
        default: rgb[0] = v; rgb[1] = p; rgb[2] = q; break;
    }
}

void rgb_to_hsv(const double* rgb, double* hsv) {
    double mx = std::max({rgb[0], rgb[1], rgb[2]});
    double mn = std::min({rgb[0], rgb[1], rgb[2]});
    double delta = mx - mn;
    double h = 0.0;
    if (delta > 0.0) {
        if (mx == rgb[0]) {
            h = (rgb[1] - rgb[2]) / delta;
        } else if (mx == rgb[1]) {
            h = 2.0 + (rgb[2] - rgb[0]) / delta;
        } else {
            h = 4.0 + (rgb[0] - rgb[1]) / delta;
        }
        h /= 6.0;
        if (h < 0.0) h += 1.0;
    }
    hsv[0] = h;
    hsv[1] = mx > 0.0 ? delta / mx : 0.0;
    hsv[2] = mx;
}

// sRGB primaries, D65 white point
void rgb_to_xyz(const double* rgb, double* xyz) {
    xyz[0] = 0.4124564 * rgb[0] + 0.3575761 * rgb[1] + 0.1804375 * rgb[2];
    xyz[1] = 0.2126729 * rgb[0] + 0.7151522 * rgb[1] + 0.0721750 * rgb[2];
    xyz[2] = 0.0193339 * rgb[0] + 0.1191920 * rgb[1] + 0.9503041 * rgb[2];
}

void xyz_to_rgb(const double* xyz, double* rgb) {
    rgb[0] =  3.2404542 * xyz[0] - 1.5371385 * xyz[1] - 0.4985314 * xyz[2];
    rgb[1] = -0.9692660 * xyz[0] + 1.8760108 * xyz[1] + 0.0415560 * xyz[2];
    rgb[2] =  0.0556434 * xyz[0] - 0.2040259 * xyz[1] + 1.0572252 * xyz[2];
}

void to_rgba(const double* src, Color from, double* rgba) {
    rgba[3] = 1.0;
    switch (from) {
        case Color::Gray:
            rgba[0] = rgba[1] = rgba[2] = src[0];
            break;
        case Color::Rgb:
            rgba[0] = src[0]; rgba[1] = src[1]; rgba[2] = src[2];
            break;
        case Color::Rgba:
            rgba[0] = src[0]; rgba[1] = src[1]; rgba[2] = src[2]; rgba[3] = src[3];
            break;
        case Color::Hsv:
            hsv_to_rgb(src[0], src[1], src[2], rgba);
            break;
        case Color::Xyz:
            xyz_to_rgb(src, rgba);
            break;
    }
}

void from_rgba(const double* rgba, Color to, double* dst) {
    switch (to) {
        case Color::Gray:
            dst[0] = kLumaR * rgba[0] + kLumaG * rgba[1] + kLumaB * rgba[2];
            break;
        case Color::Rgb:
            dst[0] = rgba[0]; dst[1] = rgba[1]; dst[2] = rgba[2];
            break;
        case Color::Rgba:
            dst[0] = rgba[0]; dst[1] = rgba[1]; dst[2] = rgba[2]; dst[3] = rgba[3];
            break;
        case Color::Hsv:
            rgb_to_hsv(rgba, dst);
            break;
        case Color::Xyz:
            rgb_to_xyz(rgba, dst);
            break;
    }
}

} // namespace

void convert_color(const double* src, Color from, double* dst, Color to) {
    if (from == to) {
        if (src != dst) std::copy(src, src + channel_count(from), dst);
        return;
    }
    double rgba[4];
    to_rgba(src, from, rgba);
    from_rgba(rgba, to, dst);
}

} // namespace pw
