#pragma once

#include <optional>
#include <string>

namespace pw {

// 颜色模型。通道数由模型决定。
enum class Color {
    Gray, // 1 channel
    Rgb,  // 3 channels
    Rgba, // 4 channels, alpha last
    Hsv,  // 3 channels, hue in [0, 1)
    Xyz,  // 3 channels, CIE XYZ (D65)
};

constexpr int channel_count(Color color) {
    switch (color) {
        case Color::Gray: return 1;
        case Color::Rgba: return 4;
        case Color::Rgb:
        case Color::Hsv:
        case Color::Xyz:  return 3;
    }
    return 0;
}

constexpr bool has_alpha(Color color) { return color == Color::Rgba; }

// Index of the alpha channel, or -1.
constexpr int alpha_index(Color color) { return has_alpha(color) ? channel_count(color) - 1 : -1; }

const char* color_name(Color color);
std::optional<Color> color_from_name(const std::string& name);

/**
 * @brief 在两个颜色模型之间转换一个像素。
 *
 * 所有转换都经过线性 RGB + alpha 中转。缺失的 alpha 视为 1.0；
 * 转换到不带 alpha 的模型时 alpha 被丢弃。
 * `src` 需要 channel_count(from) 个元素, `dst` 需要 channel_count(to) 个元素,
 * 两者可以指向同一块内存。
 */
void convert_color(const double* src, Color from, double* dst, Color to);

// Luma weights shared by Gray conversion and the grayscale filter.
constexpr double kLumaR = 0.21;
constexpr double kLumaG = 0.72;
constexpr double kLumaB = 0.07;

} // namespace pw
