#include "filter/builtin.hpp"

#include <cmath>

namespace pw {

void Invert::compute_pixel(const Pixel& src, Pixel& dest) const {
    Pixel px = src;
    px.map_in_place([](double x) { return 1.0 - x; });
    px.convert_to(dest);
}

void GammaLog::compute_pixel(const Pixel& src, Pixel& dest) const {
    Pixel px = src;
    const double e = 1.0 / gamma_;
    px.map_in_place([e](double x) { return std::pow(x, e); });
    px.convert_to(dest);
}

void GammaLin::compute_pixel(const Pixel& src, Pixel& dest) const {
    Pixel px = src;
    const double e = gamma_;
    px.map_in_place([e](double x) { return std::pow(x, e); });
    px.convert_to(dest);
}

void Saturation::compute_pixel(const Pixel& src, Pixel& dest) const {
    Pixel hsv = src.convert(Color::Hsv);
    hsv[1] *= factor_;
    hsv.convert_to(dest);
    if (has_alpha(src.color()) && has_alpha(dest.color())) {
        dest[alpha_index(dest.color())] = src[alpha_index(src.color())];
    }
}

void Brightness::compute_pixel(const Pixel& src, Pixel& dest) const {
    (src * factor_).convert_to(dest);
}

void Contrast::compute_pixel(const Pixel& src, Pixel& dest) const {
    Pixel px = src;
    const double k = factor_;
    px.map_in_place([k](double x) { return (x - 0.5) * k + 0.5; });
    px.convert_to(dest);
}

void ToGrayscale::compute_pixel(const Pixel& src, Pixel& dest) const {
    const Pixel rgb = src.convert(Color::Rgb);
    Pixel gray(Color::Gray);
    gray[0] = kLumaR * rgb[0] + kLumaG * rgb[1] + kLumaB * rgb[2];
    gray.convert_to(dest);
}

void ToColor::compute_pixel(const Pixel& src, Pixel& dest) const {
    const double v = src.color() == Color::Gray ? src[0] : src.convert(Color::Gray)[0];
    dest.fill(v);
    if (has_alpha(dest.color())) {
        dest[alpha_index(dest.color())] = has_alpha(src.color()) ? src[alpha_index(src.color())] : 1.0;
    }
}

void Convert::compute_pixel(const Pixel& src, Pixel& dest) const {
    src.convert(through_).convert_to(dest);
}

std::string Convert::name() const {
    return std::string("convert_") + color_name(through_);
}

void Blend::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    const Pixel a = input.get_pixel(pt);
    const Pixel b = input.get_pixel(pt, 1);
    ((a + b) / 2.0).convert_to(dest);
}

void Blend::before_compute(Input& input, const Image&) const {
    if (input.size() < 2) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "blend requires two source images, got " + std::to_string(input.size()));
    }
}

void Crop::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    if (pt.x < 0 || pt.y < 0 || pt.x >= region_.width || pt.y >= region_.height) return;
    const Point src(region_.x + pt.x, region_.y + pt.y);
    if (src.x < 0 || src.y < 0 || src.x >= input.width() || src.y >= input.height()) return;
    input.get_pixel(src).convert_to(dest);
}

} // namespace pw
