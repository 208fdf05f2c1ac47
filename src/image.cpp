#include "image.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>

namespace pw {

namespace {

template <typename T>
double read_normalized(const unsigned char* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return static_cast<double>(v) / static_cast<double>(std::numeric_limits<T>::max());
}

template <typename T>
void write_clamped(unsigned char* p, double value) {
    const double hi = static_cast<double>(std::numeric_limits<T>::max());
    const double lo = std::numeric_limits<T>::is_signed ? -hi : 0.0;
    double scaled = std::isnan(value) ? 0.0 : std::round(value * hi);
    T v = static_cast<T>(std::min(hi, std::max(lo, scaled)));
    std::memcpy(p, &v, sizeof(T));
}

} // namespace

Image::Image(int width, int height, Color color, DataType type)
    : buffer_(allocate_buffer(width, height, channel_count(color), type)),
      color_(color),
      element_size_(element_size(type)) {}

Image::Image(ImageBuffer buffer, Color color)
    : buffer_(std::move(buffer)), color_(color), element_size_(element_size(buffer_.type)) {
    if (buffer_.channels != channel_count(color)) {
        throw FilterError(FilterErrc::InvalidParameter,
                          std::string("Image: buffer has ") + std::to_string(buffer_.channels) +
                          " channels but color model " + color_name(color) + " needs " +
                          std::to_string(channel_count(color)));
    }
    if (!buffer_.data && !empty()) {
        throw FilterError(FilterErrc::InvalidParameter, "Image: buffer has no data");
    }
}

double Image::get_f(int x, int y, int c) const {
    const unsigned char* p = element_ptr(x, y, c);
    switch (buffer_.type) {
        case DataType::UINT8:  return read_normalized<uint8_t>(p);
        case DataType::INT8:   return read_normalized<int8_t>(p);
        case DataType::UINT16: return read_normalized<uint16_t>(p);
        case DataType::INT16:  return read_normalized<int16_t>(p);
        case DataType::FLOAT32: {
            float v;
            std::memcpy(&v, p, sizeof(float));
            return v;
        }
        case DataType::FLOAT64: {
            double v;
            std::memcpy(&v, p, sizeof(double));
            return v;
        }
    }
    return 0.0;
}

void Image::set_f(int x, int y, int c, double value) {
    unsigned char* p = element_ptr(x, y, c);
    switch (buffer_.type) {
        case DataType::UINT8:  write_clamped<uint8_t>(p, value); break;
        case DataType::INT8:   write_clamped<int8_t>(p, value); break;
        case DataType::UINT16: write_clamped<uint16_t>(p, value); break;
        case DataType::INT16:  write_clamped<int16_t>(p, value); break;
        case DataType::FLOAT32: {
            float v = static_cast<float>(value);
            std::memcpy(p, &v, sizeof(float));
            break;
        }
        case DataType::FLOAT64:
            std::memcpy(p, &value, sizeof(double));
            break;
    }
}

Pixel Image::get_pixel(const Point& pt) const {
    Pixel px(color_);
    for (int c = 0; c < buffer_.channels; ++c) px[c] = get_f(pt.x, pt.y, c);
    return px;
}

void Image::set_pixel(const Point& pt, const Pixel& px) {
    if (px.color() == color_) {
        for (int c = 0; c < buffer_.channels; ++c) set_f(pt.x, pt.y, c, px[c]);
        return;
    }
    Pixel converted = px.convert(color_);
    for (int c = 0; c < buffer_.channels; ++c) set_f(pt.x, pt.y, c, converted[c]);
}

void Image::fill(const Pixel& px) {
    for_each([&](const Point&, Pixel& dest) { px.convert_to(dest); });
}

Image Image::new_like() const {
    return Image(buffer_.width, buffer_.height, color_, buffer_.type);
}

Image Image::new_like_with_color(Color color) const {
    return Image(buffer_.width, buffer_.height, color, buffer_.type);
}

Image Image::new_like_with_type(DataType type) const {
    return Image(buffer_.width, buffer_.height, color_, type);
}

Image Image::clone() const {
    Image out = new_like();
    const size_t row_bytes = static_cast<size_t>(buffer_.width) * buffer_.channels * element_size_;
    const auto* src = static_cast<const unsigned char*>(buffer_.data.get());
    auto* dst = static_cast<unsigned char*>(out.buffer_.data.get());
    for (int y = 0; y < buffer_.height; ++y) {
        std::memcpy(dst + y * out.buffer_.step, src + y * buffer_.step, row_bytes);
    }
    return out;
}

} // namespace pw
