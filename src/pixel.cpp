#include "pixel.hpp"
#include "pw_types.hpp"

#include <algorithm>
#include <functional>

namespace pw {

Pixel::Pixel(Color color) : color_(color), size_(channel_count(color)) {}

Pixel::Pixel(Color color, std::initializer_list<double> values) : Pixel(color) {
    if (static_cast<int>(values.size()) != size_) {
        throw FilterError(FilterErrc::InvalidParameter,
                          std::string("Pixel: ") + color_name(color) + " expects " +
                          std::to_string(size_) + " channel values, got " +
                          std::to_string(values.size()));
    }
    std::copy(values.begin(), values.end(), data_.begin());
}

void Pixel::fill(double value) {
    std::fill(data_.begin(), data_.begin() + size_, value);
}

Pixel Pixel::convert(Color to) const {
    Pixel out(to);
    convert_color(data_.data(), color_, out.data_.data(), to);
    return out;
}

void Pixel::convert_to(Pixel& dest) const {
    convert_color(data_.data(), color_, dest.data_.data(), dest.color_);
}

namespace {

// 逐元素运算: 右操作数先转换到左操作数的颜色模型
template <typename Op>
Pixel& elementwise(Pixel& lhs, const Pixel& other, Op op) {
    const Pixel rhs = other.color() == lhs.color() ? other : other.convert(lhs.color());
    for (int c = 0; c < lhs.size(); ++c) lhs[c] = op(lhs[c], rhs[c]);
    return lhs;
}

template <typename Op>
Pixel& elementwise(Pixel& lhs, double v, Op op) {
    for (int c = 0; c < lhs.size(); ++c) lhs[c] = op(lhs[c], v);
    return lhs;
}

} // namespace

Pixel& Pixel::operator+=(const Pixel& other) { return elementwise(*this, other, std::plus<double>()); }
Pixel& Pixel::operator-=(const Pixel& other) { return elementwise(*this, other, std::minus<double>()); }
Pixel& Pixel::operator*=(const Pixel& other) { return elementwise(*this, other, std::multiplies<double>()); }
Pixel& Pixel::operator/=(const Pixel& other) { return elementwise(*this, other, std::divides<double>()); }

Pixel& Pixel::operator+=(double v) { return elementwise(*this, v, std::plus<double>()); }
Pixel& Pixel::operator-=(double v) { return elementwise(*this, v, std::minus<double>()); }
Pixel& Pixel::operator*=(double v) { return elementwise(*this, v, std::multiplies<double>()); }
Pixel& Pixel::operator/=(double v) { return elementwise(*this, v, std::divides<double>()); }

bool Pixel::operator==(const Pixel& other) const {
    if (color_ != other.color_) return false;
    return std::equal(data_.begin(), data_.begin() + size_, other.data_.begin());
}

} // namespace pw
