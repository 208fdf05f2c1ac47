#pragma once

#include <array>
#include <initializer_list>

#include "color.hpp"

namespace pw {

/**
 * @class Pixel
 * @brief 单个像素的通道值 (double) 加上其颜色模型标签。
 *
 * Pixel 是值类型: 每次从图像读取都会得到一个独立的副本。
 * 容量固定为 kMaxChannels，不做堆分配，适合逐像素的热路径。
 *
 * 与另一个 Pixel 做逐元素运算时，右操作数会先转换到左操作数的颜色模型。
 */
class Pixel {
public:
    static constexpr int kMaxChannels = 4;

    Pixel() : Pixel(Color::Gray) {}
    explicit Pixel(Color color);
    Pixel(Color color, std::initializer_list<double> values);

    Color color() const { return color_; }
    int size() const { return size_; }

    double& operator[](int c) { return data_[c]; }
    double operator[](int c) const { return data_[c]; }
    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }

    void fill(double value);

    // Lossy conversion into another color model.
    Pixel convert(Color to) const;
    // Writes this pixel into `dest`, converted to dest's color model.
    void convert_to(Pixel& dest) const;

    template <typename Fn>
    void map_in_place(Fn fn) {
        for (int c = 0; c < size_; ++c) data_[c] = fn(data_[c]);
    }

    Pixel& operator+=(const Pixel& other);
    Pixel& operator-=(const Pixel& other);
    Pixel& operator*=(const Pixel& other);
    Pixel& operator/=(const Pixel& other);
    Pixel& operator+=(double v);
    Pixel& operator-=(double v);
    Pixel& operator*=(double v);
    Pixel& operator/=(double v);

    bool operator==(const Pixel& other) const;
    bool operator!=(const Pixel& other) const { return !(*this == other); }

private:
    Color color_;
    int size_;
    std::array<double, kMaxChannels> data_{};
};

inline Pixel operator+(Pixel a, const Pixel& b) { return a += b; }
inline Pixel operator-(Pixel a, const Pixel& b) { return a -= b; }
inline Pixel operator*(Pixel a, const Pixel& b) { return a *= b; }
inline Pixel operator/(Pixel a, const Pixel& b) { return a /= b; }
inline Pixel operator+(Pixel a, double v) { return a += v; }
inline Pixel operator-(Pixel a, double v) { return a -= v; }
inline Pixel operator*(Pixel a, double v) { return a *= v; }
inline Pixel operator/(Pixel a, double v) { return a /= v; }

} // namespace pw
