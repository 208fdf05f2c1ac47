#pragma once

#include "filter/filter.hpp"

namespace pw {

// =============================================================================
// ==                         逐点滤镜 (PointFilter)                           ==
// =============================================================================

// 1 - x，作用于每个通道
class Invert : public PointFilter {
public:
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "invert"; }
};

// x^(1/gamma)
class GammaLog : public PointFilter {
public:
    explicit GammaLog(double gamma = 2.2) : gamma_(gamma) {}
    double gamma() const { return gamma_; }
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "gamma_log"; }

private:
    double gamma_;
};

// x^gamma
class GammaLin : public PointFilter {
public:
    explicit GammaLin(double gamma = 2.2) : gamma_(gamma) {}
    double gamma() const { return gamma_; }
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "gamma_lin"; }

private:
    double gamma_;
};

// 在 HSV 中缩放饱和度; 两侧都有 alpha 时保留 alpha
class Saturation : public PointFilter {
public:
    explicit Saturation(double factor) : factor_(factor) {}
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "saturation"; }

private:
    double factor_;
};

class Brightness : public PointFilter {
public:
    explicit Brightness(double factor) : factor_(factor) {}
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "brightness"; }

private:
    double factor_;
};

// (x - 0.5) * k + 0.5
class Contrast : public PointFilter {
public:
    explicit Contrast(double factor) : factor_(factor) {}
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "contrast"; }

private:
    double factor_;
};

// 0.21 R + 0.72 G + 0.07 B
class ToGrayscale : public PointFilter {
public:
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "to_grayscale"; }
};

/**
 * @brief 把单个灰度值广播到目标的每个通道。
 * 目标带 alpha 时: 源有 alpha 则沿用，否则强制为 1.0 (完全不透明)。
 */
class ToColor : public PointFilter {
public:
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override { return "to_color"; }
};

// 经过指定颜色模型转换后写入目标
class Convert : public PointFilter {
public:
    explicit Convert(Color through) : through_(through) {}
    void compute_pixel(const Pixel& src, Pixel& dest) const override;
    std::string name() const override;

private:
    Color through_;
};

// =============================================================================
// ==                              其他滤镜                                    ==
// =============================================================================

// 源 0 (或缓存值) 与源 1 的逐元素平均
class Blend : public Filter {
public:
    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    void before_compute(Input& input, const Image& output) const override;
    std::string name() const override { return "blend"; }
};

/**
 * @brief 从 region 的偏移处原样拷贝。
 * 目标点 p 位于 region 尺寸之内且源点 region.tl() + p 在源图像内时拷贝，否则不写入。
 */
class Crop : public Filter {
public:
    explicit Crop(const Region& region) : region_(region) {}
    const Region& region() const { return region_; }
    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    bool requires_intermediate_image() const override { return true; }
    std::string name() const override { return "crop"; }

private:
    Region region_;
};

} // namespace pw
