#pragma once

#include <memory>
#include <string>
#include <utility>

#include "filter/input.hpp"

namespace pw {

/**
 * @class Filter
 * @brief 逐像素的纯函数: (坐标, Input) -> 一个输出像素。
 *
 * - compute_at 把结果写入调用方提供的 dest。dest 已经处于目标图像的颜色模型，
 *   并且保存着目标图像在该点的当前值; 什么都不写的滤镜会保持目标不变。
 * - compute_at 必须可以被多个线程针对不同坐标并发调用。
 * - before_compute 在一次求值中、任何 compute_at 之前恰好运行一次，
 *   是唯一允许物化中间图像或做带副作用准备工作的地方。
 */
class Filter {
public:
    virtual ~Filter() = default;

    virtual void compute_at(const Point& pt, const Input& input, Pixel& dest) const = 0;

    // True when the value at one point depends on other points of the input.
    virtual bool requires_intermediate_image() const { return false; }

    // True when before_compute stores an intermediate image into the Input.
    virtual bool uses_intermediate_image() const { return false; }

    virtual void before_compute(Input& /*input*/, const Image& /*output*/) const {}

    virtual std::string name() const = 0;
};

using FilterPtr = std::shared_ptr<const Filter>;

/**
 * @class PointFilter
 * @brief 只读取被计算点自身像素的滤镜。
 *
 * 这是比 Filter 更窄的能力: 输出只依赖同一坐标上的输入像素。
 * 只有 PointFilter 可以原地求值 (输入与输出是同一块存储)。
 */
class PointFilter : public Filter {
public:
    virtual void compute_pixel(const Pixel& src, Pixel& dest) const = 0;

    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override {
        compute_pixel(input.get_pixel(pt), dest);
    }
};

template <typename F, typename... Args>
std::shared_ptr<const F> make_filter(Args&&... args) {
    return std::make_shared<F>(std::forward<Args>(args)...);
}

// 按行优先顺序在整张 output 上运行 filter。调用方负责先执行 before_compute。
void compute_image(const Filter& filter, const Input& input, Image& output);

} // namespace pw
