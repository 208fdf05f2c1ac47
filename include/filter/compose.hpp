#pragma once

#include <functional>
#include <vector>

#include "filter/filter.hpp"

namespace pw {

/**
 * @class Then
 * @brief 顺序组合: 先 a，再把 a 的结果交给 b。
 *
 * - b 需要中间图像时 (例如卷积核)，before_compute 先把 a 在整个输出范围上
 *   求值到一张新分配的 FLOAT32 中间图像，存入 Input，之后每个点对它运行 b。
 * - 否则不分配任何缓冲区: 每个点先把 a 算进一个临时像素，
 *   再让 b 在只暴露该像素的 Input 上求值。
 */
class Then : public Filter {
public:
    Then(FilterPtr a, FilterPtr b);

    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    bool requires_intermediate_image() const override;
    bool uses_intermediate_image() const override;
    void before_compute(Input& input, const Image& output) const override;
    std::string name() const override;

    bool materializes() const { return materialize_; }

private:
    FilterPtr a_;
    FilterPtr b_;
    bool materialize_;
};

using JoinFn = std::function<Pixel(const Point&, const Pixel&, const Pixel&)>;

/**
 * @class Join
 * @brief a 与 b 在同一点独立求值 (都转换到 working 颜色模型)，
 *        再由 fn(point, pa, pb) 合并。
 */
class Join : public Filter {
public:
    Join(FilterPtr a, FilterPtr b, Color working, JoinFn fn);

    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    bool requires_intermediate_image() const override;
    bool uses_intermediate_image() const override;
    void before_compute(Input& input, const Image& output) const override;
    std::string name() const override;

private:
    FilterPtr a_;
    FilterPtr b_;
    Color working_;
    JoinFn fn_;
};

// a 与 b 先后写入同一个 dest。
class AndThen : public Filter {
public:
    AndThen(FilterPtr a, FilterPtr b);

    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    bool requires_intermediate_image() const override;
    bool uses_intermediate_image() const override;
    void before_compute(Input& input, const Image& output) const override;
    std::string name() const override;

private:
    FilterPtr a_;
    FilterPtr b_;
};

FilterPtr then(FilterPtr a, FilterPtr b);
FilterPtr join(FilterPtr a, FilterPtr b, Color working, JoinFn fn);
FilterPtr and_then(FilterPtr a, FilterPtr b);
// Folds left with Then: chain({f, g, h}) == then(then(f, g), h).
FilterPtr chain(const std::vector<FilterPtr>& filters);

} // namespace pw
