#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "image.hpp"

namespace pw {

class Filter;

/**
 * @class Input
 * @brief 一次求值的只读输入视图。
 *
 * Input 引用 (不拥有) 调用方的源图像列表，并且最多持有一个缓存值:
 * 一个预先计算好的 Pixel，或者一张预先计算好的中间图像。
 *
 * 不指定源索引的查找顺序: 缓存图像 -> 缓存像素 -> 源图像 0。
 * 指定索引时总是读取对应的源图像。
 *
 * 组合滤镜 (Join、AndThen) 的某个操作数需要存中间图像时，它在自己的 Input
 * 副本上准备，副本登记在这里，compute_at 通过 for_operand 取回;
 * 兄弟操作数仍然读取这个 Input。
 *
 * @note 只保存列表的数据指针与长度; 调用方需保证列表在 Input 存活期间有效。
 *       移动 std::vector 不会改变其数据指针。
 */
class Input {
public:
    explicit Input(const std::vector<const Image*>& images)
        : images_(images.data()), count_(images.size()) {}

    size_t size() const { return count_; }
    // Throws FilterError(NotFound) when index is out of range.
    const Image& image(size_t index = 0) const;

    bool has_pixel() const { return std::holds_alternative<Pixel>(cache_); }
    bool has_image() const { return std::holds_alternative<std::shared_ptr<const Image>>(cache_); }
    const Pixel* cached_pixel() const { return std::get_if<Pixel>(&cache_); }
    const Image* cached_image() const;

    // Setting one cached value replaces the other.
    void set_pixel(const Pixel& px) { cache_ = px; }
    void set_image(std::shared_ptr<const Image> image) { cache_ = std::move(image); }
    void clear_cache() { cache_ = std::monostate{}; }

    // Same sources, cache replaced by `px`, no operand inputs.
    Input with_pixel(const Pixel& px) const {
        Input out(images_, count_);
        out.cache_ = px;
        return out;
    }

    // Replaces any input already registered for `op`.
    void set_operand_input(const Filter* op, std::shared_ptr<const Input> input);
    // The input registered for `op`, or this Input when there is none.
    const Input& for_operand(const Filter* op) const;

    double get_f(const Point& pt, int c, std::optional<size_t> index = std::nullopt) const;
    Pixel get_pixel(const Point& pt, std::optional<size_t> index = std::nullopt) const;

    // Color model, extent and zeroed pixel of whatever an unindexed lookup samples.
    Color color() const;
    int width() const;
    int height() const;
    Pixel new_pixel() const { return Pixel(color()); }

private:
    Input(const Image* const* images, size_t count) : images_(images), count_(count) {}

    const Image* const* images_;
    size_t count_;
    std::variant<std::monostate, Pixel, std::shared_ptr<const Image>> cache_;
    std::vector<std::pair<const Filter*, std::shared_ptr<const Input>>> operands_;
};

} // namespace pw
