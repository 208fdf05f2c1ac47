#include "filter/input.hpp"

#include <string>

namespace pw {

const Image& Input::image(size_t index) const {
    if (index >= count_ || images_[index] == nullptr) {
        throw FilterError(FilterErrc::NotFound,
                          "Input: no source image at index " + std::to_string(index) +
                          " (have " + std::to_string(count_) + ")");
    }
    return *images_[index];
}

const Image* Input::cached_image() const {
    const auto* img = std::get_if<std::shared_ptr<const Image>>(&cache_);
    return img ? img->get() : nullptr;
}

void Input::set_operand_input(const Filter* op, std::shared_ptr<const Input> input) {
    for (auto& entry : operands_) {
        if (entry.first == op) {
            entry.second = std::move(input);
            return;
        }
    }
    operands_.emplace_back(op, std::move(input));
}

const Input& Input::for_operand(const Filter* op) const {
    for (const auto& entry : operands_) {
        if (entry.first == op) return *entry.second;
    }
    return *this;
}

double Input::get_f(const Point& pt, int c, std::optional<size_t> index) const {
    if (index) return image(*index).get_f(pt.x, pt.y, c);
    if (const Image* img = cached_image()) return img->get_f(pt.x, pt.y, c);
    if (const Pixel* px = cached_pixel()) return c < px->size() ? (*px)[c] : 0.0;
    return image(0).get_f(pt.x, pt.y, c);
}

Pixel Input::get_pixel(const Point& pt, std::optional<size_t> index) const {
    if (index) return image(*index).get_pixel(pt);
    if (const Image* img = cached_image()) return img->get_pixel(pt);
    if (const Pixel* px = cached_pixel()) return *px;
    return image(0).get_pixel(pt);
}

Color Input::color() const {
    if (const Image* img = cached_image()) return img->color();
    if (const Pixel* px = cached_pixel()) return px->color();
    return image(0).color();
}

int Input::width() const {
    if (const Image* img = cached_image()) return img->width();
    if (count_ == 0 && has_pixel()) return 1;
    return image(0).width();
}

int Input::height() const {
    if (const Image* img = cached_image()) return img->height();
    if (count_ == 0 && has_pixel()) return 1;
    return image(0).height();
}

} // namespace pw
