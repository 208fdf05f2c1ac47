#pragma once

#include "image_buffer.hpp"
#include "pixel.hpp"
#include "pw_types.hpp"

namespace pw {

/**
 * @class Image
 * @brief ImageBuffer 加上颜色模型，提供按坐标的归一化通道读写。
 *
 * - 整数类型的通道值在读取时被归一化到 [0,1] (有符号类型为 [-1,1])，
 *   写入时被截断到可表示范围; 浮点类型原样读写。
 * - 拷贝 Image 共享底层存储 (与 cv::Mat 相同)，需要深拷贝时使用 clone()。
 */
class Image {
public:
    Image() = default;
    Image(int width, int height, Color color, DataType type = DataType::FLOAT32);
    // Wraps an existing buffer; its channel count must match the color model.
    Image(ImageBuffer buffer, Color color);

    int width() const { return buffer_.width; }
    int height() const { return buffer_.height; }
    int channels() const { return buffer_.channels; }
    Color color() const { return color_; }
    DataType type() const { return buffer_.type; }
    bool empty() const { return buffer_.width == 0 || buffer_.height == 0; }

    const ImageBuffer& buffer() const { return buffer_; }
    ImageBuffer& buffer() { return buffer_; }

    Region bounds() const { return Region(0, 0, buffer_.width, buffer_.height); }
    bool contains(const Point& pt) const {
        return pt.x >= 0 && pt.y >= 0 && pt.x < buffer_.width && pt.y < buffer_.height;
    }

    double get_f(int x, int y, int c) const;
    void set_f(int x, int y, int c, double value);

    Pixel get_pixel(const Point& pt) const;
    // `px` is converted into this image's color model before writing.
    void set_pixel(const Point& pt, const Pixel& px);
    // A zeroed pixel in this image's color model.
    Pixel new_pixel() const { return Pixel(color_); }

    void fill(const Pixel& px);

    Image new_like() const;
    Image new_like_with_color(Color color) const;
    Image new_like_with_type(DataType type) const;
    Image clone() const;

    // 按行优先顺序遍历所有像素; fn(pt, pixel&) 修改后的像素会被写回。
    template <typename Fn>
    void for_each(Fn fn) { for_each_region(bounds(), fn); }

    // 只遍历 roi 与图像的交集。
    template <typename Fn>
    void for_each_region(const Region& roi, Fn fn) {
        Region r = roi & bounds();
        for (int y = r.y; y < r.y + r.height; ++y) {
            for (int x = r.x; x < r.x + r.width; ++x) {
                Point pt(x, y);
                Pixel px = get_pixel(pt);
                fn(pt, px);
                set_pixel(pt, px);
            }
        }
    }

private:
    const unsigned char* element_ptr(int x, int y, int c) const {
        return static_cast<const unsigned char*>(buffer_.data.get()) + y * buffer_.step +
               (static_cast<size_t>(x) * buffer_.channels + c) * element_size_;
    }
    unsigned char* element_ptr(int x, int y, int c) {
        return static_cast<unsigned char*>(buffer_.data.get()) + y * buffer_.step +
               (static_cast<size_t>(x) * buffer_.channels + c) * element_size_;
    }

    ImageBuffer buffer_;
    Color color_ = Color::Gray;
    size_t element_size_ = sizeof(float);
};

} // namespace pw
