#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <opencv2/core.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "image.hpp"

namespace pw_test {

// 用固定种子的 cv::RNG 填充 [0, 1) 的随机值
inline pw::Image random_image(int w, int h, pw::Color color, pw::DataType type = pw::DataType::FLOAT64,
                              uint64_t seed = 1234) {
  pw::Image img(w, h, color, type);
  cv::RNG rng(seed);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      for (int c = 0; c < img.channels(); ++c) img.set_f(x, y, c, rng.uniform(0.0, 1.0));
    }
  }
  return img;
}

inline void expect_images_near(const pw::Image& a, const pw::Image& b, double tol) {
  ASSERT_EQ(a.width(), b.width());
  ASSERT_EQ(a.height(), b.height());
  ASSERT_EQ(a.channels(), b.channels());
  for (int y = 0; y < a.height(); ++y) {
    for (int x = 0; x < a.width(); ++x) {
      for (int c = 0; c < a.channels(); ++c) {
        EXPECT_NEAR(a.get_f(x, y, c), b.get_f(x, y, c), tol) << "at (" << x << "," << y << ") c=" << c;
      }
    }
  }
}

// 逐字节比较两张图像的存储
inline bool images_bit_equal(const pw::Image& a, const pw::Image& b) {
  if (a.width() != b.width() || a.height() != b.height() || a.channels() != b.channels() ||
      a.type() != b.type()) {
    return false;
  }
  const size_t row_bytes = static_cast<size_t>(a.width()) * a.channels() * pw::element_size(a.type());
  const auto* pa = static_cast<const unsigned char*>(a.buffer().data.get());
  const auto* pb = static_cast<const unsigned char*>(b.buffer().data.get());
  for (int y = 0; y < a.height(); ++y) {
    if (std::memcmp(pa + y * a.buffer().step, pb + y * b.buffer().step, row_bytes) != 0) return false;
  }
  return true;
}

}  // namespace pw_test
