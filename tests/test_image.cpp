#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "color.hpp"
#include "image.hpp"
#include "pixel.hpp"

using pw::Color;
using pw::DataType;
using pw::Image;
using pw::Pixel;
using pw::Point;

TEST(ImageTest, IntegerTypesAreNormalizedAndClamped) {
  Image img(2, 1, Color::Gray, DataType::UINT8);
  img.set_f(0, 0, 0, 1.0);
  img.set_f(1, 0, 0, 1.7);
  EXPECT_DOUBLE_EQ(img.get_f(0, 0, 0), 1.0);
  EXPECT_DOUBLE_EQ(img.get_f(1, 0, 0), 1.0);
  img.set_f(1, 0, 0, -0.3);
  EXPECT_DOUBLE_EQ(img.get_f(1, 0, 0), 0.0);

  Image wide(1, 1, Color::Gray, DataType::UINT16);
  wide.set_f(0, 0, 0, 0.5);
  EXPECT_NEAR(wide.get_f(0, 0, 0), 0.5, 1.0 / 65535.0);
}

TEST(ImageTest, CopiesShareStorageAndCloneDoesNot) {
  Image a(3, 2, Color::Rgb, DataType::FLOAT32);
  Image shared = a;
  Image deep = a.clone();
  shared.set_pixel(Point(1, 1), Pixel(Color::Rgb, {0.25, 0.5, 0.75}));
  EXPECT_FLOAT_EQ(static_cast<float>(a.get_f(1, 1, 2)), 0.75f);
  EXPECT_DOUBLE_EQ(deep.get_f(1, 1, 2), 0.0);
}

TEST(ImageTest, SetPixelConvertsColor) {
  Image rgb(1, 1, Color::Rgb, DataType::FLOAT64);
  rgb.set_pixel(Point(0, 0), Pixel(Color::Gray, {0.4}));
  EXPECT_DOUBLE_EQ(rgb.get_f(0, 0, 1), 0.4);

  Image gray(1, 1, Color::Gray, DataType::FLOAT64);
  gray.set_pixel(Point(0, 0), Pixel(Color::Rgb, {1.0, 0.0, 0.0}));
  EXPECT_DOUBLE_EQ(gray.get_f(0, 0, 0), pw::kLumaR);
}

TEST(ImageTest, ForEachRegionClipsToBounds) {
  Image img(4, 3, Color::Gray, DataType::FLOAT64);
  int visited = 0;
  img.for_each_region(pw::Region(2, 1, 10, 10), [&](const Point& pt, Pixel& px) {
    ++visited;
    px[0] = pt.x + 10.0 * pt.y;
  });
  EXPECT_EQ(visited, 2 * 2);
  EXPECT_DOUBLE_EQ(img.get_f(3, 2, 0), 23.0);
  EXPECT_DOUBLE_EQ(img.get_f(1, 1, 0), 0.0);
}

TEST(ImageTest, BufferMustMatchColor) {
  try {
    Image(pw::allocate_buffer(2, 2, 3, DataType::UINT8), Color::Rgba);
    FAIL() << "channel mismatch accepted";
  } catch (const pw::FilterError& e) {
    EXPECT_EQ(e.code(), pw::FilterErrc::InvalidParameter);
  }
  EXPECT_THROW(pw::allocate_buffer(-1, 2, 1, DataType::UINT8), pw::FilterError);
  EXPECT_EQ(pw::element_size(DataType::INT16), 2u);
}

TEST(PixelTest, ArithmeticConvertsRightOperand) {
  Pixel a(Color::Rgb, {0.1, 0.2, 0.3});
  Pixel sum = a + Pixel(Color::Gray, {0.5});
  EXPECT_EQ(sum.color(), Color::Rgb);
  EXPECT_NEAR(sum[2], 0.8, 1e-12);
  EXPECT_NEAR((a * 2.0)[1], 0.4, 1e-12);
  EXPECT_THROW(Pixel(Color::Rgb, {0.1}), pw::FilterError);
}

TEST(ColorTest, ConversionsRoundTrip) {
  const Pixel rgba(Color::Rgba, {0.8, 0.3, 0.1, 0.6});
  for (Color via : {Color::Hsv, Color::Xyz, Color::Rgb}) {
    Pixel back = rgba.convert(via).convert(Color::Rgba);
    for (int c = 0; c < 3; ++c) EXPECT_NEAR(back[c], rgba[c], 1e-6) << pw::color_name(via);
    EXPECT_DOUBLE_EQ(back[3], 1.0);
  }
  const Pixel hsv = Pixel(Color::Rgb, {1.0, 0.0, 0.0}).convert(Color::Hsv);
  EXPECT_DOUBLE_EQ(hsv[0], 0.0);
  EXPECT_DOUBLE_EQ(hsv[1], 1.0);
  EXPECT_EQ(pw::color_from_name("grey").value_or(Color::Rgb), Color::Gray);
  EXPECT_EQ(pw::channel_count(Color::Xyz), 3);
}

TEST(OpenCvAdapterTest, FromCvMatSharesMemory) {
  cv::Mat mat(3, 4, CV_8UC3, cv::Scalar(0, 0, 0));
  Image img = pw::imageFromCvMat(mat);
  EXPECT_EQ(img.color(), Color::Rgb);
  EXPECT_EQ(img.type(), DataType::UINT8);
  img.set_f(2, 1, 0, 1.0);
  EXPECT_EQ(mat.at<cv::Vec3b>(1, 2)[0], 255);

  cv::Mat view = pw::toCvMat(img);
  EXPECT_EQ(view.data, mat.data);
  EXPECT_EQ(view.type(), CV_8UC3);
}

TEST(OpenCvAdapterTest, BufferOutlivesSourceMat) {
  Image img;
  {
    cv::Mat mat(2, 2, CV_32FC1, cv::Scalar(0.5));
    img = pw::imageFromCvMat(mat, Color::Gray);
  }
  EXPECT_FLOAT_EQ(static_cast<float>(img.get_f(1, 1, 0)), 0.5f);
}

TEST(OpenCvAdapterTest, UnsupportedInputs) {
  cv::Mat two(2, 2, CV_8UC2);
  EXPECT_THROW(pw::imageFromCvMat(two), pw::FilterError);
  EXPECT_THROW(pw::fromCvMat(cv::Mat()), pw::FilterError);
  EXPECT_EQ(pw::edgeStrategyToCvBorder(pw::EdgeStrategy::Mirror), cv::BORDER_REFLECT_101);

  pw::Kernel k = pw::Kernel::sobel_x();
  cv::Mat km = pw::kernelToCvMat(k);
  EXPECT_EQ(km.rows, 3);
  EXPECT_DOUBLE_EQ(km.at<double>(1, 2), -2.0);
}
