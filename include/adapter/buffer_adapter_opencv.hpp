#pragma once

#include "image.hpp"
#include "filter/kernel.hpp"
#include <opencv2/core.hpp>

namespace pw {

// --- 转换为 OpenCV 类型 ---

/**
 * @brief 将 ImageBuffer 或 Image 转换为 cv::Mat 视图。
 * @note 零拷贝: 返回的 cv::Mat 直接引用 buffer 的存储，不持有引用计数，
 *       调用方需保证 buffer 在 cv::Mat 使用期间存活。
 */
cv::Mat toCvMat(const ImageBuffer& buffer);
inline cv::Mat toCvMat(const Image& image) { return toCvMat(image.buffer()); }

// 行 x 列的 CV_64FC1 矩阵，按原样拷贝权重 (cv::filter2D 做的也是相关运算，无需翻转)
cv::Mat kernelToCvMat(const Kernel& kernel);

// Constant -> BORDER_CONSTANT, Extend -> BORDER_REPLICATE,
// Wrap -> BORDER_WRAP, Mirror -> BORDER_REFLECT_101
int edgeStrategyToCvBorder(EdgeStrategy strategy);


// --- 从 OpenCV 类型转换 ---

/**
 * @brief 将一个 cv::Mat 包装为 ImageBuffer。
 * @note 这是一个零拷贝操作。返回的 ImageBuffer 会通过 std::shared_ptr
 *       共享 cv::Mat 的内存和引用计数。不支持的深度抛出 UnsupportedType。
 */
ImageBuffer fromCvMat(const cv::Mat& mat);

/**
 * @brief 把 cv::Mat 包装为指定颜色模型的 Image (共享存储)。
 * @note 通道按原顺序解释; OpenCV 的 BGR 数据需要调用方先转换为 RGB。
 */
Image imageFromCvMat(const cv::Mat& mat, Color color);
// 1 -> Gray, 3 -> Rgb, 4 -> Rgba
Image imageFromCvMat(const cv::Mat& mat);

} // namespace pw
