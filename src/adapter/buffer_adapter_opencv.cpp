#include "adapter/buffer_adapter_opencv.hpp"

namespace pw {

// --- 内部辅助函数 ---
static int toCvType(DataType type, int channels) {
    switch (type) {
        case DataType::UINT8:   return CV_8UC(channels);
        case DataType::INT8:    return CV_8SC(channels);
        case DataType::UINT16:  return CV_16UC(channels);
        case DataType::INT16:   return CV_16SC(channels);
        case DataType::FLOAT32: return CV_32FC(channels);
        case DataType::FLOAT64: return CV_64FC(channels);
    }
    throw FilterError(FilterErrc::UnsupportedType, "Unsupported data type for OpenCV conversion");
}

static DataType fromCvType(int cv_type) {
    switch (CV_MAT_DEPTH(cv_type)) {
        case CV_8U:  return DataType::UINT8;
        case CV_8S:  return DataType::INT8;
        case CV_16U: return DataType::UINT16;
        case CV_16S: return DataType::INT16;
        case CV_32F: return DataType::FLOAT32;
        case CV_64F: return DataType::FLOAT64;
        default: throw FilterError(FilterErrc::UnsupportedType, "Unsupported cv::Mat depth for ImageBuffer conversion");
    }
}

cv::Mat toCvMat(const ImageBuffer& buffer) {
    if (!buffer.data) {
        throw FilterError(FilterErrc::InvalidParameter, "toCvMat: buffer has no data.");
    }
    int type = toCvType(buffer.type, buffer.channels);
    return cv::Mat(buffer.height, buffer.width, type, buffer.data.get(), buffer.step);
}

cv::Mat kernelToCvMat(const Kernel& kernel) {
    cv::Mat out(kernel.rows(), kernel.cols(), CV_64FC1);
    for (int r = 0; r < kernel.rows(); ++r) {
        for (int c = 0; c < kernel.cols(); ++c) {
            out.at<double>(r, c) = kernel.at(r, c);
        }
    }
    return out;
}

int edgeStrategyToCvBorder(EdgeStrategy strategy) {
    switch (strategy) {
        case EdgeStrategy::Constant: return cv::BORDER_CONSTANT;
        case EdgeStrategy::Extend:   return cv::BORDER_REPLICATE;
        case EdgeStrategy::Wrap:     return cv::BORDER_WRAP;
        case EdgeStrategy::Mirror:   return cv::BORDER_REFLECT_101;
    }
    return cv::BORDER_CONSTANT;
}

ImageBuffer fromCvMat(const cv::Mat& mat) {
    if (mat.empty()) {
        throw FilterError(FilterErrc::InvalidParameter, "fromCvMat: empty cv::Mat");
    }
    ImageBuffer buffer;
    buffer.width = mat.cols;
    buffer.height = mat.rows;
    buffer.channels = mat.channels();
    buffer.type = fromCvType(mat.type());
    buffer.step = mat.step;

    // 删除器捕获 mat 的副本: 只要 buffer.data 存在，原始数据的引用计数就不会降为 0
    buffer.data = std::shared_ptr<void>(mat.data, [mat_ref = mat](void*) {});
    return buffer;
}

Image imageFromCvMat(const cv::Mat& mat, Color color) {
    return Image(fromCvMat(mat), color);
}

Image imageFromCvMat(const cv::Mat& mat) {
    switch (mat.channels()) {
        case 1: return imageFromCvMat(mat, Color::Gray);
        case 3: return imageFromCvMat(mat, Color::Rgb);
        case 4: return imageFromCvMat(mat, Color::Rgba);
        default:
            throw FilterError(FilterErrc::UnsupportedType,
                              "imageFromCvMat: no default color for " + std::to_string(mat.channels()) + " channels");
    }
}

} // namespace pw
