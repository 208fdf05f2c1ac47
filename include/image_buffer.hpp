#pragma once

#include <cstddef>
#include <memory>

namespace pw {

// 描述像素数据类型，实现与具体库解耦
enum class DataType {
    UINT8, INT8, UINT16, INT16, FLOAT32, FLOAT64
};

// Bytes per channel element.
size_t element_size(DataType type);
const char* data_type_name(DataType type);

// 通用的、与具体库无关的图像数据描述符。
// Dense, row-major, interleaved channels.
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    DataType type = DataType::FLOAT32;
    size_t step = 0; // 每行字节数 (stride)

    // 使用带自定义删除器的 shared_ptr 来自动管理不同来源的内存。
    // 无论是我们自己分配的还是来自 OpenCV 的内存，
    // shared_ptr 都能确保其生命周期被正确管理。
    std::shared_ptr<void> data = nullptr;
};

/**
 * @brief 分配一块新的、零初始化的 CPU 图像缓冲区。
 * @note 行宽不做额外对齐: step == width * channels * element_size(type)。
 */
ImageBuffer allocate_buffer(int width, int height, int channels, DataType type);

} // namespace pw
