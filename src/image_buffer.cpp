#include "image_buffer.hpp"
#include "pw_types.hpp"

#include <cstdint>
#include <cstring>

namespace pw {

size_t element_size(DataType type) {
    switch (type) {
        case DataType::UINT8:   return sizeof(uint8_t);
        case DataType::INT8:    return sizeof(int8_t);
        case DataType::UINT16:  return sizeof(uint16_t);
        case DataType::INT16:   return sizeof(int16_t);
        case DataType::FLOAT32: return sizeof(float);
        case DataType::FLOAT64: return sizeof(double);
    }
    throw FilterError(FilterErrc::UnsupportedType, "element_size: unknown data type");
}

const char* data_type_name(DataType type) {
    switch (type) {
        case DataType::UINT8:   return "uint8";
        case DataType::INT8:    return "int8";
        case DataType::UINT16:  return "uint16";
        case DataType::INT16:   return "int16";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
    }
    return "unknown";
}

ImageBuffer allocate_buffer(int width, int height, int channels, DataType type) {
    if (width < 0 || height < 0 || channels <= 0) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "allocate_buffer: invalid extent " + std::to_string(width) + "x" +
                          std::to_string(height) + "x" + std::to_string(channels));
    }
    ImageBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.channels = channels;
    buffer.type = type;
    buffer.step = static_cast<size_t>(width) * channels * element_size(type);

    size_t bytes = buffer.step * static_cast<size_t>(height);
    // 用 uint8_t[] 持有内存, 删除器与分配方式配对
    std::shared_ptr<uint8_t> storage(new uint8_t[bytes > 0 ? bytes : 1], std::default_delete<uint8_t[]>());
    std::memset(storage.get(), 0, bytes);
    buffer.data = std::static_pointer_cast<void>(storage);
    return buffer;
}

} // namespace pw
