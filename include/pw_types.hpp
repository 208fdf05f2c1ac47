#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <opencv2/core.hpp>

namespace pw {

namespace fs = std::filesystem;

// 像素坐标与区域直接沿用 OpenCV 的类型
using Point = cv::Point;
using Region = cv::Rect;

#if defined(_WIN32)
    #if defined(PIXELWEAVE_LIB_BUILD)
        #define PIXELWEAVE_API __declspec(dllexport)
    #else
        #define PIXELWEAVE_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(PIXELWEAVE_LIB_BUILD)
        #define PIXELWEAVE_API __attribute__((visibility("default")))
    #else
        #define PIXELWEAVE_API
    #endif
#endif

enum class FilterErrc {
    Unknown = 1, ShapeMismatch, InvalidParameter, InvalidComposition,
    UnsupportedType, NotFound, Io,
};
struct PIXELWEAVE_API FilterError : public std::runtime_error {
    explicit FilterError(const std::string& what)
        : std::runtime_error(what), code_(FilterErrc::Unknown) {}
    FilterError(FilterErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    FilterErrc code() const noexcept { return code_; }
private:
    FilterErrc code_;
};

} // namespace pw
