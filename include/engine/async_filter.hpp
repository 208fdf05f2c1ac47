// Pixelweave engine: AsyncFilter, resumable row/pixel-granular evaluation
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "filter/filter.hpp"

namespace pw {

// 每一步处理的粒度
enum class AsyncMode {
  Pixel,  // one pixel per step
  Row,    // one row per step
};

enum class AsyncStatus { Pending, Ready };

const char* async_mode_name(AsyncMode mode);
std::optional<AsyncMode> async_mode_from_name(const std::string& name);

/**
 * @class AsyncFilter
 * @brief 一次求值的显式状态机: Running(cursor, mode) -> ... -> Done。
 *
 * 每次 step() 处理一个单位的工作 (一行或一个像素)，然后报告是否还有剩余。
 * 它从不阻塞等待; Pending 仅表示"请再调用一次"。
 * 第一次 step() 会先执行 filter.before_compute。
 *
 * 没有取消原语: 调用方停止调用 step() 即可，游标以下的行保持原内容。
 *
 * @note filter 与 output 必须比任务活得更久; 源图像列表被复制到任务内部。
 */
class AsyncFilter {
public:
  AsyncFilter(const Filter& filter, AsyncMode mode, std::vector<const Image*> inputs,
              Image& output);

  AsyncFilter(const AsyncFilter&) = delete;
  AsyncFilter& operator=(const AsyncFilter&) = delete;
  AsyncFilter(AsyncFilter&&) = default;
  AsyncFilter& operator=(AsyncFilter&&) = default;

  // Throws FilterError(InvalidParameter) once the task has completed.
  AsyncStatus step();
  // Steps until Ready.
  void run();

  bool done() const { return done_; }
  AsyncMode mode() const { return mode_; }
  Point cursor() const { return Point(x_, y_); }
  size_t steps() const { return steps_; }

private:
  const Filter* filter_;
  AsyncMode mode_;
  std::vector<const Image*> images_;
  Input input_;
  Image* output_;
  int x_ = 0;
  int y_ = 0;
  size_t steps_ = 0;
  bool prepared_ = false;
  bool done_ = false;
};

}  // namespace pw
