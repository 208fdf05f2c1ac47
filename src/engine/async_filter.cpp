// Pixelweave engine: AsyncFilter implementation
#include "engine/async_filter.hpp"

namespace pw {

const char* async_mode_name(AsyncMode mode) {
  return mode == AsyncMode::Pixel ? "pixel" : "row";
}

std::optional<AsyncMode> async_mode_from_name(const std::string& name) {
  if (name == "pixel") return AsyncMode::Pixel;
  if (name == "row") return AsyncMode::Row;
  return std::nullopt;
}

AsyncFilter::AsyncFilter(const Filter& filter, AsyncMode mode,
                         std::vector<const Image*> inputs, Image& output)
    : filter_(&filter),
      mode_(mode),
      images_(std::move(inputs)),
      input_(images_),
      output_(&output) {}

AsyncStatus AsyncFilter::step() {
  if (done_) {
    throw FilterError(FilterErrc::InvalidParameter,
                      "AsyncFilter: step() on a completed task (" +
                          filter_->name() + ")");
  }
  if (!prepared_) {
    filter_->before_compute(input_, *output_);
    prepared_ = true;
  }

  const int width = output_->width();
  const int height = output_->height();
  if (y_ < height && width > 0) {
    auto compute = [&](int x, int y) {
      const Point pt(x, y);
      Pixel dest = output_->get_pixel(pt);
      filter_->compute_at(pt, input_, dest);
      output_->set_pixel(pt, dest);
    };

    switch (mode_) {
      case AsyncMode::Row:
        for (int x = 0; x < width; ++x) compute(x, y_);
        y_ += 1;
        break;
      case AsyncMode::Pixel:
        compute(x_, y_);
        x_ += 1;
        if (x_ >= width) {
          x_ = 0;
          y_ += 1;
        }
        break;
    }
    ++steps_;
  } else {
    // 空图像: 没有任何工作
    y_ = height;
  }

  if (y_ < height) return AsyncStatus::Pending;
  done_ = true;
  return AsyncStatus::Ready;
}

void AsyncFilter::run() {
  while (step() == AsyncStatus::Pending) {
  }
}

}  // namespace pw
