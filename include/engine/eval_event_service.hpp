#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace pw {

class EvalEventService {
 public:
  struct EvalEvent {
    std::string filter;
    std::string strategy;
    int width;
    int height;
    double elapsed_ms;
  };

  void push(const std::string& filter, const std::string& strategy, int width,
            int height, double ms);
  std::vector<EvalEvent> drain();
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<EvalEvent> buffer_;
};

}  // namespace pw
