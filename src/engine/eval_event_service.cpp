#include "engine/eval_event_service.hpp"

namespace pw {

void EvalEventService::push(const std::string& filter,
                            const std::string& strategy,
                            int width,
                            int height,
                            double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(EvalEvent{ filter, strategy, width, height, ms });
}

std::vector<EvalEventService::EvalEvent> EvalEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EvalEvent> out;
    out.swap(buffer_);
    return out;
}

size_t EvalEventService::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

} // namespace pw
