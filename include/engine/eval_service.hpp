// Pixelweave engine: EvalService, the evaluation strategies
#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "engine/async_filter.hpp"
#include "engine/eval_event_service.hpp"
#include "engine/worker_pool.hpp"
#include "engine_config.hpp"
#include "filter/filter.hpp"

namespace pw {

struct EvalOptions {
    bool log_timing = false;
    // Rows per parallel band; 0 splits the image evenly across the workers.
    int rows_per_task = 0;
    AsyncMode async_mode = AsyncMode::Row;
};

EvalOptions eval_options_from(const EngineConfig& config);

// Sized by config.worker_threads (0 = hardware concurrency). Not started.
std::unique_ptr<WorkerPool> make_worker_pool(const EngineConfig& config);

/**
 * @class EvalService
 * @brief 把一个 Filter 应用到输出图像上的各种方式。
 *
 * 所有策略都按行优先顺序访问坐标，并且在任何 compute_at 之前
 * 恰好执行一次 before_compute。pool 与 events 都是可选的，不归本类所有。
 */
class EvalService {
public:
    explicit EvalService(WorkerPool* pool = nullptr,
                         EvalEventService* events = nullptr,
                         EvalOptions options = {})
        : pool_(pool), events_(events), options_(options) {}

    void eval(const Filter& filter, const std::vector<const Image*>& inputs, Image& output);

    // Points of `roi` outside the output are skipped.
    void eval_partial(const Filter& filter, const std::vector<const Image*>& inputs,
                      Image& output, const Region& roi);

    void eval_in_place(const PointFilter& filter, Image& image);

    // Row bands on the pool. Throws if no running pool is attached;
    // the first worker exception is rethrown after every band has finished.
    void eval_parallel(const Filter& filter, const std::vector<const Image*>& inputs,
                       Image& output);

    AsyncFilter to_async(const Filter& filter, std::vector<const Image*> inputs,
                         Image& output) const {
        return AsyncFilter(filter, options_.async_mode, std::move(inputs), output);
    }
    AsyncFilter to_async(const Filter& filter, std::vector<const Image*> inputs,
                         Image& output, AsyncMode mode) const {
        return AsyncFilter(filter, mode, std::move(inputs), output);
    }

    /**
     * @brief 在 pool 上协作式地驱动一个 AsyncFilter。
     *
     * 每个 Pending 步骤把自己重新投递到队列尾部，最后一步满足返回的 future。
     * 源图像与输出以共享存储的方式被复制进任务，因此调用方无需保持它们存活;
     * 写入仍然落在调用方的 output 存储上。
     */
    std::future<void> eval_async(FilterPtr filter, const std::vector<const Image*>& inputs,
                                 Image& output);
    std::future<void> eval_async(FilterPtr filter, const std::vector<const Image*>& inputs,
                                 Image& output, AsyncMode mode);

    const EvalOptions& options() const { return options_; }
    WorkerPool* pool() const { return pool_; }

private:
    using Clock = std::chrono::high_resolution_clock;

    void record(const std::string& filter, const char* strategy, int width, int height,
                Clock::time_point start) const;

    WorkerPool* pool_;
    EvalEventService* events_;
    EvalOptions options_;
};

} // namespace pw
