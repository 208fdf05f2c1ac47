// Pixelweave engine: EvalService implementation
#include "engine/eval_service.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

namespace pw {

namespace {

using Clock = std::chrono::high_resolution_clock;

void log_and_push(EvalEventService* events, bool log_timing, const std::string& filter,
                  const char* strategy, int width, int height, Clock::time_point start) {
    double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    if (ms < 0) ms = 0.0;
    if (events) events->push(filter, strategy, width, height, ms);
    if (log_timing) {
        std::cout << "[pixelweave] " << strategy << " " << filter << " " << width << "x" << height
                  << " in " << std::fixed << std::setprecision(3) << ms << " ms" << std::endl;
    }
}

// 协作式任务的全部状态; Image 副本与调用方共享存储
struct AsyncRun {
    AsyncRun(FilterPtr f, const std::vector<const Image*>& inputs, Image out, AsyncMode mode)
        : filter(std::move(f)), output(std::move(out)) {
        sources.reserve(inputs.size());
        for (const Image* img : inputs) sources.push_back(*img);
        for (const Image& img : sources) source_ptrs.push_back(&img);
        task = std::make_unique<AsyncFilter>(*filter, mode, source_ptrs, output);
    }

    FilterPtr filter;
    std::vector<Image> sources;
    std::vector<const Image*> source_ptrs;
    Image output;
    std::unique_ptr<AsyncFilter> task;
    std::promise<void> done;
    Clock::time_point start = Clock::now();
    EvalEventService* events = nullptr;
    bool log_timing = false;
};

void schedule_step(WorkerPool& pool, std::shared_ptr<AsyncRun> run) {
    pool.submit([&pool, run]() {
        try {
            if (run->task->step() == AsyncStatus::Pending) {
                schedule_step(pool, run);
                return;
            }
            log_and_push(run->events, run->log_timing, run->filter->name(),
                         run->task->mode() == AsyncMode::Row ? "async_row" : "async_pixel",
                         run->output.width(), run->output.height(), run->start);
            run->done.set_value();
        } catch (...) {
            // 转交给 future 的持有者
            run->done.set_exception(std::current_exception());
        }
    });
}

} // namespace

EvalOptions eval_options_from(const EngineConfig& config) {
    EvalOptions opts;
    opts.log_timing = config.log_timing;
    opts.rows_per_task = std::max(0, config.rows_per_task);
    opts.async_mode = async_mode_from_name(config.default_async_mode).value_or(AsyncMode::Row);
    return opts;
}

std::unique_ptr<WorkerPool> make_worker_pool(const EngineConfig& config) {
    return std::make_unique<WorkerPool>(static_cast<unsigned int>(std::max(0, config.worker_threads)));
}

void EvalService::record(const std::string& filter, const char* strategy, int width, int height,
                         Clock::time_point start) const {
    log_and_push(events_, options_.log_timing, filter, strategy, width, height, start);
}

void EvalService::eval(const Filter& filter, const std::vector<const Image*>& inputs,
                       Image& output) {
    auto start = Clock::now();
    Input input(inputs);
    filter.before_compute(input, output);
    compute_image(filter, input, output);
    record(filter.name(), "full", output.width(), output.height(), start);
}

void EvalService::eval_partial(const Filter& filter, const std::vector<const Image*>& inputs,
                               Image& output, const Region& roi) {
    auto start = Clock::now();
    Input input(inputs);
    filter.before_compute(input, output);
    output.for_each_region(roi, [&](const Point& pt, Pixel& dest) {
        filter.compute_at(pt, input, dest);
    });
    Region r = roi & output.bounds();
    record(filter.name(), "partial", r.width, r.height, start);
}

void EvalService::eval_in_place(const PointFilter& filter, Image& image) {
    auto start = Clock::now();
    std::vector<const Image*> sources{&image};
    Input input(sources);
    filter.before_compute(input, image);
    image.for_each([&](const Point&, Pixel& px) {
        const Pixel src = px;
        filter.compute_pixel(src, px);
    });
    record(filter.name(), "in_place", image.width(), image.height(), start);
}

void EvalService::eval_parallel(const Filter& filter, const std::vector<const Image*>& inputs,
                                Image& output) {
    if (!pool_ || !pool_->running()) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "eval_parallel: no running WorkerPool attached");
    }
    auto start = Clock::now();
    Input input(inputs);
    filter.before_compute(input, output);

    const int height = output.height();
    const int width = output.width();
    int band = options_.rows_per_task;
    if (band <= 0) {
        const int workers = static_cast<int>(pool_->size());
        band = std::max(1, (height + workers - 1) / workers);
    }

    std::vector<std::future<void>> futures;
    for (int y0 = 0; y0 < height; y0 += band) {
        const Region rows(0, y0, width, std::min(band, height - y0));
        futures.push_back(pool_->post([&filter, &input, &output, rows]() {
            output.for_each_region(rows, [&](const Point& pt, Pixel& dest) {
                filter.compute_at(pt, input, dest);
            });
        }));
    }
    // 所有分带都结束后才能离开: 它们引用了栈上的 input
    for (auto& f : futures) f.wait();
    for (auto& f : futures) f.get();

    record(filter.name(), "parallel", width, height, start);
}

std::future<void> EvalService::eval_async(FilterPtr filter,
                                          const std::vector<const Image*>& inputs,
                                          Image& output) {
    return eval_async(std::move(filter), inputs, output, options_.async_mode);
}

std::future<void> EvalService::eval_async(FilterPtr filter,
                                          const std::vector<const Image*>& inputs,
                                          Image& output, AsyncMode mode) {
    if (!filter) {
        throw FilterError(FilterErrc::InvalidParameter, "eval_async: null filter");
    }
    if (!pool_ || !pool_->running()) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "eval_async: no running WorkerPool attached");
    }
    auto run = std::make_shared<AsyncRun>(std::move(filter), inputs, output, mode);
    run->events = events_;
    run->log_timing = options_.log_timing;
    std::future<void> fut = run->done.get_future();
    schedule_step(*pool_, run);
    return fut;
}

} // namespace pw
