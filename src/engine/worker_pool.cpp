// Pixelweave engine: WorkerPool implementation
#include "engine/worker_pool.hpp"

#include <algorithm>

#include "pw_types.hpp"

namespace pw {

thread_local int WorkerPool::tls_worker_id_ = -1;

WorkerPool::WorkerPool(unsigned int num_threads)
    : num_threads_(num_threads > 0 ? num_threads : std::max(1u, std::thread::hardware_concurrency())) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
    if (running_) return;
    running_ = true;
    workers_.reserve(num_threads_);
    for (unsigned int i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&WorkerPool::run_loop, this, static_cast<int>(i));
    }
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

void WorkerPool::submit(Task&& task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) {
            throw FilterError(FilterErrc::Unknown, "WorkerPool: submit on a stopped pool");
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

int WorkerPool::this_worker_id() { return tls_worker_id_; }

void WorkerPool::run_loop(int thread_id) {
    tls_worker_id_ = thread_id;
    while (true) {
        Task job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return !queue_.empty() || !running_; });
            // 停止时先把队列里剩下的任务执行完，保证所有 future 都会被满足
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop();
        }
        job();
    }
    tls_worker_id_ = -1;
}

}  // namespace pw
