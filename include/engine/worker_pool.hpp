// Pixelweave engine: WorkerPool, fixed set of worker threads fed from one queue
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace pw {

using Task = std::function<void()>;

class WorkerPool {
public:
  // num_threads == 0 uses std::thread::hardware_concurrency().
  explicit WorkerPool(unsigned int num_threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  // Drains the queue, then joins the workers.
  void stop();
  bool running() const { return running_; }
  unsigned int size() const { return num_threads_; }

  // 异常通过 future 传回调用方
  template <typename Fn>
  auto post(Fn&& fn) -> std::future<decltype(fn())> {
    using Ret = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
    std::future<Ret> fut = task->get_future();
    submit([task] { (*task)(); });
    return fut;
  }

  // Raw submission; `task` must not throw. Use post() otherwise.
  void submit(Task&& task);

  // Worker index of the calling thread, -1 outside the pool.
  static int this_worker_id();

private:
  void run_loop(int thread_id);

  unsigned int num_threads_{0};
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};

  std::queue<Task> queue_;
  std::mutex mtx_;
  std::condition_variable cv_;

  static thread_local int tls_worker_id_;
};

}  // namespace pw
