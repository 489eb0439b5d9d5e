#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "task_queue.hpp"

namespace tracelens::exec {

/*
  Fixed set of threads draining a TaskQueue.

  Analyses fan out with Submit() and fan in through the returned futures;
  an exception thrown by a task is stored in its future and never reaches
  the worker thread.
*/
class WorkerPool {
 public:
  // threads == 0 selects the hardware concurrency.
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  std::size_t size() const { return thread_count_; }

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future  = task->get_future();
    if (!queue_.Enqueue([task] { (*task)(); })) {
      throw std::runtime_error("worker pool is stopped");
    }
    return future;
  }

 private:
  void Run();

  std::size_t              thread_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  bool                     started_ = false;
};

} // namespace tracelens::exec
