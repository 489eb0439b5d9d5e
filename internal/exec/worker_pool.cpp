#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace tracelens::exec {

WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads > 0 ? threads : std::max<std::size_t>(std::thread::hardware_concurrency(), 1)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (started_) return;
  started_ = true;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  TRACELENS_LOG_INFO("Analysis workers started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    // packaged_task stores exceptions in the future
    (*task)();
  }
}

} // namespace tracelens::exec
