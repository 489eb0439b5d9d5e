#include "internal/exec/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/exec/task_queue.hpp"

namespace {

using tracelens::exec::TaskQueue;
using tracelens::exec::WorkerPool;

void TestSubmitReturnsResults() {
  WorkerPool pool(4);
  pool.Start();
  assert(pool.size() == 4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 32; ++i) {
    futures.push_back(pool.Submit([i] { return i * i; }));
  }
  for (int i = 0; i < 32; ++i) {
    assert(futures[static_cast<std::size_t>(i)].get() == i * i);
  }
}

void TestExceptionStaysInFuture() {
  WorkerPool pool(2);
  pool.Start();

  auto failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  auto fine    = pool.Submit([] { return 7; });

  bool threw = false;
  try {
    (void)failing.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(fine.get() == 7);
}

void TestStopDrainsQueuedTasks() {
  std::atomic<int> done{0};
  {
    WorkerPool pool(1);
    pool.Start();
    for (int i = 0; i < 10; ++i) {
      (void)pool.Submit([&done] { done.fetch_add(1); });
    }
    pool.Stop();
  }
  assert(done.load() == 10);
}

void TestSubmitAfterStopThrows() {
  WorkerPool pool(1);
  pool.Start();
  pool.Stop();

  bool threw = false;
  try {
    (void)pool.Submit([] { return 1; });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroThreadsUsesHardware() {
  WorkerPool pool(0);
  assert(pool.size() >= 1);
}

void TestQueueShutdown() {
  TaskQueue queue;
  int       ran = 0;
  assert(queue.Enqueue([&ran] { ++ran; }));
  queue.Shutdown();
  assert(!queue.Enqueue([&ran] { ++ran; }));

  auto task = queue.Dequeue();
  assert(task);
  (*task)();
  assert(ran == 1);
  assert(!queue.Dequeue());
}

} // namespace

int main() {
  TestSubmitReturnsResults();
  TestExceptionStaysInFuture();
  TestStopDrainsQueuedTasks();
  TestSubmitAfterStopThrows();
  TestZeroThreadsUsesHardware();
  TestQueueShutdown();

  std::cout << "tracelens_unit_worker_pool: pass\n";
  return 0;
}
