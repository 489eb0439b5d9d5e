#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace tracelens::exec {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue for analysis workers.
*/
class TaskQueue {
 public:
  // Returns false once the queue is shut down.
  bool Enqueue(Task task);

  // blocking wait; nullopt after shutdown once drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace tracelens::exec
