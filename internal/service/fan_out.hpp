#pragma once

#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/exec/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "tracelens/v1/reports.pb.h"

namespace tracelens::service {

using Notes = google::protobuf::RepeatedPtrField<tracelens::v1::AnalysisNote>;

/*
  Dispatches independent sub-analyses to the worker pool, or runs them
  inline when there is none. Submitted callables may capture the caller's
  locals by reference: every future is waited on before the caller returns.
*/
class FanOut {
 public:
  explicit FanOut(exec::WorkerPool* pool) : pool_(pool) {
  }

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    if (pool_) {
      return pool_->Submit(std::forward<Fn>(fn));
    }
    std::packaged_task<std::invoke_result_t<Fn>()> task(std::forward<Fn>(fn));
    auto                                           future = task.get_future();
    task();
    return future;
  }

 private:
  exec::WorkerPool* pool_;
};

/*
  Waits on every tracked future when it goes out of scope, including while
  an exception unwinds the caller. Declare it after the futures it tracks.
*/
class WaitGuard {
 public:
  WaitGuard() = default;
  ~WaitGuard() {
    for (auto& wait : waits_) {
      wait();
    }
  }

  WaitGuard(const WaitGuard&)            = delete;
  WaitGuard& operator=(const WaitGuard&) = delete;

  template <typename T>
  void Track(const std::future<T>& future) {
    waits_.push_back([&future] {
      if (future.valid()) {
        future.wait();
      }
    });
  }

 private:
  std::vector<std::function<void()>> waits_;
};

inline void AddNote(Notes* notes, std::string_view analysis, std::string_view reason) {
  auto* note = notes->Add();
  note->set_analysis(std::string(analysis));
  note->set_reason(std::string(reason));
}

// Result of a sub-analysis, or nullopt with a note recorded. Never throws
// for std::exception failures so siblings are unaffected.
template <typename T>
std::optional<T> Collect(std::future<T>& future, std::string_view analysis, Notes* notes) {
  try {
    return future.get();
  } catch (const util::InsufficientData& e) {
    AddNote(notes, analysis, e.what());
  } catch (const std::exception& e) {
    TRACELENS_LOG_WARN("Sub-analysis failed", {observability::StringField("analysis", analysis), observability::StringField("error", e.what())});
    AddNote(notes, analysis, e.what());
  }
  return std::nullopt;
}

// Waits for every future, then rethrows the first failure if any.
template <typename T>
std::vector<T> GetAll(std::vector<std::future<T>>& futures) {
  std::vector<T>     results;
  std::exception_ptr failure;
  results.reserve(futures.size());
  for (auto& future : futures) {
    try {
      results.push_back(future.get());
    } catch (...) {
      if (!failure) failure = std::current_exception();
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
  return results;
}

} // namespace tracelens::service
