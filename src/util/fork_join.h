#pragma once

/// @file fork_join.h
/// @brief Bounded fork-join over an index range.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace masterprint {

/// @brief Returns a worker count bounded by hardware concurrency and task count.
/// @param n_tasks Number of tasks
/// @param max_workers Upper bound (0 = hardware concurrency)
inline size_t bounded_worker_count(size_t n_tasks, size_t max_workers) {
  size_t hw = std::max<size_t>(1, std::thread::hardware_concurrency());
  size_t limit = max_workers == 0 ? hw : std::min(max_workers, hw);
  return std::max<size_t>(1, std::min(limit, n_tasks));
}

/// @brief Runs task(i) for every i in [0, n_tasks) on at most max_workers threads.
/// @details Tasks are claimed from a shared counter, so completion order is unspecified.
///          Blocks until all tasks finish. The first exception thrown by a task is rethrown
///          after every worker has joined.
/// @param n_tasks Number of tasks
/// @param max_workers Upper bound on threads (0 = hardware concurrency)
/// @param task Callable taking a size_t index
template <typename Task>
void fork_join(size_t n_tasks, size_t max_workers, Task&& task) {
  if (n_tasks == 0) return;

  size_t n_workers = bounded_worker_count(n_tasks, max_workers);
  std::atomic<size_t> next{0};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < n_tasks; i = next.fetch_add(1)) {
      try {
        task(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) first_error = std::current_exception();
      }
    }
  };

  if (n_workers == 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(n_workers - 1);
    for (size_t w = 1; w < n_workers; ++w) {
      threads.emplace_back(worker);
    }
    worker();
    for (auto& t : threads) {
      t.join();
    }
  }

  if (first_error) std::rethrow_exception(first_error);
}

}  // namespace masterprint
