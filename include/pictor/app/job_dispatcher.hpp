#pragma once

#include <pictor/core/error.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pictor::app {

/// Work run for one accepted item; invoked on a worker thread.
using JobHandler = std::function<void(const std::string& item_id)>;

/// Runs jobs off the caller's thread. submit() never waits for the job.
class IJobDispatcher {
 public:
  virtual ~IJobDispatcher() = default;

  /// Enqueue one job. Unavailable after shutdown().
  [[nodiscard]] virtual std::expected<void, pictor::core::Error> submit(std::string item_id) = 0;

  /// Block until every job submitted so far has finished.
  virtual void wait_idle() = 0;

  /// Finish queued jobs, then stop accepting new ones. Idempotent.
  virtual void shutdown() = 0;
};

namespace detail {

/// Invoke handler; any exception is logged and contained.
void run_job(const JobHandler& handler, const std::string& item_id) noexcept;

std::size_t effective_workers(std::size_t num_workers) noexcept;

}  // namespace detail

/// Fixed pool of std::thread workers draining a FIFO queue.
/// num_workers 0 = use hardware concurrency.
class ThreadPoolJobDispatcher : public IJobDispatcher {
 public:
  explicit ThreadPoolJobDispatcher(JobHandler handler, std::size_t num_workers = 0);
  ~ThreadPoolJobDispatcher() override;

  ThreadPoolJobDispatcher(const ThreadPoolJobDispatcher&) = delete;
  ThreadPoolJobDispatcher& operator=(const ThreadPoolJobDispatcher&) = delete;

  [[nodiscard]] std::expected<void, pictor::core::Error> submit(std::string item_id) override;
  void wait_idle() override;
  void shutdown() override;

  [[nodiscard]] std::size_t worker_count() {
    std::lock_guard lock(join_mutex_);
    return threads_.size();
  }

 private:
  void worker_loop();

  JobHandler handler_;
  std::mutex mutex_;
  std::mutex join_mutex_;  // guards threads_ after construction
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::string> queue_;
  std::size_t active_{0};
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace pictor::app
