#pragma once

#include <pictor/app/job_dispatcher.hpp>

#ifdef PICTOR_HAS_TBB

#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace pictor::app {

/// Dispatcher that enqueues each job into a dedicated tbb::task_arena with no slot
/// reserved for the caller, so jobs start on TBB workers while submit() returns.
/// num_workers 0 = use hardware concurrency.
class TbbJobDispatcher : public IJobDispatcher {
 public:
  explicit TbbJobDispatcher(JobHandler handler, std::size_t num_workers = 0);
  ~TbbJobDispatcher() noexcept override;

  TbbJobDispatcher(const TbbJobDispatcher&) = delete;
  TbbJobDispatcher& operator=(const TbbJobDispatcher&) = delete;

  [[nodiscard]] std::expected<void, pictor::core::Error> submit(std::string item_id) override;
  void wait_idle() override;
  void shutdown() override;

 private:
  void finish_job();

  JobHandler handler_;
  // TBB keeps max_allowed_parallelism - 1 workers; raised so the arena always gets its own.
  tbb::global_control parallelism_;
  tbb::task_arena arena_;
  std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_{0};
  bool stopped_{false};
};

}  // namespace pictor::app

#endif  // PICTOR_HAS_TBB
