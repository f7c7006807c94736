#include <pictor/app/job_dispatcher_tbb.hpp>

#ifdef PICTOR_HAS_TBB

#include <algorithm>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;

namespace {

std::size_t parallelism_for(std::size_t workers) {
  const auto available = static_cast<std::size_t>(tbb::this_task_arena::max_concurrency());
  return std::max(available, workers + 1);
}

}  // namespace

TbbJobDispatcher::TbbJobDispatcher(JobHandler handler, std::size_t num_workers)
    : handler_(std::move(handler)),
      parallelism_(tbb::global_control::max_allowed_parallelism,
                   parallelism_for(detail::effective_workers(num_workers))),
      arena_(static_cast<int>(detail::effective_workers(num_workers)), 0) {}

TbbJobDispatcher::~TbbJobDispatcher() noexcept {
  shutdown();
}

std::expected<void, pc::Error> TbbJobDispatcher::submit(std::string item_id) {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      return std::unexpected(
          pc::make_error(pc::ErrorCode::Unavailable, "job dispatcher is shut down"));
    }
    ++in_flight_;
  }
  arena_.enqueue([this, id = std::move(item_id)]() {
    detail::run_job(handler_, id);
    finish_job();
  });
  return {};
}

void TbbJobDispatcher::finish_job() {
  // Notify under the lock: the dispatcher may be destroyed as soon as in_flight_ hits 0.
  std::lock_guard lock(mutex_);
  if (--in_flight_ == 0) idle_cv_.notify_all();
}

void TbbJobDispatcher::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

void TbbJobDispatcher::shutdown() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  wait_idle();
}

}  // namespace pictor::app

#endif  // PICTOR_HAS_TBB
