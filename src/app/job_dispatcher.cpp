#include <pictor/app/job_dispatcher.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace pictor::app {

namespace pc = pictor::core;

namespace detail {

void run_job(const JobHandler& handler, const std::string& item_id) noexcept {
  try {
    handler(item_id);
  } catch (const std::exception& e) {
    spdlog::error("job {}: unhandled exception escaped the pipeline: {}", item_id, e.what());
  } catch (...) {
    spdlog::error("job {}: unhandled non-standard exception escaped the pipeline", item_id);
  }
}

std::size_t effective_workers(std::size_t num_workers) noexcept {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace detail

ThreadPoolJobDispatcher::ThreadPoolJobDispatcher(JobHandler handler, std::size_t num_workers)
    : handler_(std::move(handler)) {
  const std::size_t workers = detail::effective_workers(num_workers);
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this]() { worker_loop(); });
  }
}

ThreadPoolJobDispatcher::~ThreadPoolJobDispatcher() {
  shutdown();
}

std::expected<void, pc::Error> ThreadPoolJobDispatcher::submit(std::string item_id) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      return std::unexpected(
          pc::make_error(pc::ErrorCode::Unavailable, "job dispatcher is shut down"));
    }
    queue_.push_back(std::move(item_id));
  }
  work_cv_.notify_one();
  return {};
}

void ThreadPoolJobDispatcher::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && active_ == 0; });
}

void ThreadPoolJobDispatcher::shutdown() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  // Concurrent callers (e.g. the destructor racing an explicit shutdown) join in turn.
  std::lock_guard join_lock(join_mutex_);
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void ThreadPoolJobDispatcher::worker_loop() {
  while (true) {
    std::string item_id;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break;  // stopping and drained
      item_id = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    detail::run_job(handler_, item_id);

    {
      std::lock_guard lock(mutex_);
      --active_;
      if (queue_.empty() && active_ == 0) idle_cv_.notify_all();
    }
  }
}

}  // namespace pictor::app
