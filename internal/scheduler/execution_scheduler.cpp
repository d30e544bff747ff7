#include "execution_scheduler.hpp"

namespace docflow::scheduler {

void ExecutionScheduler::Enqueue(const ExecutionTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ExecutionTask> ExecutionScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  ExecutionTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void ExecutionScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t ExecutionScheduler::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace docflow::scheduler
