#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "execution_task.hpp"

namespace docflow::scheduler {

/*
  Thread-safe blocking queue for execution workers.

  Not durable: executions queued at shutdown stay PENDING in the store and
  are picked up by Orchestrator::ResumeIncomplete() on the next start.
*/
class ExecutionScheduler {
 public:
  void Enqueue(const ExecutionTask& task);

  // Blocks until a task is available. Empty once Shutdown() was called.
  std::optional<ExecutionTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::queue<ExecutionTask>   queue_;
  bool                      shutdown_ = false;
};

} // namespace docflow::scheduler
