#include "execution_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/orchestrator/orchestrator.hpp"

namespace docflow::scheduler {

using docflow::observability::StringField;

ExecutionWorker::ExecutionWorker(std::shared_ptr<ExecutionScheduler> scheduler, std::shared_ptr<orchestrator::Orchestrator> orchestrator)
    : scheduler_(std::move(scheduler)), orchestrator_(std::move(orchestrator)) {
}

ExecutionWorker::~ExecutionWorker() {
  Stop();
}

void ExecutionWorker::Start() {
  running_ = true;
  thread_  = std::thread(&ExecutionWorker::Run, this);
}

void ExecutionWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void ExecutionWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      orchestrator_->Run(task->execution_id);
    } catch (const std::exception& e) {
      DOCFLOW_LOG_ERROR("execution run aborted", {StringField("execution_id", task->execution_id), StringField("error", e.what())});
    }
  }
}

} // namespace docflow::scheduler
