#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "execution_scheduler.hpp"

namespace docflow::orchestrator {
class Orchestrator;
}

namespace docflow::scheduler {

/*
  Background worker that drives executions.

  Takes tasks off the shared scheduler and hands them to
  Orchestrator::Run(). Several workers share one scheduler; executions run
  concurrently, stages within one execution never do.
*/
class ExecutionWorker {
 public:
  ExecutionWorker(std::shared_ptr<ExecutionScheduler> scheduler, std::shared_ptr<orchestrator::Orchestrator> orchestrator);
  ~ExecutionWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ExecutionScheduler>         scheduler_;
  std::shared_ptr<orchestrator::Orchestrator> orchestrator_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace docflow::scheduler
