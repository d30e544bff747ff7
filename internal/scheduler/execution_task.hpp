#pragma once

#include <string>

namespace docflow::scheduler {

/*
  A request to drive one execution.

  Carries only the id: the worker reloads the record, so a task enqueued
  twice is harmless.
*/
struct ExecutionTask {
  std::string execution_id;
};

} // namespace docflow::scheduler
