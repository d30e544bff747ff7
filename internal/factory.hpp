#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/analysis/sentiment_detector.hpp"
#include "internal/analysis/text_detector.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/scheduler/execution_scheduler.hpp"
#include "internal/scheduler/execution_worker.hpp"
#include "internal/service/pipeline_service.hpp"
#include "internal/storage/object_store.hpp"

namespace docflow::factory {

/*
  Collaborators supplied by the embedding process instead of the ones the
  config would build (real OCR / sentiment providers, test doubles).
*/
struct Collaborators {
  storage::ObjectStorePtr         object_store;
  analysis::TextDetectorPtr       text_detector;
  analysis::SentimentDetectorPtr  sentiment_detector;
};

/*
  Runtime

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                     repository;
  storage::ObjectStorePtr                             object_store;
  std::shared_ptr<const pipeline::PipelineDefinition> pipeline;
  std::shared_ptr<orchestrator::Orchestrator>         orchestrator;
  std::shared_ptr<scheduler::ExecutionScheduler>      scheduler;
  std::vector<std::unique_ptr<scheduler::ExecutionWorker>> workers;
  std::shared_ptr<service::PipelineService>           pipeline_service;

  // Starts the worker pool and schedules every incomplete execution.
  void Start();

  // Stops the workers. Queued executions stay PENDING in the store.
  void Stop();
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
Runtime BuildRuntime(const docflow::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

}
