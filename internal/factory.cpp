#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analysis/lexicon_sentiment_detector.hpp"
#include "internal/analysis/object_text_detector.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stage/analysis_stage.hpp"
#include "internal/stage/metadata_stage.hpp"
#include "internal/stage/persistence_stage.hpp"
#include "internal/stage/stage_registry.hpp"
#include "internal/stage/text_extraction_stage.hpp"
#include "internal/storage/object_store_factory.hpp"
#include "internal/store/execution_store.hpp"
#include "internal/util/time.hpp"
#if DOCFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace docflow::factory {

using docflow::observability::IntField;
using docflow::observability::StringField;
using docflow::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultWorkerThreads = 4;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCFLOW_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<stage::StageRegistry> BuildStages(const RuntimeConfig& config, const Collaborators& collaborators) {
  const auto& analysis = config.analysis();
  const auto  max_text = analysis.max_text_chars() == 0 ? stage::kDefaultMaxTextChars : analysis.max_text_chars();
  const auto  language = analysis.language_code().empty() ? std::string(stage::kDefaultLanguageCode) : analysis.language_code();
  const auto  prefix   = config.output().results_prefix().empty() ? std::string(stage::kDefaultResultsPrefix) : config.output().results_prefix();

  auto text_detector = collaborators.text_detector;
  if (!text_detector) {
    text_detector = std::make_shared<analysis::ObjectTextDetector>(collaborators.object_store);
  }
  auto sentiment_detector = collaborators.sentiment_detector;
  if (!sentiment_detector) {
    sentiment_detector = analysis::LexiconSentimentDetector::Create();
  }

  auto registry = std::make_shared<stage::StageRegistry>();
  registry->Register(std::make_shared<stage::MetadataStage>());
  registry->Register(std::make_shared<stage::TextExtractionStage>(std::move(text_detector)));
  registry->Register(std::make_shared<stage::AnalysisStage>(std::move(sentiment_detector), max_text, language));
  registry->Register(std::make_shared<stage::PersistenceStage>(collaborators.object_store, prefix));
  return registry;
}

orchestrator::OrchestratorOptions BuildOrchestratorOptions(const RuntimeConfig& config) {
  orchestrator::OrchestratorOptions options;
  if (config.store_retry().max_attempts() != 0) {
    options.store_retry_attempts = config.store_retry().max_attempts();
  }
  if (config.store_retry().has_backoff()) {
    options.store_retry_backoff = util::FromProto(config.store_retry().backoff());
  }
  return options;
}

std::shared_ptr<lease::LeaseManager> BuildLeaseManager(const RuntimeConfig& config) {
  if (config.leases().has_execution_lease()) {
    return std::make_shared<lease::LeaseManager>(util::FromProto(config.leases().execution_lease()));
  }
  return std::make_shared<lease::LeaseManager>();
}

} // namespace

void Runtime::Start() {
  for (auto& worker : workers) {
    worker->Start();
  }
  orchestrator->ResumeIncomplete();
}

void Runtime::Stop() {
  scheduler->Shutdown();
  for (auto& worker : workers) {
    worker->Stop();
  }
}

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const RuntimeConfig& config, Collaborators collaborators) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  if (!collaborators.object_store) {
    collaborators.object_store = storage::ObjectStoreFactory::Build(config.object_store());
  }
  runtime.object_store = collaborators.object_store;
  runtime.repository   = BuildRepository(config);

  // ------------------------------------------------------------------
  // Pipeline + stages
  // ------------------------------------------------------------------
  runtime.pipeline = std::make_shared<const pipeline::PipelineDefinition>(config::PipelineFromConfig(config));
  auto registry    = BuildStages(config, collaborators);

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  auto store           = std::make_shared<store::ExecutionStore>(runtime.repository);
  runtime.orchestrator = std::make_shared<orchestrator::Orchestrator>(store, runtime.pipeline, registry, BuildLeaseManager(config),
                                                                      BuildOrchestratorOptions(config));

  // ------------------------------------------------------------------
  // Worker pool
  // ------------------------------------------------------------------
  runtime.scheduler = std::make_shared<scheduler::ExecutionScheduler>();
  runtime.orchestrator->SetScheduleCallback(
      [scheduler = runtime.scheduler](const std::string& execution_id) { scheduler->Enqueue({execution_id}); });

  const auto threads = config.workers().threads() == 0 ? kDefaultWorkerThreads : config.workers().threads();
  for (uint32_t i = 0; i < threads; ++i) {
    runtime.workers.push_back(std::make_unique<scheduler::ExecutionWorker>(runtime.scheduler, runtime.orchestrator));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator         = runtime.orchestrator;
  runtime.pipeline_service = std::make_shared<service::PipelineService>(ctx);

  DOCFLOW_LOG_INFO("runtime built", {IntField("stages", static_cast<int64_t>(runtime.pipeline->Size())), IntField("workers", threads),
                                     StringField("database", config.database().has_sqlite() ? "sqlite" : "memory"),
                                     StringField("object_store", config.object_store().has_arrow() ? "arrow" : "memory")});
  return runtime;
}

}
