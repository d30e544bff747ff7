#include "orchestrator.hpp"

#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "internal/model/document_ref.hpp"
#include "internal/model/stage_payload.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/execution_id.hpp"
#include "internal/util/time.hpp"

namespace docflow::orchestrator {

using docflow::observability::IntField;
using docflow::observability::StringField;
using docflow::v1::ExecutionStatus;

namespace {

/*
  Calls fn until it stops throwing StoreUnavailable or the attempt budget is
  spent; the last StoreUnavailable propagates.
*/
template <typename Fn>
auto WithStoreRetry(const OrchestratorOptions& options, const std::string& execution_id, const char* operation, Fn&& fn) {
  auto delay = options.store_retry_backoff;
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::StoreUnavailable& e) {
      if (attempt >= options.store_retry_attempts) {
        DOCFLOW_LOG_ERROR("execution store unavailable, giving up",
                          {StringField("execution_id", execution_id), StringField("operation", operation), IntField("attempts", attempt),
                           StringField("error", e.what())});
        throw;
      }
      DOCFLOW_LOG_WARN("execution store unavailable, retrying",
                       {StringField("execution_id", execution_id), StringField("operation", operation), IntField("attempt", attempt),
                        IntField("delay_ms", delay.count()), StringField("error", e.what())});
      std::this_thread::sleep_for(delay);
      delay *= 2;
    }
  }
}

class LeaseGuard {
 public:
  LeaseGuard(lease::LeaseManager& leases, std::string lease_id) : leases_(leases), lease_id_(std::move(lease_id)) {
  }
  ~LeaseGuard() {
    leases_.Release(lease_id_);
  }

  LeaseGuard(const LeaseGuard&)            = delete;
  LeaseGuard& operator=(const LeaseGuard&) = delete;

 private:
  lease::LeaseManager& leases_;
  std::string          lease_id_;
};

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<store::ExecutionStore> store, std::shared_ptr<const pipeline::PipelineDefinition> pipeline,
                           std::shared_ptr<const stage::StageRegistry> registry, std::shared_ptr<lease::LeaseManager> leases,
                           OrchestratorOptions options)
    : store_(std::move(store)), pipeline_(std::move(pipeline)), registry_(std::move(registry)), leases_(std::move(leases)), options_(options) {
  if (!store_ || !pipeline_ || !registry_ || !leases_) {
    throw std::invalid_argument("orchestrator requires store, pipeline, registry and lease manager");
  }
  if (options_.store_retry_attempts == 0) {
    throw std::invalid_argument("store retry attempts must be at least 1");
  }
  registry_->Validate(*pipeline_);

  for (const auto& spec : *pipeline_) {
    if (spec.timeout >= leases_->Duration()) {
      throw util::InvalidArgument("execution lease of " + std::to_string(leases_->Duration().count()) + "ms must outlast the " +
                                  std::to_string(spec.timeout.count()) + "ms timeout of stage " + spec.name);
    }
  }
}

void Orchestrator::SetScheduleCallback(ScheduleCallback schedule) {
  std::lock_guard lock(mutex_);
  schedule_ = std::move(schedule);
}

void Orchestrator::Schedule(const std::string& execution_id) {
  ScheduleCallback schedule;
  {
    std::lock_guard lock(mutex_);
    schedule = schedule_;
  }
  if (!schedule) {
    DOCFLOW_LOG_DEBUG("no scheduler attached, execution left for the caller", {StringField("execution_id", execution_id)});
    return;
  }
  schedule(execution_id);
}

// ------------------------------------------------------------------
// Trigger
// ------------------------------------------------------------------

std::optional<db::model::ExecutionRecord> Orchestrator::FindFor(const docflow::v1::DocumentRef& document) {
  if (auto execution_id = store_->Exists(document)) {
    return store_->TryLoad(*execution_id);
  }

  const auto execution_id = util::ExecutionIdFor(document);
  if (auto other = store_->TryLoad(execution_id)) {
    throw util::AlreadyExists("execution id " + execution_id + " of " + model::ToString(document) + " is taken by " + other->container + "/" +
                              other->key);
  }
  return std::nullopt;
}

db::model::ExecutionRecord Orchestrator::LoadFor(const docflow::v1::DocumentRef& document) {
  model::ValidateDocumentRef(document);
  const auto execution_id = store_->Exists(document);
  if (!execution_id) {
    throw util::NotFound("no execution for " + model::ToString(document));
  }
  return store_->Load(*execution_id);
}

StartResult Orchestrator::Start(const docflow::v1::DocumentRef& document) {
  model::ValidateDocumentRef(document);

  auto existing = FindFor(document);
  if (!existing) {
    const auto execution_id = util::ExecutionIdFor(document);
    db::model::ExecutionRecord record;
    record.execution_id  = execution_id;
    record.container     = document.container();
    record.key           = document.key();
    record.status        = docflow::v1::EXECUTION_STATUS_PENDING;
    record.payload       = model::SeedPayload(document);
    record.created_at_ms = util::NowMs();
    record.updated_at_ms = record.created_at_ms;

    try {
      store_->Create(record);
      DOCFLOW_LOG_INFO("execution created", {StringField("execution_id", execution_id), StringField("document", model::ToString(document))});
      Schedule(execution_id);
      return {execution_id, record.status, true};
    } catch (const util::AlreadyExists&) {
      // Lost the insert race; the winner schedules.
      existing = FindFor(document);
      if (!existing) {
        throw;
      }
      return {existing->execution_id, existing->status, false};
    }
  }

  const auto& execution_id = existing->execution_id;
  if (existing->status == docflow::v1::EXECUTION_STATUS_PENDING) {
    {
      std::lock_guard lock(mutex_);
      withdrawn_.erase(execution_id);
    }
    DOCFLOW_LOG_INFO("resuming pending execution",
                     {StringField("execution_id", execution_id), IntField("stage_index", existing->current_stage_index)});
    Schedule(execution_id);
  }
  return {execution_id, existing->status, false};
}

// ------------------------------------------------------------------
// Execution
// ------------------------------------------------------------------

Orchestrator::TokenPtr Orchestrator::RegisterRun(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  if (withdrawn_.erase(execution_id) > 0) {
    return nullptr;
  }
  auto token = std::make_shared<runtime::CancellationToken>();
  running_[execution_id] = token;
  return token;
}

void Orchestrator::UnregisterRun(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  running_.erase(execution_id);
}

void Orchestrator::Run(const std::string& execution_id) {
  auto lease = leases_->TryAcquire(execution_id);
  if (!lease) {
    DOCFLOW_LOG_DEBUG("execution already being driven", {StringField("execution_id", execution_id)});
    return;
  }
  LeaseGuard lease_guard(*leases_, lease->lease_id);

  auto token = RegisterRun(execution_id);
  if (!token) {
    DOCFLOW_LOG_INFO("execution withdrawn before start", {StringField("execution_id", execution_id)});
    return;
  }

  try {
    auto record = WithStoreRetry(options_, execution_id, "load", [&] { return store_->TryLoad(execution_id); });
    if (!record) {
      DOCFLOW_LOG_WARN("scheduled execution does not exist", {StringField("execution_id", execution_id)});
    } else if (model::IsTerminal(record->status)) {
      DOCFLOW_LOG_DEBUG("execution already finished", {StringField("execution_id", execution_id)});
    } else {
      RunStages(*record, *lease, token);
    }
  } catch (const util::LeaseConflict& e) {
    DOCFLOW_LOG_WARN("execution ownership lost, stopping", {StringField("execution_id", execution_id), StringField("error", e.what())});
  } catch (const util::InvalidState& e) {
    DOCFLOW_LOG_WARN("execution finished elsewhere, stopping", {StringField("execution_id", execution_id), StringField("error", e.what())});
  } catch (...) {
    UnregisterRun(execution_id);
    throw;
  }
  UnregisterRun(execution_id);
}

void Orchestrator::RunStages(db::model::ExecutionRecord& record, const lease::Lease& lease, const TokenPtr& token) {
  if (token->IsCancelled()) {
    MarkCancelled(record);
    return;
  }

  record.last_error.clear();
  Checkpoint(record, docflow::v1::EXECUTION_STATUS_RUNNING);
  DOCFLOW_LOG_INFO("execution claimed", {StringField("execution_id", record.execution_id), IntField("stage_index", record.current_stage_index),
                                         IntField("attempt", record.attempt)});

  if (record.current_stage_index > pipeline_->Size()) {
    record.last_error = "stage index " + std::to_string(record.current_stage_index) + " beyond pipeline of " +
                        std::to_string(pipeline_->Size()) + " stages";
    Checkpoint(record, docflow::v1::EXECUTION_STATUS_FAILED);
    DOCFLOW_LOG_ERROR("execution failed", {StringField("execution_id", record.execution_id), StringField("error", record.last_error)});
    return;
  }

  while (record.current_stage_index < pipeline_->Size()) {
    if (token->IsCancelled()) {
      MarkCancelled(record);
      return;
    }
    if (RunStage(record, pipeline_->At(record.current_stage_index), lease, token) == StepOutcome::Stop) {
      return;
    }
  }

  // Nothing left to run (e.g. replay from the end of the pipeline).
  if (record.status == docflow::v1::EXECUTION_STATUS_RUNNING) {
    Checkpoint(record, docflow::v1::EXECUTION_STATUS_SUCCEEDED);
    DOCFLOW_LOG_INFO("execution succeeded", {StringField("execution_id", record.execution_id)});
  }
}

bool Orchestrator::KeepLease(const db::model::ExecutionRecord& record, const lease::Lease& lease) {
  if (leases_->Renew(lease)) {
    return true;
  }
  if (leases_->Reclaim(lease)) {
    DOCFLOW_LOG_WARN("execution lease lapsed, reclaimed", {StringField("execution_id", record.execution_id)});
    return true;
  }
  DOCFLOW_LOG_WARN("execution lease taken over, stopping", {StringField("execution_id", record.execution_id)});
  return false;
}

Orchestrator::StepOutcome Orchestrator::RunStage(db::model::ExecutionRecord& record, const pipeline::StageSpec& spec, const lease::Lease& lease,
                                                 const TokenPtr& token) {
  const auto executor = registry_->Resolve(spec.name);

  for (;;) {
    // Lost to another worker, which resumes from the last checkpoint.
    if (!KeepLease(record, lease)) {
      return StepOutcome::Stop;
    }

    auto result = Invoke(executor, record, spec, token);
    if (result.outcome == stage::StageOutcome::Success) {
      try {
        model::MergeAdditive(record.payload, result.payload);
      } catch (const util::InvalidArgument& e) {
        result = stage::StageResult::Fail(e.what());
      }
    }

    switch (result.outcome) {
      case stage::StageOutcome::Success: {
        ++record.current_stage_index;
        record.attempt = 0;
        record.last_error.clear();

        const bool last = record.current_stage_index == pipeline_->Size();
        Checkpoint(record, last ? docflow::v1::EXECUTION_STATUS_SUCCEEDED : docflow::v1::EXECUTION_STATUS_RUNNING);
        DOCFLOW_LOG_INFO("stage completed", {StringField("execution_id", record.execution_id), StringField("stage", spec.name)});
        if (last) {
          DOCFLOW_LOG_INFO("execution succeeded", {StringField("execution_id", record.execution_id)});
          return StepOutcome::Stop;
        }
        return StepOutcome::Continue;
      }

      case stage::StageOutcome::Fatal:
        ++record.attempt;
        record.last_error = result.reason;
        Checkpoint(record, docflow::v1::EXECUTION_STATUS_FAILED);
        DOCFLOW_LOG_ERROR("stage failed fatally", {StringField("execution_id", record.execution_id), StringField("stage", spec.name),
                                                   StringField("error", result.reason)});
        return StepOutcome::Stop;

      case stage::StageOutcome::Retryable:
        ++record.attempt;
        record.last_error = result.reason;
        if (record.attempt >= spec.max_attempts) {
          Checkpoint(record, docflow::v1::EXECUTION_STATUS_FAILED);
          DOCFLOW_LOG_ERROR("stage retries exhausted", {StringField("execution_id", record.execution_id), StringField("stage", spec.name),
                                                        IntField("attempts", record.attempt), StringField("error", result.reason)});
          return StepOutcome::Stop;
        }

        // Persist the spent attempt so a resumed run keeps counting.
        Checkpoint(record, docflow::v1::EXECUTION_STATUS_RUNNING);

        const auto delay = pipeline::BackoffDelay(spec, record.attempt);
        DOCFLOW_LOG_WARN("stage attempt failed, retrying",
                         {StringField("execution_id", record.execution_id), StringField("stage", spec.name), IntField("attempt", record.attempt),
                          IntField("delay_ms", delay.count()), StringField("error", result.reason)});
        if (token->WaitFor(delay)) {
          MarkCancelled(record);
          return StepOutcome::Stop;
        }
        break;
    }
  }
}

stage::StageResult Orchestrator::Invoke(const std::shared_ptr<stage::StageExecutor>& executor, const db::model::ExecutionRecord& record,
                                        const pipeline::StageSpec& spec, const TokenPtr& token) const {
  stage::StageContext context;
  context.document     = model::MakeDocumentRef(record.container, record.key);
  context.execution_id = record.execution_id;
  context.attempt      = record.attempt + 1;
  context.deadline     = std::chrono::steady_clock::now() + spec.timeout;

  auto attempt   = std::make_shared<runtime::CancellationToken>(token);
  context.cancel = attempt;

  auto promise = std::make_shared<std::promise<stage::StageResult>>();
  auto future  = promise->get_future();

  try {
    std::thread([executor, payload = record.payload, context, promise] {
      try {
        promise->set_value(executor->Execute(payload, context));
      } catch (const std::exception& e) {
        promise->set_value(stage::ClassifyFailure(e));
      } catch (...) {
        promise->set_value(stage::StageResult::Retry("stage raised a non-standard exception"));
      }
    }).detach();
  } catch (const std::system_error& e) {
    return stage::StageResult::Retry(std::string("cannot start stage thread: ") + e.what());
  }

  if (future.wait_for(spec.timeout) == std::future_status::timeout) {
    attempt->Cancel();
    if (!attempt->Published()) {
      return stage::StageResult::Retry("stage timed out");
    }
    DOCFLOW_LOG_WARN("stage overran its timeout after publishing, waiting for it",
                     {StringField("execution_id", record.execution_id), StringField("stage", spec.name)});
  }
  return future.get();
}

void Orchestrator::MarkCancelled(db::model::ExecutionRecord& record) {
  record.last_error = kCancelledReason;
  record.attempt    = 0;
  Checkpoint(record, docflow::v1::EXECUTION_STATUS_PENDING);
  DOCFLOW_LOG_INFO("execution cancelled", {StringField("execution_id", record.execution_id), IntField("stage_index", record.current_stage_index)});
}

void Orchestrator::Checkpoint(db::model::ExecutionRecord& record, ExecutionStatus next) {
  if (!model::CanTransition(record.status, next)) {
    throw util::InvalidState(std::string("invalid execution transition ") + model::StatusName(record.status) + " -> " + model::StatusName(next));
  }
  record.status        = next;
  record.updated_at_ms = util::NowMs();
  WithStoreRetry(options_, record.execution_id, "checkpoint", [&] { store_->Save(record); });
}

std::size_t Orchestrator::ResumeIncomplete() {
  std::size_t scheduled = 0;
  for (const auto& record : store_->List()) {
    if (model::IsTerminal(record.status) || record.last_error == kCancelledReason) {
      continue;
    }
    Schedule(record.execution_id);
    ++scheduled;
  }
  DOCFLOW_LOG_INFO("incomplete executions resumed", {IntField("count", static_cast<int64_t>(scheduled))});
  return scheduled;
}

// ------------------------------------------------------------------
// Operator actions
// ------------------------------------------------------------------

ReplayResult Orchestrator::Replay(const docflow::v1::DocumentRef& document, uint32_t from_stage_index) {
  model::ValidateDocumentRef(document);
  if (from_stage_index > pipeline_->Size()) {
    throw util::InvalidArgument("replay stage index " + std::to_string(from_stage_index) + " out of range (pipeline has " +
                                std::to_string(pipeline_->Size()) + " stages)");
  }

  auto       record       = LoadFor(document);
  const auto execution_id = record.execution_id;
  if (!model::IsTerminal(record.status)) {
    throw util::InvalidState("execution " + execution_id + " is " + model::StatusName(record.status) + ", only terminal executions can be replayed");
  }

  db::model::AuditEventRecord event;
  event.execution_id         = execution_id;
  event.kind                 = "replay";
  event.from_stage_index     = from_stage_index;
  event.previous_status      = record.status;
  event.previous_stage_index = record.current_stage_index;
  event.previous_error       = record.last_error;
  event.created_at_ms        = util::NowMs();

  record.status              = docflow::v1::EXECUTION_STATUS_PENDING;
  record.current_stage_index = from_stage_index;
  record.attempt             = 0;
  record.last_error.clear();
  record.updated_at_ms = event.created_at_ms;

  const auto sequence = store_->Reopen(record, event);
  {
    std::lock_guard lock(mutex_);
    withdrawn_.erase(execution_id);
  }
  DOCFLOW_LOG_INFO("execution reopened for replay", {StringField("execution_id", execution_id), IntField("from_stage_index", from_stage_index),
                                                     IntField("audit_sequence", static_cast<int64_t>(sequence))});
  Schedule(execution_id);
  return {execution_id, sequence};
}

ReplayResult Orchestrator::Replay(const docflow::v1::DocumentRef& document, const std::string& from_stage_name) {
  const auto index = pipeline_->IndexOf(from_stage_name);
  if (!index) {
    throw util::InvalidArgument("unknown stage: " + from_stage_name);
  }
  return Replay(document, static_cast<uint32_t>(*index));
}

bool Orchestrator::Cancel(const docflow::v1::DocumentRef& document) {
  auto       record       = LoadFor(document);
  const auto execution_id = record.execution_id;

  if (model::IsTerminal(record.status)) {
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    auto it = running_.find(execution_id);
    if (it != running_.end()) {
      it->second->Cancel();
      DOCFLOW_LOG_INFO("cancellation requested", {StringField("execution_id", execution_id)});
      return true;
    }
    if (record.status == docflow::v1::EXECUTION_STATUS_RUNNING) {
      // Driven by another process or left over from a crash.
      DOCFLOW_LOG_WARN("execution is not running in this process", {StringField("execution_id", execution_id)});
      return false;
    }
    withdrawn_.insert(execution_id);
  }

  record.last_error    = kCancelledReason;
  record.updated_at_ms = util::NowMs();
  try {
    store_->Save(record);
  } catch (const util::InvalidState& e) {
    {
      std::lock_guard lock(mutex_);
      withdrawn_.erase(execution_id);
    }
    DOCFLOW_LOG_INFO("execution finished before it could be withdrawn", {StringField("execution_id", execution_id), StringField("error", e.what())});
    return false;
  } catch (...) {
    std::lock_guard lock(mutex_);
    withdrawn_.erase(execution_id);
    throw;
  }
  DOCFLOW_LOG_INFO("pending execution withdrawn", {StringField("execution_id", execution_id)});
  return true;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

docflow::v1::ExecutionStatusView Orchestrator::ToView(const db::model::ExecutionRecord& record) const {
  docflow::v1::ExecutionStatusView view;
  view.set_execution_id(record.execution_id);
  *view.mutable_document() = model::MakeDocumentRef(record.container, record.key);
  view.set_status(record.status);
  if (record.current_stage_index < pipeline_->Size()) {
    view.set_current_stage(pipeline_->At(record.current_stage_index).name);
  }
  view.set_current_stage_index(record.current_stage_index);
  view.set_attempt(record.attempt);
  view.set_last_error(record.last_error);
  view.set_created_at_ms(record.created_at_ms);
  view.set_updated_at_ms(record.updated_at_ms);
  return view;
}

docflow::v1::ExecutionStatusView Orchestrator::GetExecutionStatus(const docflow::v1::DocumentRef& document) {
  return ToView(LoadFor(document));
}

std::vector<docflow::v1::ExecutionStatusView> Orchestrator::ListExecutions() {
  std::vector<docflow::v1::ExecutionStatusView> views;
  for (const auto& record : store_->List()) {
    views.push_back(ToView(record));
  }
  return views;
}

std::vector<db::model::AuditEventRecord> Orchestrator::AuditTrail(const docflow::v1::DocumentRef& document) {
  return store_->AuditTrail(LoadFor(document).execution_id);
}

} // namespace docflow::orchestrator
