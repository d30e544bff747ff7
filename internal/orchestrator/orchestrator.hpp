#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "docflow/v1/types.pb.h"
#include "internal/db/model/audit_event_record.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/pipeline/pipeline_definition.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/stage/stage_registry.hpp"
#include "internal/store/execution_store.hpp"

namespace docflow::orchestrator {

// last_error of an execution stopped by Cancel().
inline constexpr const char* kCancelledReason = "cancelled";

struct OrchestratorOptions {
  // Attempts per checkpoint write while the store reports itself unavailable.
  uint32_t store_retry_attempts = 5;

  // First delay between store retries; doubles per retry.
  std::chrono::milliseconds store_retry_backoff{200};
};

struct StartResult {
  std::string                  execution_id;
  docflow::v1::ExecutionStatus status = docflow::v1::EXECUTION_STATUS_UNSPECIFIED;

  // False when Start found an existing execution.
  bool created = false;
};

struct ReplayResult {
  std::string execution_id;
  uint64_t    audit_sequence = 0;
};

/*
  Orchestrator

  Drives executions through the pipeline:

      Start(ref) ──► record PENDING ──► schedule ──► Run(id)
                                                      │
                          lease + claim (RUNNING) ◄───┘
                                   │
                for each stage from current_stage_index:
                    execute (timeout) ─► retry / backoff
                    merge payload, advance, checkpoint
                                   │
                         SUCCEEDED | FAILED | PENDING (cancelled)

  Scheduling is delegated to the callback given at construction (normally
  ExecutionScheduler::Enqueue). Without one, callers drive Run() themselves.

  Concurrency:
    - at most one Run() per execution in this process (LeaseManager); the
      lease is renewed before every stage attempt and must outlast the
      longest stage timeout
    - across processes the store's version check fences stale writers; a
      writer that loses stops without writing again
    - an attempt that overruns its timeout is abandoned and its
      cancellation token fences whatever it would still publish
*/
class Orchestrator {
 public:
  using ScheduleCallback = std::function<void(const std::string& execution_id)>;

  Orchestrator(std::shared_ptr<store::ExecutionStore> store, std::shared_ptr<const pipeline::PipelineDefinition> pipeline,
               std::shared_ptr<const stage::StageRegistry> registry, std::shared_ptr<lease::LeaseManager> leases,
               OrchestratorOptions options = {});

  void SetScheduleCallback(ScheduleCallback schedule);

  // ------------------------------------------------------------------
  // Trigger
  // ------------------------------------------------------------------
  /*
    Idempotent. Existing RUNNING or terminal executions are returned as they
    are; an existing PENDING one is (re)scheduled; otherwise a PENDING
    record is created and scheduled. Concurrent calls for one document
    create exactly one record.

    Throws util::AlreadyExists when the document's execution id is already
    taken by a different document.
  */
  StartResult Start(const docflow::v1::DocumentRef& document);

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  /*
    Runs an execution from its persisted stage to a terminal state (or to a
    cancelled PENDING). Returns silently when the lease is held elsewhere,
    the record is terminal, or ownership is lost mid-run. Store outages that
    outlast the retry budget propagate as util::StoreUnavailable with the
    record left at its last checkpoint.
  */
  void Run(const std::string& execution_id);

  // Schedules every non-terminal execution. Returns how many were scheduled.
  std::size_t ResumeIncomplete();

  // ------------------------------------------------------------------
  // Operator actions
  // ------------------------------------------------------------------
  /*
    Re-runs a terminal execution from `from_stage_index` (<= stage count).
    Appends an audit event and reopens the record as PENDING in one store
    transaction, keeping the payload.

    Errors:
      NotFound          no execution for the document
      InvalidState      execution not terminal
      InvalidArgument   stage index / name out of range
  */
  ReplayResult Replay(const docflow::v1::DocumentRef& document, uint32_t from_stage_index = 0);
  ReplayResult Replay(const docflow::v1::DocumentRef& document, const std::string& from_stage_name);

  /*
    Cooperative. A running execution stops at its next checkpoint boundary
    or backoff wait and is left PENDING with last_error "cancelled"; a
    queued one is withdrawn. Start() resumes it. Returns false for terminal
    executions.
  */
  bool Cancel(const docflow::v1::DocumentRef& document);

  // ------------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------------
  docflow::v1::ExecutionStatusView              GetExecutionStatus(const docflow::v1::DocumentRef& document);
  std::vector<docflow::v1::ExecutionStatusView> ListExecutions();
  std::vector<db::model::AuditEventRecord>      AuditTrail(const docflow::v1::DocumentRef& document);

  const pipeline::PipelineDefinition& Pipeline() const {
    return *pipeline_;
  }

 private:
  enum class StepOutcome {
    Continue,
    Stop,
  };

  using TokenPtr = std::shared_ptr<runtime::CancellationToken>;

  void Schedule(const std::string& execution_id);

  // Null when the execution was withdrawn by Cancel() before it started.
  TokenPtr RegisterRun(const std::string& execution_id);
  void     UnregisterRun(const std::string& execution_id);

  // Record stored for `document`. Throws AlreadyExists if its id belongs to another document.
  std::optional<db::model::ExecutionRecord> FindFor(const docflow::v1::DocumentRef& document);

  // Like FindFor() but NotFound when there is no execution for the document.
  db::model::ExecutionRecord LoadFor(const docflow::v1::DocumentRef& document);

  void        RunStages(db::model::ExecutionRecord& record, const lease::Lease& lease, const TokenPtr& token);
  StepOutcome RunStage(db::model::ExecutionRecord& record, const pipeline::StageSpec& spec, const lease::Lease& lease, const TokenPtr& token);

  // Renews the lease, reclaiming it if it lapsed unclaimed. False once another worker holds it.
  bool KeepLease(const db::model::ExecutionRecord& record, const lease::Lease& lease);

  // One attempt under the stage timeout. The call gets its own payload copy
  // and is abandoned (not joined) when it overruns, unless it already
  // published through its token, in which case its result is awaited.
  stage::StageResult Invoke(const std::shared_ptr<stage::StageExecutor>& executor, const db::model::ExecutionRecord& record,
                            const pipeline::StageSpec& spec, const TokenPtr& token) const;

  void MarkCancelled(db::model::ExecutionRecord& record);

  // Transition + save, retrying while the store is unavailable.
  void Checkpoint(db::model::ExecutionRecord& record, docflow::v1::ExecutionStatus next);

  docflow::v1::ExecutionStatusView ToView(const db::model::ExecutionRecord& record) const;

  std::shared_ptr<store::ExecutionStore>              store_;
  std::shared_ptr<const pipeline::PipelineDefinition> pipeline_;
  std::shared_ptr<const stage::StageRegistry>         registry_;
  std::shared_ptr<lease::LeaseManager>                leases_;
  OrchestratorOptions                                 options_;

  std::mutex                                                                   mutex_;
  ScheduleCallback                                                             schedule_;
  std::unordered_map<std::string, std::shared_ptr<runtime::CancellationToken>> running_;
  std::unordered_set<std::string>                                              withdrawn_;
};

} // namespace docflow::orchestrator
