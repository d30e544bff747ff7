#include "pipeline_service.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/util/errors.hpp"

namespace docflow::service {

using namespace docflow::v1;

namespace {

void RequireDocument(bool has_document) {
  if (!has_document) {
    throw util::InvalidArgument("document is required");
  }
}

void LogFailure(const char* route, const std::exception& ex) {
  DOCFLOW_LOG_ERROR("RPC failed", {docflow::observability::StringField("route", route), docflow::observability::StringField("error", ex.what())});
}

} // namespace

PipelineService::PipelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.orchestrator) {
    throw std::invalid_argument("PipelineService requires an orchestrator");
  }
}

StartResponse PipelineService::Start(const StartRequest& req) {
  try {
    RequireDocument(req.has_document());
    const auto result = ctx_.orchestrator->Start(req.document());

    StartResponse resp;
    resp.set_execution_id(result.execution_id);
    resp.set_status(result.status);
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("PipelineService.Start", ex);
    throw;
  }
}

GetExecutionStatusResponse PipelineService::GetExecutionStatus(const GetExecutionStatusRequest& req) {
  RequireDocument(req.has_document());

  GetExecutionStatusResponse resp;
  *resp.mutable_execution() = ctx_.orchestrator->GetExecutionStatus(req.document());
  return resp;
}

ReplayResponse PipelineService::Replay(const ReplayRequest& req) {
  try {
    RequireDocument(req.has_document());

    orchestrator::ReplayResult result;
    switch (req.from_case()) {
      case ReplayRequest::kFromStageName:
        result = ctx_.orchestrator->Replay(req.document(), req.from_stage_name());
        break;
      case ReplayRequest::kFromStageIndex:
        result = ctx_.orchestrator->Replay(req.document(), req.from_stage_index());
        break;
      case ReplayRequest::FROM_NOT_SET:
        result = ctx_.orchestrator->Replay(req.document(), 0u);
        break;
    }

    ReplayResponse resp;
    resp.set_execution_id(result.execution_id);
    resp.set_audit_sequence(result.audit_sequence);
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("PipelineService.Replay", ex);
    throw;
  }
}

CancelResponse PipelineService::Cancel(const CancelRequest& req) {
  try {
    RequireDocument(req.has_document());

    CancelResponse resp;
    resp.set_cancelled(ctx_.orchestrator->Cancel(req.document()));
    return resp;
  } catch (const std::exception& ex) {
    LogFailure("PipelineService.Cancel", ex);
    throw;
  }
}

ListExecutionsResponse PipelineService::ListExecutions(const ListExecutionsRequest&) {
  ListExecutionsResponse resp;
  for (auto& view : ctx_.orchestrator->ListExecutions()) {
    *resp.add_executions() = std::move(view);
  }
  return resp;
}

} // namespace docflow::service
