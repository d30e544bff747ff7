#pragma once

#include "docflow/v1/pipeline_service.pb.h"
#include "service_context.hpp"

namespace docflow::service {

/*
  Transport-independent PipelineService: validates requests, calls the
  orchestrator and builds responses. Errors are thrown as util:: exceptions
  for the transport to translate.
*/
class PipelineService {
public:
  explicit PipelineService(ServiceContext ctx);

  docflow::v1::StartResponse Start(const docflow::v1::StartRequest& req);

  docflow::v1::GetExecutionStatusResponse GetExecutionStatus(const docflow::v1::GetExecutionStatusRequest& req);

  docflow::v1::ReplayResponse Replay(const docflow::v1::ReplayRequest& req);

  docflow::v1::CancelResponse Cancel(const docflow::v1::CancelRequest& req);

  docflow::v1::ListExecutionsResponse ListExecutions(const docflow::v1::ListExecutionsRequest& req);

private:
  ServiceContext ctx_;
};

}
