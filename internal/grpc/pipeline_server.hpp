#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "docflow/v1/pipeline_service.grpc.pb.h"
#include "internal/service/pipeline_service.hpp"

namespace docflow::grpc {

class PipelineServer final : public docflow::v1::PipelineService::Service {
public:
  explicit PipelineServer(std::shared_ptr<docflow::service::PipelineService> svc);

  ::grpc::Status Start(::grpc::ServerContext*,
                       const docflow::v1::StartRequest*,
                       docflow::v1::StartResponse*) override;

  ::grpc::Status GetExecutionStatus(::grpc::ServerContext*,
                                    const docflow::v1::GetExecutionStatusRequest*,
                                    docflow::v1::GetExecutionStatusResponse*) override;

  ::grpc::Status Replay(::grpc::ServerContext*,
                        const docflow::v1::ReplayRequest*,
                        docflow::v1::ReplayResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*,
                        const docflow::v1::CancelRequest*,
                        docflow::v1::CancelResponse*) override;

  ::grpc::Status ListExecutions(::grpc::ServerContext*,
                                const docflow::v1::ListExecutionsRequest*,
                                docflow::v1::ListExecutionsResponse*) override;

private:
  std::shared_ptr<docflow::service::PipelineService> service_;
};

}
