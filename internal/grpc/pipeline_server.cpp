#include "pipeline_server.hpp"

#include "grpc_error.hpp"

namespace docflow::grpc {

using namespace docflow::v1;

PipelineServer::PipelineServer(std::shared_ptr<docflow::service::PipelineService> svc) : service_(std::move(svc)) {
}

::grpc::Status PipelineServer::Start(::grpc::ServerContext*, const StartRequest* req, StartResponse* resp) {
  try {
    *resp = service_->Start(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::GetExecutionStatus(::grpc::ServerContext*, const GetExecutionStatusRequest* req, GetExecutionStatusResponse* resp) {
  try {
    *resp = service_->GetExecutionStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::Replay(::grpc::ServerContext*, const ReplayRequest* req, ReplayResponse* resp) {
  try {
    *resp = service_->Replay(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::ListExecutions(::grpc::ServerContext*, const ListExecutionsRequest* req, ListExecutionsResponse* resp) {
  try {
    *resp = service_->ListExecutions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace docflow::grpc
