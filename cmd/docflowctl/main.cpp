#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "docflow/v1/pipeline_service.grpc.pb.h"
#include "docflow/v1.hpp"

using namespace docflow::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  docflowctl <addr> start <container> <key>\n"
            << "  docflowctl <addr> status <container> <key>\n"
            << "  docflowctl <addr> replay <container> <key> [stage_index|stage_name]\n"
            << "  docflowctl <addr> cancel <container> <key>\n"
            << "  docflowctl <addr> list\n";
}

static DocumentRef MakeDocument(const char* container, const char* key) {
  DocumentRef document;
  document.set_container(container);
  document.set_key(key);
  return document;
}

static bool IsIndex(const std::string& value) {
  return !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
}

static const char* StatusLabel(ExecutionStatus status) {
  switch (status) {
    case EXECUTION_STATUS_PENDING:
      return "pending";
    case EXECUTION_STATUS_RUNNING:
      return "running";
    case EXECUTION_STATUS_SUCCEEDED:
      return "succeeded";
    case EXECUTION_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

static void Print(const ExecutionStatusView& view) {
  std::cout << view.execution_id() << " " << view.document().container() << "/" << view.document().key() << " status=" << StatusLabel(view.status())
            << " stage=" << (view.current_stage().empty() ? "-" : view.current_stage()) << " index=" << view.current_stage_index()
            << " attempt=" << view.attempt();
  if (!view.last_error().empty()) {
    std::cout << " last_error=\"" << view.last_error() << "\"";
  }
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = PipelineService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    StartRequest req;
    *req.mutable_document() = MakeDocument(argv[3], argv[4]);

    StartResponse resp;
    auto status = stub->Start(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.execution_id() << " status=" << StatusLabel(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    GetExecutionStatusRequest req;
    *req.mutable_document() = MakeDocument(argv[3], argv[4]);

    GetExecutionStatusResponse resp;
    auto status = stub->GetExecutionStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.execution());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "replay") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ReplayRequest req;
    *req.mutable_document() = MakeDocument(argv[3], argv[4]);
    if (argc >= 6) {
      const std::string from = argv[5];
      if (IsIndex(from)) {
        req.set_from_stage_index(static_cast<uint32_t>(std::stoul(from)));
      } else {
        req.set_from_stage_name(from);
      }
    }

    ReplayResponse resp;
    auto status = stub->Replay(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.execution_id() << " replay audit_sequence=" << resp.audit_sequence() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    CancelRequest req;
    *req.mutable_document() = MakeDocument(argv[3], argv[4]);

    CancelResponse resp;
    auto status = stub->Cancel(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.cancelled() ? "cancelled" : "not cancelled (execution already finished or not running here)") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListExecutionsRequest req;
    ListExecutionsResponse resp;
    auto status = stub->ListExecutions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& view : resp.executions()) {
      Print(view);
    }
    return 0;
  }

  Usage();
  return 1;
}
