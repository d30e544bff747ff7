#pragma once

// Message types of the docflow v1 API. The gRPC stubs live in
// "docflow/v1/pipeline_service.grpc.pb.h" and are only built with DOCFLOW_ENABLE_GRPC.

#include "docflow/v1/types.pb.h"
#include "docflow/v1/pipeline_service.pb.h"
