#pragma once

#include <string>

#include "docflow/v1/types.pb.h"

namespace docflow::util {

/*
  ExecutionID derivation.

  The id is a pure function of the DocumentRef so that duplicate trigger
  events for one document collapse onto one execution. The hash must be
  stable across processes and builds (std::hash is not), hence FNV-1a 64.

      exec-<16 lowercase hex digits>
*/
std::string ExecutionIdFor(const docflow::v1::DocumentRef& ref);

uint64_t Fnv1a64(const std::string& data);

} // namespace docflow::util
