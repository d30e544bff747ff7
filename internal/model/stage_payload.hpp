#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "docflow/v1/types.pb.h"

namespace docflow::model {

/*
  StagePayload

  The accumulated state of one execution: an open string-keyed document
  (google.protobuf.Struct) that every stage reads and extends.

  Additive-only: MergeAdditive() sets every key of `update` into `target`
  and recurses into nested structs. Keys missing from `update` are kept, so
  a stage has no way to remove what an earlier stage wrote.
*/
using StagePayload = google::protobuf::Struct;

// Initial payload of a new execution: {"bucket": container, "key": key}.
StagePayload SeedPayload(const docflow::v1::DocumentRef& ref);

/*
  Throws util::InvalidArgument, leaving `target` untouched, when `update`
  would drop existing content: a struct replaced by a non-struct, or a
  value replaced by null.
*/
void MergeAdditive(StagePayload& target, const StagePayload& update);

bool HasKey(const StagePayload& payload, const std::string& key);

// Empty string when the key is missing or not a string.
std::string GetString(const StagePayload& payload, const std::string& key);

std::string ToJson(const StagePayload& payload, bool pretty = false);
StagePayload FromJson(const std::string& json);

} // namespace docflow::model
