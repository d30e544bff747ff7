#include "stage_payload.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace docflow::model {

StagePayload SeedPayload(const docflow::v1::DocumentRef& ref) {
  StagePayload payload;
  (*payload.mutable_fields())["bucket"].set_string_value(ref.container());
  (*payload.mutable_fields())["key"].set_string_value(ref.key());
  return payload;
}

namespace {

void CheckAdditive(const StagePayload& target, const StagePayload& update, const std::string& prefix) {
  for (const auto& [key, value] : update.fields()) {
    auto existing = target.fields().find(key);
    if (existing == target.fields().end()) {
      continue;
    }

    const auto path = prefix + key;
    if (existing->second.has_struct_value()) {
      if (!value.has_struct_value()) {
        throw util::InvalidArgument("payload key '" + path + "' is a struct and cannot be replaced by a non-struct value");
      }
      CheckAdditive(existing->second.struct_value(), value.struct_value(), path + ".");
      continue;
    }
    if (value.kind_case() == google::protobuf::Value::kNullValue && existing->second.kind_case() != google::protobuf::Value::kNullValue) {
      throw util::InvalidArgument("payload key '" + path + "' cannot be cleared");
    }
  }
}

void MergeChecked(StagePayload& target, const StagePayload& update) {
  auto* fields = target.mutable_fields();
  for (const auto& [key, value] : update.fields()) {
    auto existing = fields->find(key);
    if (existing != fields->end() && existing->second.has_struct_value()) {
      MergeChecked(*existing->second.mutable_struct_value(), value.struct_value());
      continue;
    }
    (*fields)[key] = value;
  }
}

} // namespace

void MergeAdditive(StagePayload& target, const StagePayload& update) {
  CheckAdditive(target, update, "");
  MergeChecked(target, update);
}

bool HasKey(const StagePayload& payload, const std::string& key) {
  return payload.fields().count(key) > 0;
}

std::string GetString(const StagePayload& payload, const std::string& key) {
  auto it = payload.fields().find(key);
  if (it == payload.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

std::string ToJson(const StagePayload& payload, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("payload to JSON failed: " + std::string(status.message()));
  }
  return json;
}

StagePayload FromJson(const std::string& json) {
  StagePayload payload;
  if (json.empty()) {
    return payload;
  }

  auto status = google::protobuf::util::JsonStringToMessage(json, &payload);
  if (!status.ok()) {
    throw std::runtime_error("payload from JSON failed: " + std::string(status.message()));
  }
  return payload;
}

} // namespace docflow::model
