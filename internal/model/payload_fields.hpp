#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace ledger::model {

// Typed reads from an opaque payload. Missing or mistyped keys yield nullopt.

inline const google::protobuf::Value* FindField(const google::protobuf::Struct& payload, std::string_view key) {
  auto it = payload.fields().find(std::string(key));
  return it == payload.fields().end() ? nullptr : &it->second;
}

inline std::optional<std::string> StringField(const google::protobuf::Struct& payload, std::string_view key) {
  const auto* value = FindField(payload, key);
  if (!value || value->kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
  return value->string_value();
}

inline std::optional<double> NumberField(const google::protobuf::Struct& payload, std::string_view key) {
  const auto* value = FindField(payload, key);
  if (!value || value->kind_case() != google::protobuf::Value::kNumberValue) return std::nullopt;
  return value->number_value();
}

inline std::optional<bool> BoolField(const google::protobuf::Struct& payload, std::string_view key) {
  const auto* value = FindField(payload, key);
  if (!value || value->kind_case() != google::protobuf::Value::kBoolValue) return std::nullopt;
  return value->bool_value();
}

// string list; a lone string reads as a one-element list
inline std::vector<std::string> StringListField(const google::protobuf::Struct& payload, std::string_view key) {
  std::vector<std::string> out;
  const auto*              value = FindField(payload, key);
  if (!value) return out;
  if (value->kind_case() == google::protobuf::Value::kStringValue) {
    out.push_back(value->string_value());
    return out;
  }
  if (value->kind_case() != google::protobuf::Value::kListValue) return out;
  for (const auto& item : value->list_value().values()) {
    if (item.kind_case() == google::protobuf::Value::kStringValue) out.push_back(item.string_value());
  }
  return out;
}

} // namespace ledger::model
