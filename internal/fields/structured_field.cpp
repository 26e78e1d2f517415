#include "structured_field.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace flowlock::fields {

namespace {

int Depth(const google::protobuf::Value& value);

int Depth(const google::protobuf::Struct& value) {
  int deepest = 0;
  for (const auto& [_, child] : value.fields()) {
    deepest = std::max(deepest, Depth(child));
  }
  return deepest + 1;
}

int Depth(const google::protobuf::Value& value) {
  if (value.has_struct_value()) {
    return Depth(value.struct_value());
  }
  if (value.has_list_value()) {
    int deepest = 0;
    for (const auto& item : value.list_value().values()) {
      deepest = std::max(deepest, Depth(item));
    }
    return deepest + 1;
  }
  return 0;
}

void CheckKeys(const google::protobuf::Struct& value) {
  for (const auto& [key, child] : value.fields()) {
    if (key.empty()) {
      throw util::ValidationError("structured field keys must not be empty");
    }
    if (child.has_struct_value()) {
      CheckKeys(child.struct_value());
    }
  }
}

} // namespace

FieldName ParseFieldName(std::string_view name) {
  if (name == "other_info") return FieldName::kOtherInfo;
  if (name == "history") return FieldName::kHistory;
  throw util::ValidationError("unknown structured field '" + std::string(name) + "'");
}

std::string_view FieldNameString(FieldName field) {
  return db::model::ColumnName(field);
}

google::protobuf::Struct ParseField(const std::string& json) {
  google::protobuf::Struct value;
  if (json.empty()) {
    return value;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &value, options);
  if (!status.ok()) {
    throw util::InternalError("stored structured field is not a JSON object: " + std::string(status.message()));
  }
  return value;
}

std::string SerializeField(const google::protobuf::Struct& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::InternalError("failed to serialize structured field: " + std::string(status.message()));
  }
  return json;
}

void DeepMerge(google::protobuf::Struct& target, const google::protobuf::Struct& updates) {
  auto* fields = target.mutable_fields();
  for (const auto& [key, value] : updates.fields()) {
    if (value.kind_case() == google::protobuf::Value::kNullValue) {
      fields->erase(key);
      continue;
    }

    auto existing = fields->find(key);
    if (value.has_struct_value() && existing != fields->end() && existing->second.has_struct_value()) {
      DeepMerge(*existing->second.mutable_struct_value(), value.struct_value());
      continue;
    }
    (*fields)[key] = value;
  }
}

void AppendBounded(google::protobuf::Struct& target, const std::string& array_key, const google::protobuf::Value& item,
                   std::size_t max_length) {
  if (array_key.empty()) {
    throw util::ValidationError("array key must not be empty");
  }

  auto& slot = (*target.mutable_fields())[array_key];
  if (slot.kind_case() == google::protobuf::Value::KIND_NOT_SET || slot.kind_case() == google::protobuf::Value::kNullValue) {
    slot.mutable_list_value();
  } else if (!slot.has_list_value()) {
    throw util::ValidationError("'" + array_key + "' is not a list");
  }

  auto* values = slot.mutable_list_value()->mutable_values();
  *values->Add() = item;

  if (max_length > 0 && static_cast<std::size_t>(values->size()) > max_length) {
    const int drop = values->size() - static_cast<int>(max_length);
    values->DeleteSubrange(0, drop);
  }
}

void ValidateUpdates(const google::protobuf::Struct& updates) {
  if (updates.fields().empty()) {
    throw util::ValidationError("update map must not be empty");
  }
  CheckKeys(updates);
  if (Depth(updates) > kMaxNestingDepth) {
    throw util::ValidationError("update nesting exceeds " + std::to_string(kMaxNestingDepth) + " levels");
  }
}

const std::string& FieldJson(const db::model::ResourceRecord& record, FieldName field) {
  return field == FieldName::kHistory ? record.history : record.other_info;
}

} // namespace flowlock::fields
