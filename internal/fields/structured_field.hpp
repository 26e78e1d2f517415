#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/db/model/resource_record.hpp"

namespace flowlock::fields {

using FieldName = db::model::StructuredField;

// "other_info" | "history"; anything else is a ValidationError.
FieldName ParseFieldName(std::string_view name);

std::string_view FieldNameString(FieldName field);

constexpr int kMaxNestingDepth = 32;

/*
  Pure helpers over google::protobuf::Struct.

  These never touch storage; the updater and the workflow services call them
  inside their own critical section.
*/

// JSON object text -> Struct. Empty text is an empty object.
google::protobuf::Struct ParseField(const std::string& json);

std::string SerializeField(const google::protobuf::Struct& value);

// Nested objects merge recursively, a null value removes the key, any other
// value replaces.
void DeepMerge(google::protobuf::Struct& target, const google::protobuf::Struct& updates);

// Appends item to the list at array_key (created when absent) and drops the
// oldest elements while the list is longer than max_length (0 = unbounded).
void AppendBounded(google::protobuf::Struct& target, const std::string& array_key, const google::protobuf::Value& item,
                   std::size_t max_length);

// Rejects empty update maps, empty keys and nesting deeper than kMaxNestingDepth.
void ValidateUpdates(const google::protobuf::Struct& updates);

const std::string& FieldJson(const db::model::ResourceRecord& record, FieldName field);

} // namespace flowlock::fields
