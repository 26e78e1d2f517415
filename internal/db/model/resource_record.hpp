#pragma once

#include <cstdint>
#include <string>

namespace flowlock::db::model {

// Map-valued columns of workflow_resource.
enum class StructuredField {
  kOtherInfo,
  kHistory,
};

inline const char* ColumnName(StructuredField field) {
  return field == StructuredField::kHistory ? "history" : "other_info";
}

/*
  Persistent workflow resource row (table workflow_resource).

  IMPORTANT:
  - version starts at 0 and advances by exactly one per committed write.
  - other_info / history hold JSON object text; they are only rewritten
    through UpdateField or a full versioned UpdateResource.
  - parent_id == 0 means the resource has no parent.
*/

struct ResourceRecord {
  int64_t     id = 0;
  std::string kind;
  std::string state;

  uint64_t version = 0;

  int64_t     parent_id = 0;
  int64_t     level     = 0;
  std::string assignee;

  // wall-clock millis, 0 = unset
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t updated_at_ms   = 0;

  std::string other_info = "{}";
  std::string history    = "{}";
};

} // namespace flowlock::db::model
