#pragma once

#include <cstdint>
#include <string>

namespace flowlock::db::model {

/*
  Append-only audit row (table workflow_audit).

  seq is assigned by the backend on insert and is strictly increasing.
*/

struct AuditRecord {
  uint64_t    seq = 0;
  int64_t     resource_id = 0;
  std::string entity_type;
  std::string operation_type;
  std::string outcome;
  std::string old_value;
  std::string new_value;
  std::string actor;
  uint64_t    lock_wait_ms   = 0;
  uint64_t    tx_duration_ms = 0;
  std::string correlation_id;
  uint64_t    timestamp_ms = 0;
};

} // namespace flowlock::db::model
