#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace flowlock::concurrency {

/*
  Row locks and versioned writes on top of db::Repository.

  Everything here runs inside an open transaction and reports failures as
  util::WorkflowError subclasses:

    Busy                 -> LockAcquisitionError
    SerializationFailure -> SerializationConflict
    Conflict             -> StaleObjectError
    NotFound             -> NotFoundError
    IOError              -> TransientConnectionError
    anything else        -> InternalError
*/

void ThrowIfDbError(const db::Result& result, const std::string& context);

// Rethrows a DbException as the matching WorkflowError.
[[noreturn]] void ThrowDbException(const db::DbException& e, const std::string& context);

// Exclusive lock on the row, held until the transaction ends.
db::model::ResourceRecord LockForUpdate(db::Repository& repo, db::Transaction& tx, int64_t resource_id);

// True when the row's version still equals expected. Throws NotFoundError for a missing row.
bool CheckVersion(db::Repository& repo, db::Transaction& tx, int64_t resource_id, uint64_t expected);

// Compare-and-set write; returns the record as stored (version = expected + 1).
db::model::ResourceRecord WriteVersioned(db::Repository& repo, db::Transaction& tx, const db::model::ResourceRecord& record,
                                         uint64_t expected_version);

} // namespace flowlock::concurrency
