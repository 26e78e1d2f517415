#include "row_lock.hpp"

#include "internal/util/errors.hpp"

namespace flowlock::concurrency {

namespace {

util::ErrorKind KindFor(db::ErrorCode code) {
  switch (code) {
    case db::ErrorCode::Busy:
      return util::ErrorKind::kLockAcquisition;
    case db::ErrorCode::SerializationFailure:
      return util::ErrorKind::kSerializationConflict;
    case db::ErrorCode::Conflict:
      return util::ErrorKind::kStaleObject;
    case db::ErrorCode::NotFound:
      return util::ErrorKind::kNotFound;
    case db::ErrorCode::IOError:
      return util::ErrorKind::kTransientConnection;
    case db::ErrorCode::OK:
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::Corruption:
    case db::ErrorCode::Unsupported:
    case db::ErrorCode::InternalError:
      return util::ErrorKind::kInternal;
  }
  return util::ErrorKind::kInternal;
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::ValidationError(context + ": already exists");
  }
  util::Throw(KindFor(result.code), context + ": " + result.message);
}

void ThrowDbException(const db::DbException& e, const std::string& context) {
  util::Throw(KindFor(e.code()), context + ": " + e.what());
}

db::model::ResourceRecord LockForUpdate(db::Repository& repo, db::Transaction& tx, int64_t resource_id) {
  db::model::ResourceRecord record;
  ThrowIfDbError(repo.LockForUpdate(tx, resource_id, &record), "lock resource " + std::to_string(resource_id));
  return record;
}

bool CheckVersion(db::Repository& repo, db::Transaction& tx, int64_t resource_id, uint64_t expected) {
  auto current = repo.GetResource(tx, resource_id);
  if (!current) {
    throw util::NotFoundError("resource " + std::to_string(resource_id) + " not found");
  }
  return current->version == expected;
}

db::model::ResourceRecord WriteVersioned(db::Repository& repo, db::Transaction& tx, const db::model::ResourceRecord& record,
                                         uint64_t expected_version) {
  ThrowIfDbError(repo.UpdateResource(tx, record, expected_version), "write resource " + std::to_string(record.id));
  auto stored    = record;
  stored.version = expected_version + 1;
  return stored;
}

} // namespace flowlock::concurrency
