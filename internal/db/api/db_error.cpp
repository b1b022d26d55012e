#include "db_error.hpp"

#include "internal/util/errors.hpp"

namespace netmap::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + std::string(ToString(result.code));
  if (!result.message.empty()) message += ": " + result.message;

  if (IsTransient(result.code)) {
    throw util::StoreTransactionError(message);
  }
  if (result.code == ErrorCode::ConstraintViolation) {
    throw util::InvalidArgument(message);
  }
  throw util::StoreCorruptionError(message);
}

} // namespace netmap::db
