#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace netmap::db {

/*
  Maps a failed Result onto the util exception types:

    Busy                 -> StoreTransactionError (retried)
    ConstraintViolation  -> InvalidArgument
    everything else      -> StoreCorruptionError (fatal)

  Messages read "<context>: <code>: <backend message>".
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace netmap::db
