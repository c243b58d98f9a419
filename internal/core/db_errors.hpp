#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace chunkstore::core {

// Translates a failed engine result into the store's exception types.
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageError(message + " (" + db::ErrorCodeName(result.code) + ")");
  }
}

} // namespace chunkstore::core
