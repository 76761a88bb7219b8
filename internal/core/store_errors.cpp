#include "store_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace bounty::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::AlreadyExists:
      throw util::ConcurrentModification(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::SerializationFailure:
      throw util::StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace bounty::core
