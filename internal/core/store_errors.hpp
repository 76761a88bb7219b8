#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace bounty::core {

/*
  Repository Result -> exception.

    NotFound                      -> util::NotFound
    Conflict / AlreadyExists      -> util::ConcurrentModification
    Busy / IOError / Serialization -> util::StoreUnavailable
    anything else                 -> std::runtime_error
*/
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace bounty::core
