#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace bounty::util {

/*
  UUID helpers

  Row ids are RFC4122 v4 UUIDs stored in canonical 36-char text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Fresh id in canonical text form.
std::string NewId();

// 8-4-4-4-12 hex, case-insensitive.
bool IsCanonicalUuid(const std::string& str);

} // namespace bounty::util
