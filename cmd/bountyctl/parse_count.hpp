#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace bounty::cli {

// Decimal digits only; at most 19 so the value always fits before the bound check.
inline std::optional<uint64_t> ParseCount(const std::string& value, uint64_t max = UINT64_MAX) {
  if (value.empty() || value.size() > 19) return std::nullopt;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  const uint64_t n = std::stoull(value);
  if (n > max) return std::nullopt;
  return n;
}

} // namespace bounty::cli
