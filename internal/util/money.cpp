#include "money.hpp"

#include <cstdio>
#include <limits>

#include "errors.hpp"

namespace bounty::util {

std::string FormatUsd(int64_t cents) {
  const bool     negative  = cents < 0;
  const uint64_t magnitude = negative ? static_cast<uint64_t>(-(cents + 1)) + 1 : static_cast<uint64_t>(cents);

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s$%llu.%02llu", negative ? "-" : "", static_cast<unsigned long long>(magnitude / 100),
                static_cast<unsigned long long>(magnitude % 100));
  return buf;
}

int64_t CheckedAdd(int64_t a, int64_t b) {
  int64_t out = 0;
  if (__builtin_add_overflow(a, b, &out)) {
    throw InvalidArgument("amount overflow: " + std::to_string(a) + " + " + std::to_string(b));
  }
  return out;
}

int64_t CheckedMul(int64_t a, int64_t b) {
  int64_t out = 0;
  if (__builtin_mul_overflow(a, b, &out)) {
    throw InvalidArgument("amount overflow: " + std::to_string(a) + " * " + std::to_string(b));
  }
  return out;
}

} // namespace bounty::util
