#pragma once

#include <cstdint>
#include <string>

namespace bounty::util {

// 1234 -> "$12.34", -5 -> "-$0.05"
std::string FormatUsd(int64_t cents);

// a + b, throws InvalidArgument on int64 overflow.
int64_t CheckedAdd(int64_t a, int64_t b);
int64_t CheckedMul(int64_t a, int64_t b);

} // namespace bounty::util
