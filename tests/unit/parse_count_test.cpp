#include <cassert>
#include <cstdint>
#include <iostream>

#include "cmd/bountyctl/parse_count.hpp"

namespace {

using bounty::cli::ParseCount;

void TestAcceptsDecimalCounts() {
  assert(ParseCount("0") == 0u);
  assert(ParseCount("60000") == 60000u);
  assert(ParseCount("9999999999999999999") == 9999999999999999999ull);
  assert(ParseCount("4294967295", UINT32_MAX) == 4294967295u);
}

void TestRejectsMalformedInput() {
  assert(!ParseCount(""));
  assert(!ParseCount("abc"));
  assert(!ParseCount("10s"));
  assert(!ParseCount("-5"));
  assert(!ParseCount("+5"));
  assert(!ParseCount(" 5"));
  assert(!ParseCount("--repiar"));
  assert(!ParseCount("99999999999999999999"));
  assert(!ParseCount("4294967296", UINT32_MAX));
}

} // namespace

int main() {
  TestAcceptsDecimalCounts();
  TestRejectsMalformedInput();

  std::cout << "bounty_ledger_unit_parse_count: pass\n";
  return 0;
}
