#pragma once

#include <cstdint>
#include <string>

namespace bounty::db::model {

// Contributor-visible activity feed entry.
struct ActivityRecord {
  uint64_t    id = 0; // assigned on insert
  std::string contributor_id;
  std::string action;
  std::string description;
  std::string metadata_json;
  int64_t     created_at_ms = 0;
};

} // namespace bounty::db::model
