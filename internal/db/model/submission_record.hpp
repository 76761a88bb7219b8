#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"

namespace bounty::db::model {

struct SubmissionRecord {
  std::string id;
  std::string request_id;
  std::string contributor_id;

  bounty::ledger::v1::SubmissionStatus status = bounty::ledger::v1::SUBMISSION_STATUS_SUBMITTED;

  // Clock reading used for speed-bonus eligibility.
  int64_t submitted_at_ms = 0;

  std::string reviewed_by;
  int64_t     reviewed_at_ms = 0;
  std::string review_feedback;

  // Set only on acceptance.
  int64_t     earned_amount_cents = 0;
  int64_t     bonus_amount_cents  = 0;
  std::string earning_id;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

struct SubmissionImageRecord {
  std::string id;
  std::string submission_id;
  std::string file_path;
  int64_t     created_at_ms = 0;
};

struct SubmissionFilter {
  std::optional<std::string>                          request_id;
  std::optional<bounty::ledger::v1::SubmissionStatus> status;
  std::size_t                                         limit = 0; // 0 = unbounded
};

// UPDATE bounty_submissions SET ... WHERE id=? AND status IN (from...)
struct SubmissionReview {
  std::string                                       id;
  std::vector<bounty::ledger::v1::SubmissionStatus> from;
  bounty::ledger::v1::SubmissionStatus              to = bounty::ledger::v1::SUBMISSION_STATUS_UNSPECIFIED;

  std::string reviewed_by;
  int64_t     reviewed_at_ms = 0;
  std::string review_feedback;

  int64_t     earned_amount_cents = 0;
  int64_t     bonus_amount_cents  = 0;
  std::string earning_id;

  int64_t updated_at_ms = 0;
};

}
