#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"
#include "internal/auth/role_policy.hpp"
#include "internal/db/api/repository.hpp"

namespace bounty::core {

struct NewRequest {
  std::string title;
  std::string description;

  bounty::ledger::v1::PayType pay_type            = bounty::ledger::v1::PAY_TYPE_FLAT;
  int64_t                     pay_amount_cents    = 0;
  int64_t                     speed_bonus_cents   = 0;
  std::optional<int64_t>      speed_bonus_deadline_ms;
  int64_t                     quality_bonus_cents = 0;

  int64_t budget_total_cents = 0;
  int64_t quantity_needed    = 0;

  // DRAFT or PUBLISHED; UNSPECIFIED means DRAFT.
  bounty::ledger::v1::RequestStatus initial_status = bounty::ledger::v1::REQUEST_STATUS_DRAFT;
};

/*
  Bounty request lifecycle.

  Every transition is a single conditional update whose WHERE clause
  carries the allowed source statuses, so two admins racing on the same
  request cannot both win.
*/
class RequestManager {
 public:
  RequestManager(std::shared_ptr<db::Repository> repository, auth::HasRoleFn has_role);

  db::model::RequestRecord Create(const NewRequest& request, const std::string& actor);

  db::model::RequestRecord Transition(const std::string& request_id, bounty::ledger::v1::RequestAction action, const std::string& actor);

  db::model::RequestRecord Publish(const std::string& request_id, const std::string& actor);
  db::model::RequestRecord Pause(const std::string& request_id, const std::string& actor);
  db::model::RequestRecord Unpause(const std::string& request_id, const std::string& actor);
  db::model::RequestRecord Close(const std::string& request_id, const std::string& actor);
  db::model::RequestRecord Cancel(const std::string& request_id, const std::string& actor);

  db::model::RequestRecord              Get(const std::string& request_id, const std::string& actor);
  std::vector<db::model::RequestRecord> List(std::optional<bounty::ledger::v1::RequestStatus> status, const std::string& actor);

 private:
  std::shared_ptr<db::Repository> repository_;
  auth::HasRoleFn                 has_role_;
};

// Field checks applied by Create(); throws util::InvalidArgument.
void ValidateNewRequest(const NewRequest& request);

// Code points, not bytes.
std::size_t Utf8Length(const std::string& text);

} // namespace bounty::core
