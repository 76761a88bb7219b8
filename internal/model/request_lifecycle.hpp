#pragma once

#include <string_view>
#include <vector>

#include "bounty/ledger/v1.hpp"

namespace bounty::model {

using bounty::ledger::v1::RequestAction;
using bounty::ledger::v1::RequestStatus;

/*
  Request lifecycle.

    publish : draft, pending_review           -> published
    pause   : published                       -> paused
    unpause : paused                          -> published
    close   : published, paused               -> closed
    cancel  : draft, pending_review,
              published, paused               -> cancelled

  fulfilled is only entered by the review engine's counter swap.
*/

const std::vector<RequestStatus>& AllowedSources(RequestAction action);

// REQUEST_STATUS_UNSPECIFIED for an unknown action.
RequestStatus TargetStatus(RequestAction action);

bool CanApply(RequestAction action, RequestStatus from);

// Submissions may be reviewed while the request is in one of these.
constexpr bool IsReviewable(RequestStatus status) {
  return status == bounty::ledger::v1::REQUEST_STATUS_PUBLISHED || status == bounty::ledger::v1::REQUEST_STATUS_PAUSED ||
         status == bounty::ledger::v1::REQUEST_STATUS_FULFILLED;
}

constexpr bool IsTerminal(RequestStatus status) {
  return status == bounty::ledger::v1::REQUEST_STATUS_CLOSED || status == bounty::ledger::v1::REQUEST_STATUS_CANCELLED;
}

std::string_view ToString(RequestStatus status);
std::string_view ToString(RequestAction action);

} // namespace bounty::model
