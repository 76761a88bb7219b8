#pragma once

#include <string_view>
#include <vector>

#include "bounty/ledger/v1.hpp"

namespace bounty::model {

using bounty::ledger::v1::EarningStatus;
using bounty::ledger::v1::ReviewAction;
using bounty::ledger::v1::SubmissionStatus;

// submitted / in_review: a reviewer has not decided yet.
constexpr bool IsAwaitingReview(SubmissionStatus status) {
  return status == bounty::ledger::v1::SUBMISSION_STATUS_SUBMITTED || status == bounty::ledger::v1::SUBMISSION_STATUS_IN_REVIEW;
}

const std::vector<SubmissionStatus>& AwaitingReviewStatuses();

// accept -> accepted, reject -> rejected, revision -> revision_requested.
SubmissionStatus OutcomeStatus(ReviewAction action);

/*
  Earning payout workflow.

    pending    -> processing | held
    processing -> paid | held | pending
    held       -> pending
    paid       -> (terminal)
*/

// Statuses an earning may move to `to` from; empty when `to` is unreachable.
const std::vector<EarningStatus>& EarningSourcesFor(EarningStatus to);

bool CanMoveEarning(EarningStatus from, EarningStatus to);

std::string_view ToString(SubmissionStatus status);
std::string_view ToString(ReviewAction action);
std::string_view ToString(EarningStatus status);

} // namespace bounty::model
