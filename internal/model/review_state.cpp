#include "review_state.hpp"

#include <algorithm>

namespace bounty::model {

using namespace bounty::ledger::v1;

const std::vector<SubmissionStatus>& AwaitingReviewStatuses() {
  static const std::vector<SubmissionStatus> kAwaiting = {SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW};
  return kAwaiting;
}

SubmissionStatus OutcomeStatus(ReviewAction action) {
  switch (action) {
    case REVIEW_ACTION_ACCEPT:
      return SUBMISSION_STATUS_ACCEPTED;
    case REVIEW_ACTION_REJECT:
      return SUBMISSION_STATUS_REJECTED;
    case REVIEW_ACTION_REVISION_REQUESTED:
      return SUBMISSION_STATUS_REVISION_REQUESTED;
    default:
      return SUBMISSION_STATUS_UNSPECIFIED;
  }
}

const std::vector<EarningStatus>& EarningSourcesFor(EarningStatus to) {
  static const std::vector<EarningStatus> kToPending    = {EARNING_STATUS_PROCESSING, EARNING_STATUS_HELD};
  static const std::vector<EarningStatus> kToProcessing = {EARNING_STATUS_PENDING};
  static const std::vector<EarningStatus> kToPaid       = {EARNING_STATUS_PROCESSING};
  static const std::vector<EarningStatus> kToHeld       = {EARNING_STATUS_PENDING, EARNING_STATUS_PROCESSING};
  static const std::vector<EarningStatus> kNone;

  switch (to) {
    case EARNING_STATUS_PENDING:
      return kToPending;
    case EARNING_STATUS_PROCESSING:
      return kToProcessing;
    case EARNING_STATUS_PAID:
      return kToPaid;
    case EARNING_STATUS_HELD:
      return kToHeld;
    default:
      return kNone;
  }
}

bool CanMoveEarning(EarningStatus from, EarningStatus to) {
  const auto& sources = EarningSourcesFor(to);
  return std::find(sources.begin(), sources.end(), from) != sources.end();
}

std::string_view ToString(SubmissionStatus status) {
  switch (status) {
    case SUBMISSION_STATUS_SUBMITTED:
      return "submitted";
    case SUBMISSION_STATUS_IN_REVIEW:
      return "in_review";
    case SUBMISSION_STATUS_ACCEPTED:
      return "accepted";
    case SUBMISSION_STATUS_REJECTED:
      return "rejected";
    case SUBMISSION_STATUS_REVISION_REQUESTED:
      return "revision_requested";
    default:
      return "unspecified";
  }
}

std::string_view ToString(ReviewAction action) {
  switch (action) {
    case REVIEW_ACTION_ACCEPT:
      return "accept";
    case REVIEW_ACTION_REJECT:
      return "reject";
    case REVIEW_ACTION_REVISION_REQUESTED:
      return "revision_requested";
    default:
      return "unspecified";
  }
}

std::string_view ToString(EarningStatus status) {
  switch (status) {
    case EARNING_STATUS_PENDING:
      return "pending";
    case EARNING_STATUS_PROCESSING:
      return "processing";
    case EARNING_STATUS_PAID:
      return "paid";
    case EARNING_STATUS_HELD:
      return "held";
    default:
      return "unspecified";
  }
}

} // namespace bounty::model
