#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/activity_record.hpp"
#include "internal/db/model/earning_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/submission_record.hpp"

namespace bounty::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All calls require a Transaction
  - Reads inside a transaction see its writes
  - Each statement is atomic; nothing above relies on multi-statement
    atomicity across separate transactions
  - Conditional writes (the *If / Swap* calls) return ErrorCode::Conflict
    when their WHERE clause matched zero rows, never OK

  Inserts fill in id / created_at_ms when the caller left them empty.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------

  virtual Result InsertRequest(Transaction&, model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::RequestRecord> ListRequests(Transaction&, std::optional<bounty::ledger::v1::RequestStatus> status) = 0;

  virtual Result TransitionRequestIf(Transaction&, const model::RequestStatusChange&) = 0;

  // Optimistic counter update; the single serialization point for acceptances.
  virtual Result SwapRequestCounters(Transaction&, const model::RequestCounterSwap&) = 0;

  // ---------------------------------------------------------------------
  // Submissions
  // ---------------------------------------------------------------------

  virtual Result InsertSubmission(Transaction&, model::SubmissionRecord&) = 0;

  virtual std::optional<model::SubmissionRecord> GetSubmission(Transaction&, const std::string& id) = 0;

  // Ordered by submitted_at ascending.
  virtual std::vector<model::SubmissionRecord> ListSubmissions(Transaction&, const model::SubmissionFilter&) = 0;

  /*
    Conditional on status IN (from) and on the earning claim:
      earning_id empty -> no earning may reference the submission
      earning_id set   -> that earning must exist for the submission
  */
  virtual Result ReviewSubmissionIf(Transaction&, const model::SubmissionReview&) = 0;

  virtual Result InsertSubmissionImage(Transaction&, model::SubmissionImageRecord&) = 0;

  virtual uint64_t CountSubmissionImages(Transaction&, const std::string& submission_id) = 0;

  // ---------------------------------------------------------------------
  // Earnings
  // ---------------------------------------------------------------------

  /*
    Inserts only while the referenced submission is submitted/in_review
    (Conflict otherwise). At most one earning per submission
    (AlreadyExists), so the row doubles as the acceptance claim.
  */
  virtual Result InsertEarning(Transaction&, model::EarningRecord&) = 0;

  virtual std::optional<model::EarningRecord> GetEarning(Transaction&, const std::string& id) = 0;

  /*
    An earning is committed once an accepted submission names it in
    earning_id; before that it is provisional. ListEarnings, CountEarnings
    and SumEarningsByStatus see committed rows only, unless the filter
    sets include_provisional. Ordered by created_at descending.
  */
  virtual std::vector<model::EarningRecord> ListEarnings(Transaction&, const model::EarningFilter&) = 0;

  virtual uint64_t CountEarnings(Transaction&, std::optional<bounty::ledger::v1::EarningStatus> status) = 0;

  // Conditional on status IN (from) and on the earning being committed.
  virtual Result UpdateEarningStatusIf(Transaction&, const model::EarningStatusChange&) = 0;

  /*
    Deletes the earning only while it is provisional and still pending
    (Conflict otherwise). Deleting a missing row is OK so compensation
    can be retried.
  */
  virtual Result DeleteProvisionalEarning(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::EarningTotal> SumEarningsByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Activity feed
  // ---------------------------------------------------------------------

  virtual Result AppendActivity(Transaction&, model::ActivityRecord&) = 0;

  // Newest first.
  virtual std::vector<model::ActivityRecord> ListActivity(Transaction&, const std::string& contributor_id, std::size_t limit) = 0;
};

} // namespace bounty::db
