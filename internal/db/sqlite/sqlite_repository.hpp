#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bounty::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRequest(Transaction&, model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string&) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, std::optional<bounty::ledger::v1::RequestStatus>) override;
  Result TransitionRequestIf(Transaction&, const model::RequestStatusChange&) override;
  Result SwapRequestCounters(Transaction&, const model::RequestCounterSwap&) override;

  Result InsertSubmission(Transaction&, model::SubmissionRecord&) override;
  std::optional<model::SubmissionRecord> GetSubmission(Transaction&, const std::string&) override;
  std::vector<model::SubmissionRecord> ListSubmissions(Transaction&, const model::SubmissionFilter&) override;
  Result ReviewSubmissionIf(Transaction&, const model::SubmissionReview&) override;
  Result InsertSubmissionImage(Transaction&, model::SubmissionImageRecord&) override;
  uint64_t CountSubmissionImages(Transaction&, const std::string&) override;

  Result InsertEarning(Transaction&, model::EarningRecord&) override;
  std::optional<model::EarningRecord> GetEarning(Transaction&, const std::string&) override;
  std::vector<model::EarningRecord> ListEarnings(Transaction&, const model::EarningFilter&) override;
  uint64_t CountEarnings(Transaction&, std::optional<bounty::ledger::v1::EarningStatus>) override;
  Result UpdateEarningStatusIf(Transaction&, const model::EarningStatusChange&) override;
  Result DeleteProvisionalEarning(Transaction&, const std::string&) override;
  std::vector<model::EarningTotal> SumEarningsByStatus(Transaction&) override;

  Result AppendActivity(Transaction&, model::ActivityRecord&) override;
  std::vector<model::ActivityRecord> ListActivity(Transaction&, const std::string&, std::size_t) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
