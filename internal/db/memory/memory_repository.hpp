#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bounty::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RequestRecord> requests;
    std::unordered_map<std::string, model::SubmissionRecord> submissions;
    std::unordered_map<std::string, model::SubmissionImageRecord> images;
    std::unordered_map<std::string, model::EarningRecord> earnings;
    std::vector<model::ActivityRecord> activity;
    uint64_t next_activity_id = 1;
  };

  // True once an accepted submission names the earning.
  static bool IsCommitted(const State& s, const std::string& earning_id);

  // Held by a live transaction from Begin() until Commit()/Rollback().
  std::mutex mutex_;
  State committed_;
};

}
