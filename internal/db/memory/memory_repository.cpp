#include "memory_repository.hpp"

#include <algorithm>
#include <map>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "memory_tx.hpp"

namespace bounty::db::memory {

namespace {

template <typename T>
bool StatusIn(const std::vector<T>& allowed, T status) {
  return std::find(allowed.begin(), allowed.end(), status) != allowed.end();
}

const std::vector<bounty::ledger::v1::SubmissionStatus>& AwaitingReview() {
  static const std::vector<bounty::ledger::v1::SubmissionStatus> kAwaiting = {bounty::ledger::v1::SUBMISSION_STATUS_SUBMITTED,
                                                                              bounty::ledger::v1::SUBMISSION_STATUS_IN_REVIEW};
  return kAwaiting;
}

void FillIdentity(std::string& id, int64_t& created_at_ms) {
  if (id.empty()) id = util::NewId();
  if (created_at_ms == 0) created_at_ms = util::NowMs();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  FillIdentity(r.id, r.created_at_ms);
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "request " + r.id);
  s.requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t, std::optional<bounty::ledger::v1::RequestStatus> status) {
  const auto&                       s = TX(t).View();
  std::vector<model::RequestRecord> out;
  for (const auto& [_, r] : s.requests) {
    if (status && r.status != *status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::TransitionRequestIf(Transaction& t, const model::RequestStatusChange& c) {
  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find(c.id);
  if (it == s.requests.end() || !StatusIn(c.from, it->second.status)) {
    return Result::Err(ErrorCode::Conflict, "request " + c.id);
  }

  auto& r  = it->second;
  r.status = c.to;
  if (c.published_at_ms) r.published_at_ms = *c.published_at_ms;
  if (c.reviewed_by) r.reviewed_by = *c.reviewed_by;
  if (c.reviewed_at_ms) r.reviewed_at_ms = *c.reviewed_at_ms;
  r.updated_at_ms = c.updated_at_ms;
  ++r.version;
  return Result::Ok();
}

Result MemoryRepository::SwapRequestCounters(Transaction& t, const model::RequestCounterSwap& c) {
  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find(c.id);
  if (it == s.requests.end()) return Result::Err(ErrorCode::Conflict, "request " + c.id);

  auto& r = it->second;
  if (r.version != c.expected_version || r.budget_spent_cents != c.expected_budget_spent_cents ||
      r.quantity_fulfilled != c.expected_quantity_fulfilled) {
    return Result::Err(ErrorCode::Conflict, "request " + c.id + " changed underneath");
  }

  r.budget_spent_cents = c.new_budget_spent_cents;
  r.quantity_fulfilled = c.new_quantity_fulfilled;
  if (c.new_status) r.status = *c.new_status;
  r.updated_at_ms = c.updated_at_ms;
  ++r.version;
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Submissions
// ---------------------------------------------------------------------

Result MemoryRepository::InsertSubmission(Transaction& t, model::SubmissionRecord& r) {
  auto& s = TX(t).Mutable();
  FillIdentity(r.id, r.created_at_ms);
  if (r.submitted_at_ms == 0) r.submitted_at_ms = r.created_at_ms;
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;
  if (s.submissions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "submission " + r.id);
  if (!s.requests.contains(r.request_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown request " + r.request_id);
  s.submissions[r.id] = r;
  return Result::Ok();
}

std::optional<model::SubmissionRecord> MemoryRepository::GetSubmission(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.submissions.find(id);
  if (it == s.submissions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubmissionRecord> MemoryRepository::ListSubmissions(Transaction& t, const model::SubmissionFilter& f) {
  const auto&                          s = TX(t).View();
  std::vector<model::SubmissionRecord> out;
  for (const auto& [_, r] : s.submissions) {
    if (f.request_id && r.request_id != *f.request_id) continue;
    if (f.status && r.status != *f.status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.submitted_at_ms != b.submitted_at_ms) return a.submitted_at_ms < b.submitted_at_ms;
    return a.id < b.id;
  });
  if (f.limit != 0 && out.size() > f.limit) out.resize(f.limit);
  return out;
}

Result MemoryRepository::ReviewSubmissionIf(Transaction& t, const model::SubmissionReview& c) {
  auto& s  = TX(t).Mutable();
  auto  it = s.submissions.find(c.id);
  if (it == s.submissions.end() || !StatusIn(c.from, it->second.status)) {
    return Result::Err(ErrorCode::Conflict, "submission " + c.id);
  }

  const auto claim = std::find_if(s.earnings.begin(), s.earnings.end(), [&](const auto& kv) { return kv.second.submission_id == c.id; });
  const bool claim_matches =
      c.earning_id.empty() ? claim == s.earnings.end() : (claim != s.earnings.end() && claim->second.id == c.earning_id);
  if (!claim_matches) return Result::Err(ErrorCode::Conflict, "submission " + c.id + " earning claim mismatch");

  auto& r               = it->second;
  r.status              = c.to;
  r.reviewed_by         = c.reviewed_by;
  r.reviewed_at_ms      = c.reviewed_at_ms;
  r.review_feedback     = c.review_feedback;
  r.earned_amount_cents = c.earned_amount_cents;
  r.bonus_amount_cents  = c.bonus_amount_cents;
  r.earning_id          = c.earning_id;
  r.updated_at_ms       = c.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::InsertSubmissionImage(Transaction& t, model::SubmissionImageRecord& r) {
  auto& s = TX(t).Mutable();
  FillIdentity(r.id, r.created_at_ms);
  if (s.images.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "image " + r.id);
  if (!s.submissions.contains(r.submission_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown submission " + r.submission_id);
  s.images[r.id] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountSubmissionImages(Transaction& t, const std::string& submission_id) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.images.begin(), s.images.end(), [&](const auto& kv) { return kv.second.submission_id == submission_id; }));
}

// ---------------------------------------------------------------------
// Earnings
// ---------------------------------------------------------------------

Result MemoryRepository::InsertEarning(Transaction& t, model::EarningRecord& r) {
  auto& s = TX(t).Mutable();
  FillIdentity(r.id, r.created_at_ms);
  if (s.earnings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "earning " + r.id);
  // earnings.submission_id is UNIQUE
  for (const auto& [_, e] : s.earnings) {
    if (e.submission_id == r.submission_id) return Result::Err(ErrorCode::AlreadyExists, "earning for submission " + r.submission_id);
  }
  auto sub = s.submissions.find(r.submission_id);
  if (sub == s.submissions.end() || !StatusIn(AwaitingReview(), sub->second.status)) {
    return Result::Err(ErrorCode::Conflict, "submission " + r.submission_id + " is not awaiting review");
  }
  if (!s.requests.contains(r.request_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown request " + r.request_id);
  s.earnings[r.id] = r;
  return Result::Ok();
}

std::optional<model::EarningRecord> MemoryRepository::GetEarning(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.earnings.find(id);
  if (it == s.earnings.end()) return std::nullopt;
  return it->second;
}

bool MemoryRepository::IsCommitted(const State& s, const std::string& earning_id) {
  return std::any_of(s.submissions.begin(), s.submissions.end(), [&](const auto& kv) {
    return kv.second.status == bounty::ledger::v1::SUBMISSION_STATUS_ACCEPTED && kv.second.earning_id == earning_id;
  });
}

std::vector<model::EarningRecord> MemoryRepository::ListEarnings(Transaction& t, const model::EarningFilter& f) {
  const auto&                       s = TX(t).View();
  std::vector<model::EarningRecord> all;
  for (const auto& [_, e] : s.earnings) {
    if (f.status && e.status != *f.status) continue;
    if (f.request_id && e.request_id != *f.request_id) continue;
    if (!f.include_provisional && !IsCommitted(s, e.id)) continue;
    all.push_back(e);
  }
  std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });

  if (f.offset >= all.size()) return {};
  auto first = all.begin() + static_cast<std::ptrdiff_t>(f.offset);
  auto last  = (f.limit == 0 || f.offset + f.limit >= all.size()) ? all.end() : first + static_cast<std::ptrdiff_t>(f.limit);
  return {first, last};
}

uint64_t MemoryRepository::CountEarnings(Transaction& t, std::optional<bounty::ledger::v1::EarningStatus> status) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.earnings.begin(), s.earnings.end(), [&](const auto& kv) {
    return (!status || kv.second.status == *status) && IsCommitted(s, kv.first);
  }));
}

Result MemoryRepository::UpdateEarningStatusIf(Transaction& t, const model::EarningStatusChange& c) {
  auto& s  = TX(t).Mutable();
  auto  it = s.earnings.find(c.id);
  if (it == s.earnings.end() || !StatusIn(c.from, it->second.status) || !IsCommitted(s, c.id)) {
    return Result::Err(ErrorCode::Conflict, "earning " + c.id);
  }
  it->second.status = c.to;
  if (c.paid_at_ms) it->second.paid_at_ms = *c.paid_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteProvisionalEarning(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.earnings.find(id);
  if (it == s.earnings.end()) return Result::Ok();
  if (it->second.status != bounty::ledger::v1::EARNING_STATUS_PENDING || IsCommitted(s, id)) {
    return Result::Err(ErrorCode::Conflict, "earning " + id + " is no longer provisional");
  }
  s.earnings.erase(it);
  return Result::Ok();
}

std::vector<model::EarningTotal> MemoryRepository::SumEarningsByStatus(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::map<int, model::EarningTotal> by_status;
  for (const auto& [id, e] : s.earnings) {
    if (!IsCommitted(s, id)) continue;
    auto& total  = by_status[e.status];
    total.status = e.status;
    total.amount_cents += e.amount_cents;
    ++total.count;
  }

  std::vector<model::EarningTotal> out;
  out.reserve(by_status.size());
  for (auto& [_, total] : by_status) out.push_back(total);
  return out;
}

// ---------------------------------------------------------------------
// Activity feed
// ---------------------------------------------------------------------

Result MemoryRepository::AppendActivity(Transaction& t, model::ActivityRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_activity_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
  if (r.metadata_json.empty()) r.metadata_json = "{}";
  s.activity.push_back(r);
  return Result::Ok();
}

std::vector<model::ActivityRecord> MemoryRepository::ListActivity(Transaction& t, const std::string& contributor_id, std::size_t limit) {
  std::vector<model::ActivityRecord> out;
  const auto&                        feed = TX(t).View().activity;
  for (auto it = feed.rbegin(); it != feed.rend(); ++it) {
    if (it->contributor_id != contributor_id) continue;
    out.push_back(*it);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

} // namespace bounty::db::memory
