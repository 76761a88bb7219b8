#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bounty::notify {

inline constexpr const char* kSubmissionAccepted          = "submission_accepted";
inline constexpr const char* kSubmissionRejected          = "submission_rejected";
inline constexpr const char* kSubmissionRevisionRequested = "submission_revision_requested";

struct Notification {
  std::string contributor_id;
  std::string event_kind;
  std::string message;
  // Rendered as a flat JSON object where the sink stores structure.
  std::vector<std::pair<std::string, std::string>> context;
};

std::string AcceptedMessage(int64_t total_payout_cents);
std::string RejectedMessage();
std::string RevisionRequestedMessage();

/*
  Contributor notification sink.

  Callers treat Notify() as fire-and-forget: a throwing sink is logged
  and never fails the review that triggered it.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const Notification& notification) = 0;
};

// Appends to activity_log, the contributor's activity feed.
class ActivityLogNotifier final : public Notifier {
 public:
  explicit ActivityLogNotifier(std::shared_ptr<db::Repository> repository);

  void Notify(const Notification& notification) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Structured log line only; for deployments without a contributor feed.
class LoggingNotifier final : public Notifier {
 public:
  void Notify(const Notification& notification) override;
};

std::string ContextToJson(const std::vector<std::pair<std::string, std::string>>& context);

} // namespace bounty::notify
