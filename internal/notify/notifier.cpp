#include "notifier.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/core/store_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/money.hpp"

namespace bounty::notify {

std::string AcceptedMessage(int64_t total_payout_cents) {
  return "Your submission was accepted! You earned " + util::FormatUsd(total_payout_cents) + ".";
}

std::string RejectedMessage() {
  return "Your submission was not accepted. Check the feedback for details.";
}

std::string RevisionRequestedMessage() {
  return "Your submission needs some changes. Check the feedback and resubmit.";
}

std::string ContextToJson(const std::vector<std::pair<std::string, std::string>>& context) {
  google::protobuf::Struct object;
  auto&                    fields = *object.mutable_fields();
  for (const auto& [key, value] : context) {
    fields[key].set_string_value(value);
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("activity context to json: " + std::string(status.message()));
  }
  return json;
}

ActivityLogNotifier::ActivityLogNotifier(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void ActivityLogNotifier::Notify(const Notification& notification) {
  db::model::ActivityRecord record;
  record.contributor_id = notification.contributor_id;
  record.action         = notification.event_kind;
  record.description    = notification.message;
  record.metadata_json  = ContextToJson(notification.context);

  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->AppendActivity(*tx, record), "append activity");
  tx->Commit();
}

void LoggingNotifier::Notify(const Notification& notification) {
  BOUNTY_LOG_INFO("contributor notification", {observability::StringField("contributor_id", notification.contributor_id),
                                               observability::StringField("event", notification.event_kind),
                                               observability::StringField("message", notification.message),
                                               observability::StringField("context", ContextToJson(notification.context))});
}

} // namespace bounty::notify
