#include "request_lifecycle.hpp"

#include <algorithm>

namespace bounty::model {

using namespace bounty::ledger::v1;

const std::vector<RequestStatus>& AllowedSources(RequestAction action) {
  static const std::vector<RequestStatus> kPublish = {REQUEST_STATUS_DRAFT, REQUEST_STATUS_PENDING_REVIEW};
  static const std::vector<RequestStatus> kPause   = {REQUEST_STATUS_PUBLISHED};
  static const std::vector<RequestStatus> kUnpause = {REQUEST_STATUS_PAUSED};
  static const std::vector<RequestStatus> kClose   = {REQUEST_STATUS_PUBLISHED, REQUEST_STATUS_PAUSED};
  static const std::vector<RequestStatus> kCancel  = {REQUEST_STATUS_DRAFT, REQUEST_STATUS_PENDING_REVIEW, REQUEST_STATUS_PUBLISHED,
                                                      REQUEST_STATUS_PAUSED};
  static const std::vector<RequestStatus> kNone;

  switch (action) {
    case REQUEST_ACTION_PUBLISH:
      return kPublish;
    case REQUEST_ACTION_PAUSE:
      return kPause;
    case REQUEST_ACTION_UNPAUSE:
      return kUnpause;
    case REQUEST_ACTION_CLOSE:
      return kClose;
    case REQUEST_ACTION_CANCEL:
      return kCancel;
    default:
      return kNone;
  }
}

RequestStatus TargetStatus(RequestAction action) {
  switch (action) {
    case REQUEST_ACTION_PUBLISH:
    case REQUEST_ACTION_UNPAUSE:
      return REQUEST_STATUS_PUBLISHED;
    case REQUEST_ACTION_PAUSE:
      return REQUEST_STATUS_PAUSED;
    case REQUEST_ACTION_CLOSE:
      return REQUEST_STATUS_CLOSED;
    case REQUEST_ACTION_CANCEL:
      return REQUEST_STATUS_CANCELLED;
    default:
      return REQUEST_STATUS_UNSPECIFIED;
  }
}

bool CanApply(RequestAction action, RequestStatus from) {
  const auto& sources = AllowedSources(action);
  return std::find(sources.begin(), sources.end(), from) != sources.end();
}

std::string_view ToString(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_DRAFT:
      return "draft";
    case REQUEST_STATUS_PENDING_REVIEW:
      return "pending_review";
    case REQUEST_STATUS_PUBLISHED:
      return "published";
    case REQUEST_STATUS_PAUSED:
      return "paused";
    case REQUEST_STATUS_FULFILLED:
      return "fulfilled";
    case REQUEST_STATUS_CLOSED:
      return "closed";
    case REQUEST_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

std::string_view ToString(RequestAction action) {
  switch (action) {
    case REQUEST_ACTION_PUBLISH:
      return "publish";
    case REQUEST_ACTION_PAUSE:
      return "pause";
    case REQUEST_ACTION_UNPAUSE:
      return "unpause";
    case REQUEST_ACTION_CLOSE:
      return "close";
    case REQUEST_ACTION_CANCEL:
      return "cancel";
    default:
      return "unspecified";
  }
}

} // namespace bounty::model
