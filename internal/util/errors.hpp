#pragma once

#include <stdexcept>
#include <string>

namespace bounty::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lifecycle / payout-status action not allowed from the current status.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Submission or its parent request is not in a reviewable state.
class NotReviewable : public std::runtime_error {
 public:
  explicit NotReviewable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BudgetExceeded : public std::runtime_error {
 public:
  explicit BudgetExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lost the request counter compare-and-swap; caller refetches and may retry.
class ConcurrentModification : public std::runtime_error {
 public:
  explicit ConcurrentModification(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Counters were debited but the submission could not be marked accepted.
// Not retryable by the caller; reconciliation completes it.
class AcceptanceStranded : public std::runtime_error {
 public:
  explicit AcceptanceStranded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bounty::util
