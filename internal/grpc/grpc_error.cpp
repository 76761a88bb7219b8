#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace bounty::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace bounty::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const InvalidTransition*>(&e) || dynamic_cast<const NotReviewable*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const BudgetExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ConcurrentModification*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const AcceptanceStranded*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace bounty::grpc
