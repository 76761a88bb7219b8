#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "bounty/ledger/services/v1/bounty_admin_service.grpc.pb.h"
#include "internal/service/bounty_admin_service.hpp"

namespace bounty::grpc {

namespace v1 = bounty::ledger::services::v1;

inline constexpr const char* kAdminIdMetadataKey = "x-admin-id";

// Admin id from the x-admin-id metadata entry; empty when absent.
std::string ActorFrom(const ::grpc::ServerContext& context);

class BountyAdminServer final : public v1::BountyAdminService::Service {
 public:
  explicit BountyAdminServer(std::shared_ptr<bounty::service::BountyAdminService> svc);

  ::grpc::Status CreateRequest(::grpc::ServerContext*, const v1::CreateRequestRequest*, v1::RequestResponse*) override;
  ::grpc::Status TransitionRequest(::grpc::ServerContext*, const v1::RequestTransitionRequest*, v1::RequestResponse*) override;
  ::grpc::Status GetRequest(::grpc::ServerContext*, const v1::GetRequestRequest*, v1::RequestResponse*) override;
  ::grpc::Status ListRequests(::grpc::ServerContext*, const v1::ListRequestsRequest*, v1::ListRequestsResponse*) override;

  ::grpc::Status ReviewSubmission(::grpc::ServerContext*, const v1::ReviewSubmissionRequest*, v1::ReviewSubmissionResponse*) override;
  ::grpc::Status ListPendingSubmissions(::grpc::ServerContext*, const v1::ListPendingSubmissionsRequest*,
                                        v1::ListPendingSubmissionsResponse*) override;

  ::grpc::Status GetPayoutStats(::grpc::ServerContext*, const v1::PayoutStatsRequest*, v1::PayoutStatsResponse*) override;
  ::grpc::Status ListEarnings(::grpc::ServerContext*, const v1::ListEarningsRequest*, v1::ListEarningsResponse*) override;
  ::grpc::Status UpdateEarningStatus(::grpc::ServerContext*, const v1::UpdateEarningStatusRequest*, v1::UpdateEarningStatusResponse*) override;

  ::grpc::Status GetAdminStats(::grpc::ServerContext*, const v1::AdminStatsRequest*, v1::AdminStatsResponse*) override;
  ::grpc::Status Reconcile(::grpc::ServerContext*, const v1::ReconcileRequest*, v1::ReconcileResponse*) override;

 private:
  std::shared_ptr<bounty::service::BountyAdminService> service_;
};

} // namespace bounty::grpc
