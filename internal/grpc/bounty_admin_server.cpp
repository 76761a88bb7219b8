#include "bounty_admin_server.hpp"

#include "grpc_error.hpp"

namespace bounty::grpc {

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

std::string ActorFrom(const ::grpc::ServerContext& context) {
  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find(kAdminIdMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

BountyAdminServer::BountyAdminServer(std::shared_ptr<bounty::service::BountyAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status BountyAdminServer::CreateRequest(::grpc::ServerContext* ctx, const v1::CreateRequestRequest* req, v1::RequestResponse* resp) {
  return Handle([&] { *resp = service_->CreateRequest(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::TransitionRequest(::grpc::ServerContext* ctx, const v1::RequestTransitionRequest* req,
                                                    v1::RequestResponse* resp) {
  return Handle([&] { *resp = service_->TransitionRequest(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::GetRequest(::grpc::ServerContext* ctx, const v1::GetRequestRequest* req, v1::RequestResponse* resp) {
  return Handle([&] { *resp = service_->GetRequest(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::ListRequests(::grpc::ServerContext* ctx, const v1::ListRequestsRequest* req, v1::ListRequestsResponse* resp) {
  return Handle([&] { *resp = service_->ListRequests(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::ReviewSubmission(::grpc::ServerContext* ctx, const v1::ReviewSubmissionRequest* req,
                                                   v1::ReviewSubmissionResponse* resp) {
  return Handle([&] { *resp = service_->ReviewSubmission(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::ListPendingSubmissions(::grpc::ServerContext* ctx, const v1::ListPendingSubmissionsRequest* req,
                                                         v1::ListPendingSubmissionsResponse* resp) {
  return Handle([&] { *resp = service_->ListPendingSubmissions(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::GetPayoutStats(::grpc::ServerContext* ctx, const v1::PayoutStatsRequest* req, v1::PayoutStatsResponse* resp) {
  return Handle([&] { *resp = service_->GetPayoutStats(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::ListEarnings(::grpc::ServerContext* ctx, const v1::ListEarningsRequest* req, v1::ListEarningsResponse* resp) {
  return Handle([&] { *resp = service_->ListEarnings(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::UpdateEarningStatus(::grpc::ServerContext* ctx, const v1::UpdateEarningStatusRequest* req,
                                                      v1::UpdateEarningStatusResponse* resp) {
  return Handle([&] { *resp = service_->UpdateEarningStatus(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::GetAdminStats(::grpc::ServerContext* ctx, const v1::AdminStatsRequest* req, v1::AdminStatsResponse* resp) {
  return Handle([&] { *resp = service_->GetAdminStats(*req, ActorFrom(*ctx)); });
}

::grpc::Status BountyAdminServer::Reconcile(::grpc::ServerContext* ctx, const v1::ReconcileRequest* req, v1::ReconcileResponse* resp) {
  return Handle([&] { *resp = service_->Reconcile(*req, ActorFrom(*ctx)); });
}

} // namespace bounty::grpc
