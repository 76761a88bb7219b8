#pragma once

#include <string>

#include "bounty/ledger/v1.hpp"
#include "service_context.hpp"

namespace bounty::service {

/*
  Protobuf-facing admin surface. Maps messages onto the core managers;
  `actor` is the authenticated admin id taken from the transport.
*/
class BountyAdminService {
 public:
  explicit BountyAdminService(ServiceContext ctx);

  bounty::ledger::v1::RequestResponse CreateRequest(const bounty::ledger::v1::CreateRequestRequest& req, const std::string& actor);
  bounty::ledger::v1::RequestResponse TransitionRequest(const bounty::ledger::v1::RequestTransitionRequest& req, const std::string& actor);
  bounty::ledger::v1::RequestResponse GetRequest(const bounty::ledger::v1::GetRequestRequest& req, const std::string& actor);
  bounty::ledger::v1::ListRequestsResponse ListRequests(const bounty::ledger::v1::ListRequestsRequest& req, const std::string& actor);

  bounty::ledger::v1::ReviewSubmissionResponse ReviewSubmission(const bounty::ledger::v1::ReviewSubmissionRequest& req,
                                                                const std::string&                                 actor);
  bounty::ledger::v1::ListPendingSubmissionsResponse ListPendingSubmissions(const bounty::ledger::v1::ListPendingSubmissionsRequest& req,
                                                                            const std::string&                                       actor);

  bounty::ledger::v1::PayoutStatsResponse GetPayoutStats(const bounty::ledger::v1::PayoutStatsRequest& req, const std::string& actor);
  bounty::ledger::v1::ListEarningsResponse ListEarnings(const bounty::ledger::v1::ListEarningsRequest& req, const std::string& actor);
  bounty::ledger::v1::UpdateEarningStatusResponse UpdateEarningStatus(const bounty::ledger::v1::UpdateEarningStatusRequest& req,
                                                                      const std::string&                                   actor);

  bounty::ledger::v1::AdminStatsResponse GetAdminStats(const bounty::ledger::v1::AdminStatsRequest& req, const std::string& actor);
  bounty::ledger::v1::ReconcileResponse  Reconcile(const bounty::ledger::v1::ReconcileRequest& req, const std::string& actor);

 private:
  ServiceContext ctx_;
};

} // namespace bounty::service
