#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "bounty/ledger/services/v1/bounty_admin_service.grpc.pb.h"
#include "bounty/ledger/v1.hpp"
#include "cmd/bountyctl/parse_count.hpp"

using namespace bounty::ledger::v1;

static void Usage() {
  std::cout << "Usage: BOUNTY_ADMIN_ID=<uuid> bountyctl <addr> <command> [args]\n"
            << "  create '<CreateRequestRequest json>'\n"
            << "  publish|pause|unpause|close|cancel <request_id>\n"
            << "  get <request_id>\n"
            << "  list [draft|pending_review|published|paused|fulfilled|closed|cancelled]\n"
            << "  pending [limit]\n"
            << "  accept <submission_id> [--quality-bonus] [feedback]\n"
            << "  reject <submission_id> [feedback]\n"
            << "  revise <submission_id> [feedback]\n"
            << "  payout-stats\n"
            << "  earnings [pending|processing|paid|held] [page] [page_size]\n"
            << "  set-earning <earning_id> <pending|processing|paid|held>\n"
            << "  stats\n"
            << "  reconcile [grace_period_ms] [--repair]\n";
}

static std::optional<RequestAction> ParseAction(const std::string& value) {
  if (value == "publish") return REQUEST_ACTION_PUBLISH;
  if (value == "pause") return REQUEST_ACTION_PAUSE;
  if (value == "unpause") return REQUEST_ACTION_UNPAUSE;
  if (value == "close") return REQUEST_ACTION_CLOSE;
  if (value == "cancel") return REQUEST_ACTION_CANCEL;
  return std::nullopt;
}

static std::optional<RequestStatus> ParseRequestStatus(const std::string& value) {
  RequestStatus status;
  std::string   name = "REQUEST_STATUS_";
  for (char c : value) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  if (!RequestStatus_Parse(name, &status)) return std::nullopt;
  return status;
}

static std::optional<EarningStatus> ParseEarningStatus(const std::string& value) {
  EarningStatus status;
  std::string   name = "EARNING_STATUS_";
  for (char c : value) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  if (!EarningStatus_Parse(name, &status)) return std::nullopt;
  return status;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << "cannot render response: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const char* admin_id = std::getenv("BOUNTY_ADMIN_ID");
  if (!admin_id || std::string(admin_id).empty()) {
    std::cerr << "BOUNTY_ADMIN_ID is not set\n";
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = BountyAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-admin-id", admin_id);

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateRequestRequest req;
    auto                 parse_status = google::protobuf::util::JsonStringToMessage(argv[3], &req);
    if (!parse_status.ok()) {
      std::cerr << "invalid request json: " << parse_status.message() << "\n";
      return 1;
    }

    RequestResponse resp;
    return Print(stub->CreateRequest(&ctx, req, &resp), resp);
  }

  if (auto action = ParseAction(cmd)) {
    if (argc < 4) return 1;

    RequestTransitionRequest req;
    req.set_request_id(argv[3]);
    req.set_action(*action);

    RequestResponse resp;
    return Print(stub->TransitionRequest(&ctx, req, &resp), resp);
  }

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRequestRequest req;
    req.set_request_id(argv[3]);

    RequestResponse resp;
    return Print(stub->GetRequest(&ctx, req, &resp), resp);
  }

  if (cmd == "list") {
    ListRequestsRequest req;
    if (argc >= 4) {
      auto status = ParseRequestStatus(argv[3]);
      if (!status) {
        std::cerr << "unknown request status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(*status);
    }

    ListRequestsResponse resp;
    return Print(stub->ListRequests(&ctx, req, &resp), resp);
  }

  if (cmd == "pending") {
    ListPendingSubmissionsRequest req;
    if (argc >= 4) {
      auto limit = bounty::cli::ParseCount(argv[3], UINT32_MAX);
      if (!limit) {
        Usage();
        return 1;
      }
      req.set_limit(static_cast<uint32_t>(*limit));
    }

    ListPendingSubmissionsResponse resp;
    return Print(stub->ListPendingSubmissions(&ctx, req, &resp), resp);
  }

  if (cmd == "accept" || cmd == "reject" || cmd == "revise") {
    if (argc < 4) return 1;

    ReviewSubmissionRequest req;
    req.set_submission_id(argv[3]);
    req.set_action(cmd == "accept" ? REVIEW_ACTION_ACCEPT : cmd == "reject" ? REVIEW_ACTION_REJECT : REVIEW_ACTION_REVISION_REQUESTED);

    int next = 4;
    if (next < argc && std::string(argv[next]) == "--quality-bonus") {
      req.set_award_quality_bonus(true);
      ++next;
    }
    if (next < argc) req.set_feedback(argv[next]);

    ReviewSubmissionResponse resp;
    return Print(stub->ReviewSubmission(&ctx, req, &resp), resp);
  }

  if (cmd == "payout-stats") {
    PayoutStatsRequest  req;
    PayoutStatsResponse resp;
    return Print(stub->GetPayoutStats(&ctx, req, &resp), resp);
  }

  if (cmd == "earnings") {
    ListEarningsRequest req;
    if (argc >= 4) {
      auto status = ParseEarningStatus(argv[3]);
      if (!status) {
        std::cerr << "unknown earning status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(*status);
    }
    auto page      = argc >= 5 ? bounty::cli::ParseCount(argv[4], UINT32_MAX) : std::optional<uint64_t>(0);
    auto page_size = argc >= 6 ? bounty::cli::ParseCount(argv[5], UINT32_MAX) : std::optional<uint64_t>(0);
    if (!page || !page_size) {
      Usage();
      return 1;
    }
    req.set_page(static_cast<uint32_t>(*page));
    req.set_page_size(static_cast<uint32_t>(*page_size));

    ListEarningsResponse resp;
    return Print(stub->ListEarnings(&ctx, req, &resp), resp);
  }

  if (cmd == "set-earning") {
    if (argc < 5) return 1;

    auto status = ParseEarningStatus(argv[4]);
    if (!status) {
      std::cerr << "unknown earning status: " << argv[4] << "\n";
      return 1;
    }

    UpdateEarningStatusRequest req;
    req.set_earning_id(argv[3]);
    req.set_status(*status);

    UpdateEarningStatusResponse resp;
    return Print(stub->UpdateEarningStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "stats") {
    AdminStatsRequest  req;
    AdminStatsResponse resp;
    return Print(stub->GetAdminStats(&ctx, req, &resp), resp);
  }

  if (cmd == "reconcile") {
    ReconcileRequest req;
    req.set_grace_period_ms(60000);
    for (int i = 3; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--repair") {
        req.set_repair(true);
      } else if (auto grace = bounty::cli::ParseCount(arg)) {
        req.set_grace_period_ms(*grace);
      } else {
        std::cerr << "grace_period_ms must be a non-negative integer: " << arg << "\n";
        Usage();
        return 1;
      }
    }

    ReconcileResponse resp;
    return Print(stub->Reconcile(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
