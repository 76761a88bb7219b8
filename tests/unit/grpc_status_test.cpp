#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/bounty_admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace v1 = bounty::ledger::services::v1;

void TestExceptionMapping() {
  using namespace bounty::util;
  using ::grpc::StatusCode;

  assert(bounty::grpc::ToStatus(NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(bounty::grpc::ToStatus(InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(bounty::grpc::ToStatus(PermissionDenied("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(bounty::grpc::ToStatus(InvalidTransition("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(bounty::grpc::ToStatus(NotReviewable("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(bounty::grpc::ToStatus(BudgetExceeded("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(bounty::grpc::ToStatus(ConcurrentModification("x")).error_code() == StatusCode::ABORTED);
  assert(bounty::grpc::ToStatus(AcceptanceStranded("x")).error_code() == StatusCode::INTERNAL);
  assert(bounty::grpc::ToStatus(StoreUnavailable("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(bounty::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);

  const auto status = bounty::grpc::ToStatus(BudgetExceeded("payout of $6.00 exceeds the remaining budget of $4.00"));
  assert(status.error_message() == "payout of $6.00 exceeds the remaining budget of $4.00");
}

void TestMissingAdminIdIsPermissionDenied() {
  auto app = bounty::factory::Build(bounty::config::ConfigLoader::LoadFromString(
      "admins:\n  - id: \"22222222-2222-4222-8222-222222222222\"\n    role: ADMIN_ROLE_ADMIN\n"));
  bounty::grpc::BountyAdminServer server(app.admin_service);

  v1::GetRequestRequest req;
  req.set_request_id(bounty::util::NewId());
  v1::RequestResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetRequest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingAdminIdIsPermissionDenied();

  std::cout << "bounty_ledger_unit_grpc_status: pass\n";
  return 0;
}
