#pragma once

#include <memory>

namespace bounty::core {
class RequestManager;
class ReviewEngine;
class EarningsLedger;
class Reconciler;
} // namespace bounty::core

namespace bounty::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<bounty::core::RequestManager> requests;
  std::shared_ptr<bounty::core::ReviewEngine>   reviews;
  std::shared_ptr<bounty::core::EarningsLedger> ledger;
  std::shared_ptr<bounty::core::Reconciler>     reconciler;
};

} // namespace bounty::service
