#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/auth/role_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/service/bounty_admin_service.hpp"
#include "internal/service/service_context.hpp"

namespace bounty::factory {

/*
  Application

  Long-lived objects built from the runtime config. The transport layer
  wraps admin_service; everything else is reachable through context.
*/
struct Application {
  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<notify::Notifier>                   notifier;
  auth::RolePolicy                                    roles;
  service::ServiceContext                             context;
  std::shared_ptr<service::BountyAdminService>        admin_service;
};

/*
  Composition root. The only place that knows concrete DB types.
  Opens the configured backend and runs pending schema migrations.
*/
std::shared_ptr<db::Repository> BuildRepository(const bounty::runtime::config::RuntimeConfig& config);

std::shared_ptr<notify::Notifier> BuildNotifier(const bounty::runtime::config::RuntimeConfig& config,
                                                std::shared_ptr<db::Repository>               repository);

Application Build(const bounty::runtime::config::RuntimeConfig& config);

} // namespace bounty::factory
