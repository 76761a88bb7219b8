#pragma once

#include "bounty/ledger/core/v1/types.pb.h"

#include "bounty/ledger/services/v1/bounty_admin_service.pb.h"

namespace bounty::ledger::v1 {
using namespace ::bounty::ledger::core::v1;
using namespace ::bounty::ledger::services::v1;
}
