#pragma once

#include "bounty/ledger/v1.hpp"
#include "internal/db/model/earning_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/submission_record.hpp"

namespace bounty::core {

bounty::ledger::v1::BountyRequest    ToProto(const db::model::RequestRecord& record);
bounty::ledger::v1::BountySubmission ToProto(const db::model::SubmissionRecord& record);
bounty::ledger::v1::Earning          ToProto(const db::model::EarningRecord& record);

} // namespace bounty::core
