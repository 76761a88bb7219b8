#pragma once

namespace bounty::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  IMPORTANT:
  Numbered parameters (?1, ?2 ...) so the optional filters can reuse
  a binding ("?1 IS NULL OR status=?1"). Postgres keeps its own $n
  prepared copies in PgPool::PrepareStatements with the same column order.
*/

// requests

#define BOUNTY_REQUEST_COLUMNS                                                                                       \
  "id,created_by,title,description,status,pay_type,pay_amount_cents,speed_bonus_cents,speed_bonus_deadline_ms," \
  "quality_bonus_cents,budget_total_cents,budget_spent_cents,quantity_needed,quantity_fulfilled,"                 \
  "published_at_ms,reviewed_by,reviewed_at_ms,created_at_ms,updated_at_ms,version"

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO bounty_requests(" BOUNTY_REQUEST_COLUMNS ")"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20);";

static constexpr const char* SELECT_REQUEST =
    "SELECT " BOUNTY_REQUEST_COLUMNS " FROM bounty_requests WHERE id=?1;";

static constexpr const char* LIST_REQUESTS =
    "SELECT " BOUNTY_REQUEST_COLUMNS " FROM bounty_requests"
    " WHERE (?1 IS NULL OR status=?1)"
    " ORDER BY created_at_ms DESC, id ASC;";

// ?2 is a comma-joined list of allowed source statuses
static constexpr const char* TRANSITION_REQUEST =
    "UPDATE bounty_requests SET status=?3,"
    " published_at_ms=COALESCE(?4,published_at_ms),"
    " reviewed_by=COALESCE(?5,reviewed_by),"
    " reviewed_at_ms=COALESCE(?6,reviewed_at_ms),"
    " updated_at_ms=?7, version=version+1"
    " WHERE id=?1 AND instr(',' || ?2 || ',', ',' || status || ',') > 0;";

static constexpr const char* SWAP_REQUEST_COUNTERS =
    "UPDATE bounty_requests SET budget_spent_cents=?5, quantity_fulfilled=?6,"
    " status=COALESCE(?7,status), updated_at_ms=?8, version=version+1"
    " WHERE id=?1 AND version=?2 AND budget_spent_cents=?3 AND quantity_fulfilled=?4;";

// submissions

#define BOUNTY_SUBMISSION_COLUMNS                                                                  \
  "id,request_id,contributor_id,status,submitted_at_ms,reviewed_by,reviewed_at_ms,review_feedback," \
  "earned_amount_cents,bonus_amount_cents,earning_id,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SUBMISSION =
    "INSERT INTO bounty_submissions(" BOUNTY_SUBMISSION_COLUMNS ")"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13);";

static constexpr const char* SELECT_SUBMISSION =
    "SELECT " BOUNTY_SUBMISSION_COLUMNS " FROM bounty_submissions WHERE id=?1;";

static constexpr const char* LIST_SUBMISSIONS =
    "SELECT " BOUNTY_SUBMISSION_COLUMNS " FROM bounty_submissions"
    " WHERE (?1 IS NULL OR request_id=?1) AND (?2 IS NULL OR status=?2)"
    " ORDER BY submitted_at_ms ASC, id ASC LIMIT ?3;";

// ?9 empty: no earning may claim the submission; set: that earning must.
static constexpr const char* REVIEW_SUBMISSION =
    "UPDATE bounty_submissions SET status=?3, reviewed_by=?4, reviewed_at_ms=?5, review_feedback=?6,"
    " earned_amount_cents=?7, bonus_amount_cents=?8, earning_id=?9, updated_at_ms=?10"
    " WHERE id=?1 AND instr(',' || ?2 || ',', ',' || status || ',') > 0"
    " AND ((?9 = '' AND NOT EXISTS (SELECT 1 FROM earnings e WHERE e.submission_id=?1))"
    "   OR (?9 <> '' AND EXISTS (SELECT 1 FROM earnings e WHERE e.id=?9 AND e.submission_id=?1)));";

static constexpr const char* INSERT_SUBMISSION_IMAGE =
    "INSERT INTO submission_images(id,submission_id,file_path,created_at_ms) VALUES(?1,?2,?3,?4);";

static constexpr const char* COUNT_SUBMISSION_IMAGES =
    "SELECT COUNT(*) FROM submission_images WHERE submission_id=?1;";

// earnings

#define BOUNTY_EARNING_COLUMNS \
  "id,contributor_id,submission_id,request_id,amount_cents,bonus_amount_cents,currency,status,description,paid_at_ms,created_at_ms"

// 1,2 = SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW
static constexpr const char* INSERT_EARNING =
    "INSERT INTO earnings(" BOUNTY_EARNING_COLUMNS ")"
    " SELECT ?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11"
    " WHERE EXISTS (SELECT 1 FROM bounty_submissions s WHERE s.id=?3 AND s.status IN (1,2));";

static constexpr const char* SELECT_EARNING =
    "SELECT " BOUNTY_EARNING_COLUMNS " FROM earnings WHERE id=?1;";

// 3 = SUBMISSION_STATUS_ACCEPTED; an earning is committed once the accepted submission names it.
#define BOUNTY_EARNING_COMMITTED \
  "EXISTS (SELECT 1 FROM bounty_submissions s WHERE s.earning_id=earnings.id AND s.status=3)"

// ?5 = 1 includes provisional rows (reconciliation only)
static constexpr const char* LIST_EARNINGS =
    "SELECT " BOUNTY_EARNING_COLUMNS " FROM earnings"
    " WHERE (?1 IS NULL OR status=?1) AND (?2 IS NULL OR request_id=?2)"
    " AND (?5 = 1 OR " BOUNTY_EARNING_COMMITTED ")"
    " ORDER BY created_at_ms DESC, id ASC LIMIT ?3 OFFSET ?4;";

static constexpr const char* COUNT_EARNINGS =
    "SELECT COUNT(*) FROM earnings WHERE (?1 IS NULL OR status=?1) AND " BOUNTY_EARNING_COMMITTED ";";

static constexpr const char* UPDATE_EARNING_STATUS =
    "UPDATE earnings SET status=?3, paid_at_ms=COALESCE(?4,paid_at_ms)"
    " WHERE id=?1 AND instr(',' || ?2 || ',', ',' || status || ',') > 0"
    " AND " BOUNTY_EARNING_COMMITTED ";";

// 1 = EARNING_STATUS_PENDING
static constexpr const char* DELETE_PROVISIONAL_EARNING =
    "DELETE FROM earnings WHERE id=?1 AND status=1 AND NOT " BOUNTY_EARNING_COMMITTED ";";

static constexpr const char* SUM_EARNINGS_BY_STATUS =
    "SELECT status, COALESCE(SUM(amount_cents),0), COUNT(*) FROM earnings"
    " WHERE " BOUNTY_EARNING_COMMITTED " GROUP BY status ORDER BY status;";

// activity

static constexpr const char* INSERT_ACTIVITY =
    "INSERT INTO activity_log(contributor_id,action,description,metadata_json,created_at_ms)"
    " VALUES(?1,?2,?3,?4,?5);";

static constexpr const char* LIST_ACTIVITY =
    "SELECT id,contributor_id,action,description,metadata_json,created_at_ms FROM activity_log"
    " WHERE contributor_id=?1 ORDER BY id DESC LIMIT ?2;";

} // namespace bounty::db::sql
