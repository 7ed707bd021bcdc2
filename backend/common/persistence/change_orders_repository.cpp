#include "change_orders_repository.h"

#include <utility>

#include "../domain/content_digest.h"
#include "../domain/errors.h"
#include "../logger.h"
#include "change_order_allocator.h"
#include "change_orders_repository_utils.h"
#include "job_queries.h"
#include "jobs_repository_utils.h"
#include "postgres.h"
#include "row_mapping.h"
#include "transaction.h"

namespace persistence {
namespace {

constexpr char kEntity[] = "change order";

logging::ServiceLogger &Logger() {
  return logging::ServiceLogger::Instance("persistence");
}

ChangeOrderRecord LoadChangeOrder(pqxx::work &txn, const std::string &id, bool for_update) {
  if (!detail::LooksLikeUuid(id)) {
    throw domain::NotFoundError(kEntity, id);
  }
  std::string query = std::string("select ") + detail::kChangeOrderColumns + " from change_orders where id=$1";
  if (for_update) {
    query += " for update";
  }
  const auto result = txn.exec_params(query, id);
  if (result.empty()) {
    throw domain::NotFoundError(kEntity, id);
  }
  return detail::RowToChangeOrder(result[0]);
}

// Job row first, then the change order, the same order allocation uses.
ChangeOrderRecord LockForTransition(pqxx::work &txn, const std::string &id) {
  const auto unlocked = LoadChangeOrder(txn, id, false);
  detail::LoadJob(txn, unlocked.job_id, true);
  return LoadChangeOrder(txn, id, true);
}

ChangeOrderRecord UpdateStatus(pqxx::work &txn, const std::string &id, domain::ChangeOrderStatus status) {
  const auto row = txn.exec_params1(
      std::string("update change_orders set status=$2, updated_at=now() where id=$1 returning ") +
          detail::kChangeOrderColumns,
      id, std::string(domain::ToString(status)));
  return detail::RowToChangeOrder(row);
}

// Points the job at the version that was just approved. Runs inside the
// approval transaction with the job row already locked.
JobRecord ResolveEffectiveVersion(pqxx::work &txn, const std::string &job_id, int approved_version) {
  const auto row = txn.exec_params1(
      std::string("update jobs set effective_co_version=$2, updated_at=now() where id=$1 returning ") +
          detail::kJobColumns,
      job_id, approved_version);
  return detail::RowToJob(row);
}

void LogTransition(std::string_view action, const ChangeOrderRecord &record) {
  Logger().Info("change_order_" + std::string(action), {{"changeOrderNo", record.change_order_no},
                                                         {"status", std::string(domain::ToString(record.status))}});
}

}  // namespace

ChangeOrdersRepository::ChangeOrdersRepository(std::shared_ptr<PostgresConfig> config,
                                               domain::WorkflowPolicy policy)
    : config_(std::move(config)), policy_(policy) {}

ChangeOrderRecord ChangeOrdersRepository::CreateChangeOrder(const ChangeOrderCreateInput &input) const {
  const auto summary = domain::RequireSummary(input.summary);
  const auto vendors = domain::NormalizeVendorRefs(input.affects_vendors);
  const ChangeOrderAllocator allocator;

  auto record = RunInTransaction(*config_, "create_change_order", [&](pqxx::work &txn) {
    const auto job = detail::LoadJob(txn, input.job_id, true);
    if (policy_.single_open_change_order) {
      const auto open = txn.exec_params(
          "select change_order_no from change_orders where job_id=$1 and status in ('DRAFT','PENDING_APPROVAL') "
          "order by version limit 1",
          job.id);
      if (!open.empty()) {
        throw domain::OpenChangeOrderError(open[0]["change_order_no"].c_str());
      }
    }
    const auto number = allocator.AllocateNext(txn, job);
    const auto row = txn.exec_params1(
        std::string("insert into change_orders(job_id, version, change_order_no, status, summary, changes, "
                    "affects_vendors, requires_new_po, requires_reprice) "
                    "values ($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8,$9) returning ") +
            detail::kChangeOrderColumns,
        job.id, number.version, number.change_order_no,
        std::string(domain::ToString(domain::ChangeOrderStatus::kDraft)), summary, input.changes.Canonical(),
        detail::SerializeStringArray(vendors), input.requires_new_po, input.requires_reprice);
    return detail::RowToChangeOrder(row);
  });
  LogTransition("created", record);
  return record;
}

ChangeOrderRecord ChangeOrdersRepository::GetChangeOrder(const std::string &id) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  return LoadChangeOrder(txn, id, false);
}

std::vector<ChangeOrderRecord> ChangeOrdersRepository::ListForJob(const std::string &job_id) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  detail::LoadJob(txn, job_id, false);
  const auto result = txn.exec_params(
      std::string("select ") + detail::kChangeOrderColumns + " from change_orders where job_id=$1 order by version desc",
      job_id);
  std::vector<ChangeOrderRecord> records;
  records.reserve(result.size());
  for (const auto &row : result) {
    records.push_back(detail::RowToChangeOrder(row));
  }
  return records;
}

ChangeOrderRecord ChangeOrdersRepository::SubmitForApproval(const std::string &id) const {
  auto record = RunInTransaction(*config_, "submit_change_order", [&](pqxx::work &txn) {
    const auto current = LockForTransition(txn, id);
    const auto next = domain::NextStatus(current.status, domain::ChangeOrderAction::kSubmit, policy_);
    return UpdateStatus(txn, id, next);
  });
  LogTransition("submitted", record);
  return record;
}

ChangeOrderRecord ChangeOrdersRepository::Withdraw(const std::string &id) const {
  auto record = RunInTransaction(*config_, "withdraw_change_order", [&](pqxx::work &txn) {
    const auto current = LockForTransition(txn, id);
    const auto next = domain::NextStatus(current.status, domain::ChangeOrderAction::kWithdraw, policy_);
    return UpdateStatus(txn, id, next);
  });
  LogTransition("withdrawn", record);
  return record;
}

ApprovalResult ChangeOrdersRepository::Approve(const std::string &id, const std::string &approver_id) const {
  const auto approver = detail::ResolveApprover(approver_id);
  auto result = RunInTransaction(*config_, "approve_change_order", [&](pqxx::work &txn) {
    const auto current = LockForTransition(txn, id);
    const auto next = domain::NextStatus(current.status, domain::ChangeOrderAction::kApprove, policy_);
    const auto digest = domain::ChangeOrderDigest(current.content.summary, current.content.changes);
    const auto row = txn.exec_params1(
        std::string("update change_orders set status=$2, approved_at=now(), approved_by=$3, content_digest=$4, "
                    "updated_at=now() where id=$1 returning ") +
            detail::kChangeOrderColumns,
        id, std::string(domain::ToString(next)), approver, digest);
    ApprovalResult approval;
    approval.change_order = detail::RowToChangeOrder(row);
    approval.job = ResolveEffectiveVersion(txn, current.job_id, current.version);
    return approval;
  });
  Logger().Info("change_order_approved", {{"changeOrderNo", result.change_order.change_order_no},
                                          {"approvedBy", approver},
                                          {"effectiveCOVersion", result.change_order.version}});
  return result;
}

ChangeOrderRecord ChangeOrdersRepository::Reject(const std::string &id, const std::string &reason) const {
  auto record = RunInTransaction(*config_, "reject_change_order", [&](pqxx::work &txn) {
    const auto current = LockForTransition(txn, id);
    const auto next = domain::NextStatus(current.status, domain::ChangeOrderAction::kReject, policy_);
    const auto row = txn.exec_params1(
        std::string("update change_orders set status=$2, rejected_at=now(), rejection_reason=$3, updated_at=now() "
                    "where id=$1 returning ") +
            detail::kChangeOrderColumns,
        id, std::string(domain::ToString(next)), detail::NullIfEmpty(reason));
    return detail::RowToChangeOrder(row);
  });
  LogTransition("rejected", record);
  return record;
}

ChangeOrderRecord ChangeOrdersRepository::UpdateDraft(const std::string &id,
                                                      const domain::ChangeOrderUpdate &update) const {
  auto record = RunInTransaction(*config_, "update_change_order", [&](pqxx::work &txn) {
    const auto current = LockForTransition(txn, id);
    const auto content =
        domain::ApplyUpdate(current.change_order_no, current.status, current.version, current.content, update);
    const auto row = txn.exec_params1(
        std::string("update change_orders set summary=$2, changes=$3::jsonb, affects_vendors=$4::jsonb, "
                    "requires_new_po=$5, requires_reprice=$6, updated_at=now() where id=$1 returning ") +
            detail::kChangeOrderColumns,
        id, content.summary, content.changes.Canonical(), detail::SerializeStringArray(content.affects_vendors),
        content.requires_new_po, content.requires_reprice);
    return detail::RowToChangeOrder(row);
  });
  LogTransition("updated", record);
  return record;
}

IntegrityReport ChangeOrdersRepository::VerifyIntegrity(const std::string &id) const {
  const auto report = detail::BuildIntegrityReport(GetChangeOrder(id));
  if (report.sealed && !report.intact) {
    Logger().Error("change_order_digest_mismatch", {{"changeOrderNo", report.change_order_no},
                                                    {"storedDigest", report.stored_digest},
                                                    {"computedDigest", report.computed_digest}});
  }
  return report;
}

EffectiveJobState ChangeOrdersRepository::GetEffectiveState(const std::string &job_id) const {
  pqxx::connection conn = config_->Connect();
  // One snapshot for both reads, so a concurrent approval is either fully
  // visible (pointer and change order) or not at all.
  pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only> txn(conn);
  const auto job = detail::LoadJob(txn, job_id, false);
  const auto result = txn.exec_params(
      std::string("select ") + detail::kChangeOrderColumns +
          " from change_orders where job_id=$1 and status='APPROVED' order by version",
      job_id);
  std::vector<ChangeOrderRecord> approved;
  approved.reserve(result.size());
  for (const auto &row : result) {
    approved.push_back(detail::RowToChangeOrder(row));
  }
  return detail::BuildEffectiveState(job, std::move(approved));
}

}  // namespace persistence
