#ifndef PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_H
#define PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_H

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../domain/change_order_workflow.h"
#include "../domain/change_set.h"
#include "jobs_repository.h"

namespace persistence {

class PostgresConfig;

struct ChangeOrderCreateInput {
  std::string job_id;
  std::string summary;
  domain::ChangeSet changes;
  std::vector<std::string> affects_vendors;
  bool requires_new_po = false;
  bool requires_reprice = false;
};

struct ChangeOrderRecord {
  std::string id;
  std::string job_id;
  int version = 0;
  std::string change_order_no;
  domain::ChangeOrderStatus status = domain::ChangeOrderStatus::kDraft;
  domain::ChangeOrderContent content;
  std::optional<std::string> approved_at;
  std::optional<std::string> approved_by;
  std::optional<std::string> rejected_at;
  std::optional<std::string> rejection_reason;
  std::optional<std::string> content_digest;
  std::string created_at;
  std::string updated_at;
};

struct ApprovalResult {
  ChangeOrderRecord change_order;
  JobRecord job;
};

struct IntegrityReport {
  std::string change_order_no;
  domain::ChangeOrderStatus status = domain::ChangeOrderStatus::kDraft;
  // False until the change order is approved.
  bool sealed = false;
  std::string stored_digest;
  std::string computed_digest;
  bool intact = false;
};

struct EffectiveJobState {
  std::string job_id;
  std::string base_job_id;
  std::optional<int> effective_co_version;
  // Versions folded into specs, ascending.
  std::vector<int> applied_versions;
  // Highest approved version, if any.
  std::optional<ChangeOrderRecord> latest_approved;
  nlohmann::json base_specs = nlohmann::json::object();
  nlohmann::json specs = nlohmann::json::object();
};

class ChangeOrdersRepository {
 public:
  ChangeOrdersRepository(std::shared_ptr<PostgresConfig> config, domain::WorkflowPolicy policy);

  ChangeOrderRecord CreateChangeOrder(const ChangeOrderCreateInput &input) const;
  ChangeOrderRecord GetChangeOrder(const std::string &id) const;
  // Newest version first.
  std::vector<ChangeOrderRecord> ListForJob(const std::string &job_id) const;

  ChangeOrderRecord SubmitForApproval(const std::string &id) const;
  ChangeOrderRecord Withdraw(const std::string &id) const;
  ApprovalResult Approve(const std::string &id, const std::string &approver_id) const;
  ChangeOrderRecord Reject(const std::string &id, const std::string &reason) const;
  ChangeOrderRecord UpdateDraft(const std::string &id, const domain::ChangeOrderUpdate &update) const;

  IntegrityReport VerifyIntegrity(const std::string &id) const;
  EffectiveJobState GetEffectiveState(const std::string &job_id) const;

 private:
  std::shared_ptr<PostgresConfig> config_;
  domain::WorkflowPolicy policy_;
};

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_H
