#ifndef PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_UTILS_H
#define PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_UTILS_H

#include <optional>
#include <string>
#include <vector>

#include "change_orders_repository.h"

namespace persistence::detail {

struct ChangeOrderRowData {
  std::string id;
  std::string job_id;
  int version = 0;
  std::string change_order_no;
  std::string status;
  std::string summary;
  std::optional<std::string> changes_json;
  std::optional<std::string> affects_vendors_json;
  bool requires_new_po = false;
  bool requires_reprice = false;
  std::optional<std::string> approved_at;
  std::optional<std::string> approved_by;
  std::optional<std::string> rejected_at;
  std::optional<std::string> rejection_reason;
  std::optional<std::string> content_digest;
  std::optional<std::string> created_at;
  std::optional<std::string> updated_at;
};

// Throws std::runtime_error for a status outside the workflow.
ChangeOrderRecord BuildChangeOrderRecord(const ChangeOrderRowData &data);

std::string SerializeStringArray(const std::vector<std::string> &values);
std::vector<std::string> ParseStringArray(const std::optional<std::string> &json_payload);

// Approver recorded on the change order; anonymous approvals belong to "system".
std::string ResolveApprover(const std::string &approver_id);

IntegrityReport BuildIntegrityReport(const ChangeOrderRecord &record);

// Base specs of the job with the approved change orders folded in by
// ascending version. Non-approved entries are ignored.
EffectiveJobState BuildEffectiveState(const JobRecord &job, std::vector<ChangeOrderRecord> change_orders);

}  // namespace persistence::detail

#endif  // PRINTBROKER_PERSISTENCE_CHANGE_ORDERS_REPOSITORY_UTILS_H
