#ifndef PRINTBROKER_DOMAIN_CHANGE_ORDER_WORKFLOW_H
#define PRINTBROKER_DOMAIN_CHANGE_ORDER_WORKFLOW_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "change_set.h"

namespace domain {

enum class ChangeOrderStatus { kDraft, kPendingApproval, kApproved, kRejected };

enum class ChangeOrderAction { kSubmit, kWithdraw, kApprove, kReject, kUpdate };

struct WorkflowPolicy {
  // Lets approve() skip the submit step.
  bool allow_direct_approval = false;
  // At most one DRAFT or PENDING_APPROVAL change order per job.
  bool single_open_change_order = false;
};

// The editable part of a change order.
struct ChangeOrderContent {
  std::string summary;
  ChangeSet changes;
  std::vector<std::string> affects_vendors;
  bool requires_new_po = false;
  bool requires_reprice = false;
};

// Partial update; unset members keep their current value.
struct ChangeOrderUpdate {
  std::optional<std::string> summary;
  std::optional<ChangeSet> changes;
  std::optional<std::vector<std::string>> affects_vendors;
  std::optional<bool> requires_new_po;
  std::optional<bool> requires_reprice;
  std::optional<int> version;
};

std::string_view ToString(ChangeOrderStatus status);
std::string_view ToString(ChangeOrderAction action);
std::optional<ChangeOrderStatus> ParseChangeOrderStatus(std::string_view value);

// DRAFT and PENDING_APPROVAL.
bool IsOpen(ChangeOrderStatus status);
// APPROVED and REJECTED; these records are frozen.
bool IsTerminal(ChangeOrderStatus status);

// Status reached by applying action to a change order in current. Throws
// InvalidTransitionError when the action is not allowed from current, and
// ImmutableRecordError for an update of a terminal record.
ChangeOrderStatus NextStatus(ChangeOrderStatus current, ChangeOrderAction action, const WorkflowPolicy &policy);

// Content after a draft update. Terminal records and attempts to move the
// version raise ImmutableRecordError; PENDING_APPROVAL records must be
// withdrawn first (InvalidTransitionError).
ChangeOrderContent ApplyUpdate(std::string_view change_order_no, ChangeOrderStatus status, int current_version,
                               const ChangeOrderContent &current, const ChangeOrderUpdate &update);

// Trimmed summary; throws InvalidArgumentError when nothing is left.
std::string RequireSummary(std::string_view summary);

// Drops empty references, sorts and removes duplicates.
std::vector<std::string> NormalizeVendorRefs(std::vector<std::string> refs);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_CHANGE_ORDER_WORKFLOW_H
