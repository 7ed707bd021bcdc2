#include "change_order_workflow.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "errors.h"

namespace domain {

namespace {

constexpr char kSubject[] = "change order";

std::string EditRefusal(ChangeOrderStatus status) {
  std::string message = std::string(ToString(status)) + " records cannot be edited";
  if (status == ChangeOrderStatus::kPendingApproval) {
    message += "; withdraw it first";
  }
  return message;
}

}  // namespace

std::string_view ToString(ChangeOrderStatus status) {
  switch (status) {
    case ChangeOrderStatus::kDraft:
      return "DRAFT";
    case ChangeOrderStatus::kPendingApproval:
      return "PENDING_APPROVAL";
    case ChangeOrderStatus::kApproved:
      return "APPROVED";
    case ChangeOrderStatus::kRejected:
      return "REJECTED";
  }
  return "DRAFT";
}

std::string_view ToString(ChangeOrderAction action) {
  switch (action) {
    case ChangeOrderAction::kSubmit:
      return "submit";
    case ChangeOrderAction::kWithdraw:
      return "withdraw";
    case ChangeOrderAction::kApprove:
      return "approve";
    case ChangeOrderAction::kReject:
      return "reject";
    case ChangeOrderAction::kUpdate:
      return "update";
  }
  return "update";
}

std::optional<ChangeOrderStatus> ParseChangeOrderStatus(std::string_view value) {
  if (value == "DRAFT") {
    return ChangeOrderStatus::kDraft;
  }
  if (value == "PENDING_APPROVAL") {
    return ChangeOrderStatus::kPendingApproval;
  }
  if (value == "APPROVED") {
    return ChangeOrderStatus::kApproved;
  }
  if (value == "REJECTED") {
    return ChangeOrderStatus::kRejected;
  }
  return std::nullopt;
}

bool IsOpen(ChangeOrderStatus status) {
  return status == ChangeOrderStatus::kDraft || status == ChangeOrderStatus::kPendingApproval;
}

bool IsTerminal(ChangeOrderStatus status) {
  return !IsOpen(status);
}

ChangeOrderStatus NextStatus(ChangeOrderStatus current, ChangeOrderAction action, const WorkflowPolicy &policy) {
  switch (action) {
    case ChangeOrderAction::kSubmit:
      if (current == ChangeOrderStatus::kDraft) {
        return ChangeOrderStatus::kPendingApproval;
      }
      break;
    case ChangeOrderAction::kWithdraw:
      if (current == ChangeOrderStatus::kPendingApproval) {
        return ChangeOrderStatus::kDraft;
      }
      break;
    case ChangeOrderAction::kApprove:
      if (current == ChangeOrderStatus::kPendingApproval ||
          (policy.allow_direct_approval && current == ChangeOrderStatus::kDraft)) {
        return ChangeOrderStatus::kApproved;
      }
      break;
    case ChangeOrderAction::kReject:
      if (current == ChangeOrderStatus::kPendingApproval) {
        return ChangeOrderStatus::kRejected;
      }
      break;
    case ChangeOrderAction::kUpdate:
      if (current == ChangeOrderStatus::kDraft) {
        return current;
      }
      throw ImmutableRecordError("record", EditRefusal(current));
  }
  throw InvalidTransitionError(ToString(action), kSubject, ToString(current));
}

ChangeOrderContent ApplyUpdate(std::string_view change_order_no, ChangeOrderStatus status, int current_version,
                               const ChangeOrderContent &current, const ChangeOrderUpdate &update) {
  if (status != ChangeOrderStatus::kDraft) {
    throw ImmutableRecordError(change_order_no, EditRefusal(status));
  }
  if (update.version.has_value() && *update.version != current_version) {
    throw ImmutableRecordError(change_order_no, "version is assigned at creation and never changes");
  }

  ChangeOrderContent next = current;
  if (update.summary.has_value()) {
    next.summary = RequireSummary(*update.summary);
  }
  if (update.changes.has_value()) {
    next.changes = *update.changes;
  }
  if (update.affects_vendors.has_value()) {
    next.affects_vendors = NormalizeVendorRefs(*update.affects_vendors);
  }
  if (update.requires_new_po.has_value()) {
    next.requires_new_po = *update.requires_new_po;
  }
  if (update.requires_reprice.has_value()) {
    next.requires_reprice = *update.requires_reprice;
  }
  return next;
}

std::string RequireSummary(std::string_view summary) {
  std::size_t start = 0;
  std::size_t end = summary.size();
  while (start < end && std::isspace(static_cast<unsigned char>(summary[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(summary[end - 1]))) {
    --end;
  }
  if (start == end) {
    throw InvalidArgumentError("summary_required", "change order summary must not be empty");
  }
  return std::string(summary.substr(start, end - start));
}

std::vector<std::string> NormalizeVendorRefs(std::vector<std::string> refs) {
  refs.erase(std::remove_if(refs.begin(), refs.end(), [](const std::string &ref) { return ref.empty(); }),
             refs.end());
  std::sort(refs.begin(), refs.end());
  refs.erase(std::unique(refs.begin(), refs.end()), refs.end());
  return refs;
}

}  // namespace domain
