#include "change_orders_repository_utils.h"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../domain/content_digest.h"

namespace persistence::detail {

namespace {

constexpr char kSystemApprover[] = "system";

}  // namespace

ChangeOrderRecord BuildChangeOrderRecord(const ChangeOrderRowData &data) {
  ChangeOrderRecord record;
  record.id = data.id;
  record.job_id = data.job_id;
  record.version = data.version;
  record.change_order_no = data.change_order_no;
  const auto status = domain::ParseChangeOrderStatus(data.status);
  if (!status.has_value()) {
    throw std::runtime_error("unknown_change_order_status");
  }
  record.status = *status;
  record.content.summary = data.summary;
  if (data.changes_json.has_value() && !data.changes_json->empty()) {
    record.content.changes = domain::ChangeSet::FromJson(nlohmann::json::parse(*data.changes_json));
  }
  record.content.affects_vendors = ParseStringArray(data.affects_vendors_json);
  record.content.requires_new_po = data.requires_new_po;
  record.content.requires_reprice = data.requires_reprice;
  record.approved_at = data.approved_at;
  record.approved_by = data.approved_by;
  record.rejected_at = data.rejected_at;
  record.rejection_reason = data.rejection_reason;
  record.content_digest = data.content_digest;
  record.created_at = data.created_at.value_or("");
  record.updated_at = data.updated_at.value_or("");
  return record;
}

std::string SerializeStringArray(const std::vector<std::string> &values) {
  nlohmann::json json_array = values;
  return json_array.dump();
}

std::vector<std::string> ParseStringArray(const std::optional<std::string> &json_payload) {
  if (!json_payload.has_value() || json_payload->empty()) {
    return {};
  }
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(*json_payload);
  } catch (const nlohmann::json::parse_error &) {
    return {};
  }
  if (!parsed.is_array()) {
    return {};
  }
  std::vector<std::string> values;
  values.reserve(parsed.size());
  for (const auto &item : parsed) {
    if (item.is_string()) {
      values.push_back(item.get<std::string>());
    }
  }
  return values;
}

std::string ResolveApprover(const std::string &approver_id) {
  const auto first = approver_id.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return kSystemApprover;
  }
  const auto last = approver_id.find_last_not_of(" \t\r\n");
  return approver_id.substr(first, last - first + 1);
}

IntegrityReport BuildIntegrityReport(const ChangeOrderRecord &record) {
  IntegrityReport report;
  report.change_order_no = record.change_order_no;
  report.status = record.status;
  report.computed_digest = domain::ChangeOrderDigest(record.content.summary, record.content.changes);
  report.sealed = record.status == domain::ChangeOrderStatus::kApproved && record.content_digest.has_value();
  report.stored_digest = record.content_digest.value_or("");
  report.intact = report.sealed && report.stored_digest == report.computed_digest;
  return report;
}

EffectiveJobState BuildEffectiveState(const JobRecord &job, std::vector<ChangeOrderRecord> change_orders) {
  change_orders.erase(std::remove_if(change_orders.begin(), change_orders.end(),
                                     [](const ChangeOrderRecord &record) {
                                       return record.status != domain::ChangeOrderStatus::kApproved;
                                     }),
                      change_orders.end());
  std::sort(change_orders.begin(), change_orders.end(),
            [](const ChangeOrderRecord &lhs, const ChangeOrderRecord &rhs) { return lhs.version < rhs.version; });

  EffectiveJobState state;
  state.job_id = job.id;
  state.base_job_id = job.base_job_id;
  state.effective_co_version = job.effective_co_version;
  std::vector<domain::ChangeSet> change_sets;
  change_sets.reserve(change_orders.size());
  for (const auto &record : change_orders) {
    state.applied_versions.push_back(record.version);
    change_sets.push_back(record.content.changes);
  }
  if (!change_orders.empty()) {
    state.latest_approved = change_orders.back();
  }
  state.base_specs = job.specs;
  state.specs = domain::MergeChangeSets(job.specs, change_sets);
  return state;
}

}  // namespace persistence::detail
