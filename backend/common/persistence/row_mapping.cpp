#include "row_mapping.h"

#include <cstdint>
#include <optional>
#include <string>

#include "change_orders_repository_utils.h"
#include "jobs_repository_utils.h"

namespace persistence::detail {

namespace {

std::optional<std::string> OptionalText(const pqxx::field &field) {
  if (field.is_null()) {
    return std::nullopt;
  }
  return std::string(field.c_str());
}

template <typename T>
std::optional<T> OptionalValue(const pqxx::field &field) {
  if (field.is_null()) {
    return std::nullopt;
  }
  return field.as<T>();
}

}  // namespace

JobRecord RowToJob(const pqxx::row &row) {
  JobRowData data;
  data.id = row["id"].c_str();
  data.base_job_id = row["base_job_id"].c_str();
  data.master_seq = row["master_seq"].as<std::int64_t>();
  data.job_type_code = row["job_type_code"].c_str();
  data.status = row["status"].c_str();
  data.title = OptionalText(row["title"]);
  data.customer_id = OptionalText(row["customer_id"]);
  data.job_meta_type = OptionalText(row["job_meta_type"]);
  data.mail_format = OptionalText(row["mail_format"]);
  data.job_type = OptionalText(row["job_type"]);
  data.envelope_components = OptionalValue<int>(row["envelope_components"]);
  data.routing_type = OptionalText(row["routing_type"]);
  data.pathway = OptionalText(row["pathway"]);
  data.specs_json = OptionalText(row["specs"]);
  data.effective_co_version = OptionalValue<int>(row["effective_co_version"]);
  data.created_at = OptionalText(row["created_at"]);
  data.updated_at = OptionalText(row["updated_at"]);
  return BuildJobRecord(data);
}

ChangeOrderRecord RowToChangeOrder(const pqxx::row &row) {
  ChangeOrderRowData data;
  data.id = row["id"].c_str();
  data.job_id = row["job_id"].c_str();
  data.version = row["version"].as<int>();
  data.change_order_no = row["change_order_no"].c_str();
  data.status = row["status"].c_str();
  data.summary = row["summary"].c_str();
  data.changes_json = OptionalText(row["changes"]);
  data.affects_vendors_json = OptionalText(row["affects_vendors"]);
  data.requires_new_po = row["requires_new_po"].as<bool>();
  data.requires_reprice = row["requires_reprice"].as<bool>();
  data.approved_at = OptionalText(row["approved_at"]);
  data.approved_by = OptionalText(row["approved_by"]);
  data.rejected_at = OptionalText(row["rejected_at"]);
  data.rejection_reason = OptionalText(row["rejection_reason"]);
  data.content_digest = OptionalText(row["content_digest"]);
  data.created_at = OptionalText(row["created_at"]);
  data.updated_at = OptionalText(row["updated_at"]);
  return BuildChangeOrderRecord(data);
}

ComponentRecord RowToComponent(const pqxx::row &row) {
  ComponentRowData data;
  data.id = row["id"].c_str();
  data.job_id = row["job_id"].c_str();
  data.name = row["name"].c_str();
  data.type = OptionalText(row["type"]);
  data.description = OptionalText(row["description"]);
  data.owner = OptionalText(row["owner"]);
  data.vendor_id = OptionalText(row["vendor_id"]);
  data.artwork_required = OptionalValue<bool>(row["artwork_required"]);
  data.data_required = OptionalValue<bool>(row["data_required"]);
  data.sort_order = OptionalValue<int>(row["sort_order"]);
  data.status = OptionalText(row["status"]);
  return BuildComponentRecord(data);
}

}  // namespace persistence::detail
