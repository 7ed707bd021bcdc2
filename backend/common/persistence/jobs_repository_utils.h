#ifndef PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_UTILS_H
#define PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_UTILS_H

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jobs_repository.h"

namespace persistence::detail {

struct JobRowData {
  std::string id;
  std::string base_job_id;
  std::int64_t master_seq = 0;
  std::string job_type_code;
  std::string status;
  std::optional<std::string> title;
  std::optional<std::string> customer_id;
  std::optional<std::string> job_meta_type;
  std::optional<std::string> mail_format;
  std::optional<std::string> job_type;
  std::optional<int> envelope_components;
  std::optional<std::string> routing_type;
  std::optional<std::string> pathway;
  std::optional<std::string> specs_json;
  std::optional<int> effective_co_version;
  std::optional<std::string> created_at;
  std::optional<std::string> updated_at;
};

struct ComponentRowData {
  std::string id;
  std::string job_id;
  std::string name;
  std::optional<std::string> type;
  std::optional<std::string> description;
  std::optional<std::string> owner;
  std::optional<std::string> vendor_id;
  std::optional<bool> artwork_required;
  std::optional<bool> data_required;
  std::optional<int> sort_order;
  std::optional<std::string> status;
};

JobRecord BuildJobRecord(const JobRowData &data);

// Rows written before components were typed carry a free-text name and a
// supplier label; those fall back to keyword inference.
ComponentRecord BuildComponentRecord(const ComponentRowData &data);

// Component as it will be stored, defaults applied.
domain::JobComponent BuildComponent(const ComponentInput &input, int position);

std::vector<domain::JobComponent> BuildComponents(const std::vector<ComponentInput> &inputs);

// Explicit codes are validated, empty ones derived from the classification.
std::string ResolveJobTypeCode(const std::string &requested, const domain::JobClassification &classification);

// Canonical 8-4-4-4-12 hex form; anything else cannot name a stored row.
bool LooksLikeUuid(const std::string &value);

nlohmann::json ParseJsonObject(const std::optional<std::string> &text);

}  // namespace persistence::detail

#endif  // PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_UTILS_H
