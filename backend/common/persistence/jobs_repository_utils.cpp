#include "jobs_repository_utils.h"

#include <cctype>

namespace persistence::detail {

namespace {

template <typename Enum, typename Parser>
Enum ParseOrUnspecified(const std::optional<std::string> &value, Parser parse, Enum fallback) {
  if (!value.has_value()) {
    return fallback;
  }
  return parse(*value).value_or(fallback);
}

}  // namespace

nlohmann::json ParseJsonObject(const std::optional<std::string> &text) {
  if (!text.has_value() || text->empty()) {
    return nlohmann::json::object();
  }
  try {
    auto parsed = nlohmann::json::parse(*text);
    if (parsed.is_object()) {
      return parsed;
    }
  } catch (const nlohmann::json::parse_error &) {
    // stored specs are opaque; an unreadable blob reads as empty
  }
  return nlohmann::json::object();
}

JobRecord BuildJobRecord(const JobRowData &data) {
  JobRecord record;
  record.id = data.id;
  record.title = data.title.value_or("");
  record.customer_id = data.customer_id.value_or("");
  record.base_job_id = data.base_job_id;
  record.master_seq = data.master_seq;
  record.job_type_code = data.job_type_code;
  record.classification.meta_type =
      ParseOrUnspecified(data.job_meta_type, domain::ParseJobMetaType, domain::JobMetaType::kUnspecified);
  record.classification.mail_format =
      ParseOrUnspecified(data.mail_format, domain::ParseMailFormat, domain::MailFormat::kUnspecified);
  record.classification.job_type =
      ParseOrUnspecified(data.job_type, domain::ParseJobType, domain::JobType::kUnspecified);
  record.classification.envelope_components = data.envelope_components;
  record.routing_type = data.routing_type.value_or("");
  record.pathway = data.pathway.value_or("");
  record.status = data.status;
  record.specs = ParseJsonObject(data.specs_json);
  record.effective_co_version = data.effective_co_version;
  record.created_at = data.created_at.value_or("");
  record.updated_at = data.updated_at.value_or("");
  return record;
}

ComponentRecord BuildComponentRecord(const ComponentRowData &data) {
  ComponentRecord record;
  record.id = data.id;
  record.job_id = data.job_id;
  auto &component = record.component;
  component.name = data.name;
  std::optional<domain::ComponentType> type;
  if (data.type.has_value()) {
    type = domain::ParseComponentType(*data.type);
  }
  component.type = type.value_or(domain::InferComponentType(data.name));
  component.description = data.description.value_or("");
  std::optional<domain::ComponentOwner> owner;
  if (data.owner.has_value()) {
    owner = domain::ParseComponentOwner(*data.owner);
    if (!owner.has_value()) {
      owner = domain::OwnerForSupplier(*data.owner);
    }
  }
  component.owner = owner.value_or(domain::ComponentOwner::kInternal);
  component.vendor_id = data.vendor_id.value_or("");
  const auto defaults = domain::ComponentDefaultsFor(component.type);
  component.artwork_required = data.artwork_required.value_or(defaults.artwork_required);
  component.data_required = data.data_required.value_or(defaults.data_required);
  component.sort_order = data.sort_order.value_or(0);
  component.status = data.status.value_or("PENDING");
  return record;
}

domain::JobComponent BuildComponent(const ComponentInput &input, int position) {
  const auto defaults = domain::ComponentDefaultsFor(input.type);
  domain::JobComponent component;
  component.type = input.type;
  component.name = input.name.empty() ? std::string(domain::ToString(input.type)) : input.name;
  component.description = input.description;
  component.owner = input.owner;
  component.vendor_id = input.vendor_id;
  component.artwork_required = input.artwork_required.value_or(defaults.artwork_required);
  component.data_required = input.data_required.value_or(defaults.data_required);
  component.sort_order = input.sort_order.value_or(position);
  if (input.status.has_value() && !input.status->empty()) {
    component.status = *input.status;
  }
  return component;
}

std::vector<domain::JobComponent> BuildComponents(const std::vector<ComponentInput> &inputs) {
  std::vector<domain::JobComponent> components;
  components.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    components.push_back(BuildComponent(inputs[i], static_cast<int>(i)));
  }
  return components;
}

std::string ResolveJobTypeCode(const std::string &requested, const domain::JobClassification &classification) {
  if (requested.empty()) {
    return domain::DeriveTypeCode(classification);
  }
  domain::RequireValidTypeCode(requested);
  return requested;
}

bool LooksLikeUuid(const std::string &value) {
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_slot) {
      if (value[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace persistence::detail
