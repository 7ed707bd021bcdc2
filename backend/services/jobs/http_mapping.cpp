#include "http_mapping.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

#include "../../common/domain/errors.h"
#include "../../common/persistence/jobs_repository_utils.h"

namespace jobs_http {
namespace {

template <typename T>
json OptionalToJson(const std::optional<T> &value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

json EnumToJson(std::string_view value) {
  if (value.empty()) {
    return nullptr;
  }
  return std::string(value);
}

std::optional<std::string> OptionalString(const json &body, const char *key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw domain::InvalidArgumentError("invalid_field", std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<bool> OptionalBool(const json &body, const char *key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    throw domain::InvalidArgumentError("invalid_field", std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

std::optional<int> OptionalInt(const json &body, const char *key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw domain::InvalidArgumentError("invalid_field", std::string(key) + " must be an integer");
  }
  const bool in_range = it->is_number_unsigned()
                            ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                            : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                  it->get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    throw domain::InvalidArgumentError("invalid_field", std::string(key) + " is out of range");
  }
  return it->get<int>();
}

template <typename Enum, typename Parser>
Enum ParseEnumField(const json &body, const char *key, Parser parse, Enum fallback, const char *code) {
  const auto raw = OptionalString(body, key);
  if (!raw.has_value()) {
    return fallback;
  }
  const auto parsed = parse(*raw);
  if (!parsed.has_value()) {
    throw domain::InvalidArgumentError(code, "unknown " + std::string(key) + " '" + *raw + "'");
  }
  return *parsed;
}

std::vector<std::string> ParseStringList(const json &body, const char *key) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return {};
  }
  if (!it->is_array()) {
    throw domain::InvalidArgumentError("invalid_field", std::string(key) + " must be an array of strings");
  }
  std::vector<std::string> values;
  for (const auto &item : *it) {
    if (!item.is_string()) {
      throw domain::InvalidArgumentError("invalid_field", std::string(key) + " must be an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

domain::ComponentType ParseTypeOrInfer(const json &item) {
  const auto raw = OptionalString(item, "type");
  if (!raw.has_value()) {
    return domain::InferComponentType(OptionalString(item, "name").value_or(""));
  }
  const auto parsed = domain::ParseComponentType(*raw);
  if (!parsed.has_value()) {
    throw domain::InvalidArgumentError("invalid_component_type", "unknown component type '" + *raw + "'");
  }
  return *parsed;
}

// An explicit owner wins; otherwise a legacy supplier label decides.
domain::ComponentOwner ParseOwner(const json &item) {
  if (const auto raw = OptionalString(item, "owner")) {
    const auto parsed = domain::ParseComponentOwner(*raw);
    if (!parsed.has_value()) {
      throw domain::InvalidArgumentError("invalid_component_owner", "unknown component owner '" + *raw + "'");
    }
    return *parsed;
  }
  if (const auto supplier = OptionalString(item, "supplier")) {
    return domain::OwnerForSupplier(*supplier);
  }
  return domain::ComponentOwner::kInternal;
}

const json &RequireArray(const json &items, const char *what) {
  if (!items.is_array()) {
    throw domain::InvalidArgumentError("invalid_components", std::string(what) + " must be an array");
  }
  return items;
}

}  // namespace

json ParseBody(const std::string &body) {
  if (body.empty()) {
    return json::object();
  }
  auto parsed = json::parse(body);
  if (!parsed.is_object()) {
    throw domain::InvalidArgumentError("invalid_body", "request body must be a JSON object");
  }
  return parsed;
}

json IdentifiersToJson(const domain::JobIdentifiers &identifiers) {
  return json{{"baseJobId", identifiers.base_job_id},
              {"masterSeq", identifiers.master_seq},
              {"jobTypeCode", identifiers.job_type_code}};
}

json JobToJson(const persistence::JobRecord &job) {
  return json{{"id", job.id},
              {"title", job.title},
              {"customerId", job.customer_id},
              {"baseJobId", job.base_job_id},
              {"masterSeq", job.master_seq},
              {"jobTypeCode", job.job_type_code},
              {"jobMetaType", EnumToJson(domain::ToString(job.classification.meta_type))},
              {"mailFormat", EnumToJson(domain::ToString(job.classification.mail_format))},
              {"jobType", EnumToJson(domain::ToString(job.classification.job_type))},
              {"envelopeComponents", OptionalToJson(job.classification.envelope_components)},
              {"routingType", job.routing_type},
              {"pathway", job.pathway},
              {"status", job.status},
              {"specs", job.specs},
              {"effectiveCOVersion", OptionalToJson(job.effective_co_version)},
              {"createdAt", job.created_at},
              {"updatedAt", job.updated_at}};
}

json ComponentToJson(const domain::JobComponent &component) {
  return json{{"type", std::string(domain::ToString(component.type))},
              {"name", component.name},
              {"description", component.description},
              {"owner", std::string(domain::ToString(component.owner))},
              {"vendorId", component.vendor_id.empty() ? json(nullptr) : json(component.vendor_id)},
              {"artworkRequired", component.artwork_required},
              {"dataRequired", component.data_required},
              {"sortOrder", component.sort_order},
              {"status", component.status}};
}

json ComponentRecordToJson(const persistence::ComponentRecord &record) {
  auto payload = ComponentToJson(record.component);
  payload["id"] = record.id;
  payload["jobId"] = record.job_id;
  return payload;
}

json SuggestionToJson(const domain::SuggestedComponent &suggestion) {
  return json{{"type", std::string(domain::ToString(suggestion.type))},
              {"name", suggestion.name},
              {"description", suggestion.description},
              {"owner", std::string(domain::ToString(suggestion.owner))},
              {"artworkRequired", suggestion.artwork_required},
              {"dataRequired", suggestion.data_required},
              {"sortOrder", suggestion.sort_order}};
}

json IssuesToJson(const std::vector<domain::ValidationIssue> &issues) {
  json array = json::array();
  for (const auto &issue : issues) {
    json entry{{"code", issue.code}, {"message", issue.message}};
    if (issue.component_index.has_value()) {
      entry["componentIndex"] = *issue.component_index;
      entry["componentName"] = issue.component_name;
    }
    array.push_back(std::move(entry));
  }
  return array;
}

json ChangeOrderToJson(const persistence::ChangeOrderRecord &record) {
  return json{{"id", record.id},
              {"jobId", record.job_id},
              {"version", record.version},
              {"changeOrderNo", record.change_order_no},
              {"status", std::string(domain::ToString(record.status))},
              {"summary", record.content.summary},
              {"changes", record.content.changes.ToJson()},
              {"affectsVendors", record.content.affects_vendors},
              {"requiresNewPO", record.content.requires_new_po},
              {"requiresReprice", record.content.requires_reprice},
              {"approvedAt", OptionalToJson(record.approved_at)},
              {"approvedBy", OptionalToJson(record.approved_by)},
              {"rejectedAt", OptionalToJson(record.rejected_at)},
              {"rejectionReason", OptionalToJson(record.rejection_reason)},
              {"contentDigest", OptionalToJson(record.content_digest)},
              {"createdAt", record.created_at},
              {"updatedAt", record.updated_at}};
}

json IntegrityToJson(const persistence::IntegrityReport &report) {
  return json{{"changeOrderNo", report.change_order_no},
              {"status", std::string(domain::ToString(report.status))},
              {"sealed", report.sealed},
              {"storedDigest", report.stored_digest.empty() ? json(nullptr) : json(report.stored_digest)},
              {"computedDigest", report.computed_digest},
              {"intact", report.intact}};
}

json EffectiveStateToJson(const persistence::EffectiveJobState &state) {
  json latest = nullptr;
  if (state.latest_approved.has_value()) {
    const auto &record = *state.latest_approved;
    latest = json{{"id", record.id},
                  {"changeOrderNo", record.change_order_no},
                  {"version", record.version},
                  {"summary", record.content.summary},
                  {"approvedAt", OptionalToJson(record.approved_at)}};
  }
  return json{{"jobId", state.job_id},
              {"baseJobId", state.base_job_id},
              {"effectiveCOVersion", OptionalToJson(state.effective_co_version)},
              {"appliedVersions", state.applied_versions},
              {"latestApprovedCO", latest},
              {"baseSpecs", state.base_specs},
              {"specs", state.specs}};
}

json AuditEventToJson(const persistence::AuditEvent &event) {
  return json{{"id", event.id},
              {"actor", event.actor.empty() ? json(nullptr) : json(event.actor)},
              {"action", event.action},
              {"subject", event.subject},
              {"details", event.details},
              {"createdAt", event.created_at}};
}

domain::JobClassification ParseClassification(const json &body) {
  domain::JobClassification classification;
  classification.meta_type = ParseEnumField(body, "jobMetaType", domain::ParseJobMetaType,
                                            domain::JobMetaType::kUnspecified, "invalid_classification");
  classification.mail_format = ParseEnumField(body, "mailFormat", domain::ParseMailFormat,
                                              domain::MailFormat::kUnspecified, "invalid_classification");
  classification.job_type =
      ParseEnumField(body, "jobType", domain::ParseJobType, domain::JobType::kUnspecified, "invalid_classification");
  classification.envelope_components = OptionalInt(body, "envelopeComponents");
  classification.has_samples = OptionalBool(body, "hasSamples").value_or(false);
  classification.has_data = OptionalBool(body, "hasData").value_or(false);
  classification.has_versions = OptionalBool(body, "hasVersions").value_or(false);
  return classification;
}

persistence::ComponentInput ParseComponentInput(const json &item) {
  if (!item.is_object()) {
    throw domain::InvalidArgumentError("invalid_components", "each component must be an object");
  }
  persistence::ComponentInput input;
  input.type = ParseTypeOrInfer(item);
  input.name = OptionalString(item, "name").value_or("");
  input.description = OptionalString(item, "description").value_or("");
  input.owner = ParseOwner(item);
  input.vendor_id = OptionalString(item, "vendorId").value_or("");
  input.artwork_required = OptionalBool(item, "artworkRequired");
  input.data_required = OptionalBool(item, "dataRequired");
  input.sort_order = OptionalInt(item, "sortOrder");
  input.status = OptionalString(item, "status");
  return input;
}

std::vector<persistence::ComponentInput> ParseComponentInputs(const json &items) {
  std::vector<persistence::ComponentInput> inputs;
  for (const auto &item : RequireArray(items, "components")) {
    inputs.push_back(ParseComponentInput(item));
  }
  return inputs;
}

std::vector<domain::JobComponent> ParseComponents(const json &items) {
  return persistence::detail::BuildComponents(ParseComponentInputs(items));
}

persistence::JobCreateInput ParseJobCreateInput(const json &body) {
  persistence::JobCreateInput input;
  input.title = OptionalString(body, "title").value_or("");
  input.customer_id = OptionalString(body, "customerId").value_or("");
  input.job_type_code = OptionalString(body, "jobTypeCode").value_or("");
  input.classification = ParseClassification(body);
  input.routing_type = OptionalString(body, "routingType").value_or("");
  input.pathway = OptionalString(body, "pathway").value_or("");
  if (const auto specs = body.find("specs"); specs != body.end() && !specs->is_null()) {
    input.specs = *specs;
  }
  if (const auto components = body.find("components"); components != body.end() && !components->is_null()) {
    input.components = ParseComponentInputs(*components);
  }
  return input;
}

persistence::ChangeOrderCreateInput ParseChangeOrderCreateInput(const std::string &job_id, const json &body) {
  persistence::ChangeOrderCreateInput input;
  input.job_id = job_id;
  input.summary = OptionalString(body, "summary").value_or("");
  input.changes = domain::ChangeSet::FromJson(body.value("changes", json()));
  input.affects_vendors = ParseStringList(body, "affectsVendors");
  input.requires_new_po = OptionalBool(body, "requiresNewPO").value_or(false);
  input.requires_reprice = OptionalBool(body, "requiresReprice").value_or(false);
  return input;
}

domain::ChangeOrderUpdate ParseChangeOrderUpdate(const json &body) {
  if (body.contains("status")) {
    throw domain::InvalidArgumentError("status_not_updatable",
                                       "status changes go through submit, withdraw, approve and reject");
  }
  domain::ChangeOrderUpdate update;
  update.summary = OptionalString(body, "summary");
  if (const auto changes = body.find("changes"); changes != body.end()) {
    update.changes = domain::ChangeSet::FromJson(*changes);
  }
  if (body.contains("affectsVendors")) {
    update.affects_vendors = ParseStringList(body, "affectsVendors");
  }
  update.requires_new_po = OptionalBool(body, "requiresNewPO");
  update.requires_reprice = OptionalBool(body, "requiresReprice");
  update.version = OptionalInt(body, "version");
  return update;
}

int StatusForError(const std::exception &error) {
  if (dynamic_cast<const domain::ValidationFailedError *>(&error)) {
    return 422;
  }
  if (dynamic_cast<const domain::NotFoundError *>(&error)) {
    return 404;
  }
  if (dynamic_cast<const domain::ImmutableRecordError *>(&error)) {
    return 423;
  }
  if (dynamic_cast<const domain::InvalidTransitionError *>(&error) ||
      dynamic_cast<const domain::OpenChangeOrderError *>(&error) ||
      dynamic_cast<const domain::IdentifierCollisionError *>(&error)) {
    return 409;
  }
  if (dynamic_cast<const domain::SequenceConflictError *>(&error)) {
    return 503;
  }
  if (dynamic_cast<const domain::InvalidArgumentError *>(&error) ||
      dynamic_cast<const domain::ChangeSetError *>(&error) || dynamic_cast<const json::exception *>(&error)) {
    return 400;
  }
  return 500;
}

json ErrorBody(const std::exception &error) {
  if (const auto *failed = dynamic_cast<const domain::ValidationFailedError *>(&error)) {
    return json{{"error", failed->code()}, {"message", failed->what()}, {"issues", IssuesToJson(failed->issues())}};
  }
  if (const auto *domain_error = dynamic_cast<const domain::DomainError *>(&error)) {
    return json{{"error", domain_error->code()}, {"message", domain_error->what()}};
  }
  if (dynamic_cast<const json::exception *>(&error)) {
    return json{{"error", "invalid_json"}, {"message", error.what()}};
  }
  return json{{"error", "internal_server_error"}, {"message", "unexpected failure"}};
}

}  // namespace jobs_http
