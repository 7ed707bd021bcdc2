#ifndef PRINTBROKER_JOBS_HTTP_MAPPING_H
#define PRINTBROKER_JOBS_HTTP_MAPPING_H

#include <exception>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../common/domain/change_order_workflow.h"
#include "../../common/domain/component_suggestions.h"
#include "../../common/domain/component_validation.h"
#include "../../common/domain/job_classification.h"
#include "../../common/domain/job_identifiers.h"
#include "../../common/persistence/audit_repository.h"
#include "../../common/persistence/change_orders_repository.h"
#include "../../common/persistence/jobs_repository.h"

namespace jobs_http {

using json = nlohmann::json;

// Empty bodies read as {}; anything but an object is rejected.
json ParseBody(const std::string &body);

json IdentifiersToJson(const domain::JobIdentifiers &identifiers);
json JobToJson(const persistence::JobRecord &job);
json ComponentToJson(const domain::JobComponent &component);
json ComponentRecordToJson(const persistence::ComponentRecord &record);
json SuggestionToJson(const domain::SuggestedComponent &suggestion);
json IssuesToJson(const std::vector<domain::ValidationIssue> &issues);
json ChangeOrderToJson(const persistence::ChangeOrderRecord &record);
json IntegrityToJson(const persistence::IntegrityReport &report);
json EffectiveStateToJson(const persistence::EffectiveJobState &state);
json AuditEventToJson(const persistence::AuditEvent &event);

// The parsers below throw InvalidArgumentError (or ChangeSetError for the
// changes payload) for values they cannot map.
domain::JobClassification ParseClassification(const json &body);
persistence::ComponentInput ParseComponentInput(const json &item);
std::vector<persistence::ComponentInput> ParseComponentInputs(const json &items);
// Components sent for validation only; unset flags use the type defaults.
std::vector<domain::JobComponent> ParseComponents(const json &items);
persistence::JobCreateInput ParseJobCreateInput(const json &body);
persistence::ChangeOrderCreateInput ParseChangeOrderCreateInput(const std::string &job_id, const json &body);
domain::ChangeOrderUpdate ParseChangeOrderUpdate(const json &body);

int StatusForError(const std::exception &error);
json ErrorBody(const std::exception &error);

}  // namespace jobs_http

#endif  // PRINTBROKER_JOBS_HTTP_MAPPING_H
