#ifndef PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_H
#define PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../domain/component_validation.h"
#include "../domain/components.h"
#include "../domain/job_classification.h"
#include "../domain/job_identifiers.h"

namespace persistence {

class PostgresConfig;

constexpr char kJobStatusDraft[] = "DRAFT";
constexpr char kJobStatusActive[] = "ACTIVE";

// Caller-supplied component. Unset flags come from the type defaults and an
// unset sort order from the position in the list.
struct ComponentInput {
  domain::ComponentType type = domain::ComponentType::kOther;
  std::string name;
  std::string description;
  domain::ComponentOwner owner = domain::ComponentOwner::kInternal;
  std::string vendor_id;
  std::optional<bool> artwork_required;
  std::optional<bool> data_required;
  std::optional<int> sort_order;
  std::optional<std::string> status;
};

struct ComponentRecord {
  std::string id;
  std::string job_id;
  domain::JobComponent component;
};

struct JobCreateInput {
  std::string title;
  std::string customer_id;
  // Derived from the classification when empty.
  std::string job_type_code;
  domain::JobClassification classification;
  std::string routing_type;
  std::string pathway;
  nlohmann::json specs = nlohmann::json::object();
  // Unset seeds the suggested components for the classification.
  std::optional<std::vector<ComponentInput>> components;
};

struct JobRecord {
  std::string id;
  std::string title;
  std::string customer_id;
  std::string base_job_id;
  std::int64_t master_seq = 0;
  std::string job_type_code;
  domain::JobClassification classification;
  std::string routing_type;
  std::string pathway;
  std::string status;
  nlohmann::json specs = nlohmann::json::object();
  std::optional<int> effective_co_version;
  std::string created_at;
  std::string updated_at;
};

struct JobCreateResult {
  JobRecord job;
  std::vector<ComponentRecord> components;
  // Advisory; creation never fails on them.
  std::vector<domain::ValidationIssue> issues;
};

class JobsRepository {
 public:
  JobsRepository(std::shared_ptr<PostgresConfig> config, domain::IdentifierPolicy policy);

  // Reserves identifiers without creating a job.
  domain::JobIdentifiers AllocateJobIdentifiers(const std::string &job_type_code) const;
  JobCreateResult CreateJob(const JobCreateInput &input) const;
  // Throws NotFoundError.
  JobRecord GetJobById(const std::string &id) const;
  // Accepts either the job uuid or its base job id (e.g. BK000042).
  JobRecord FindJob(const std::string &reference) const;
  std::vector<ComponentRecord> ListComponents(const std::string &job_id) const;
  std::vector<ComponentRecord> ReplaceComponents(const std::string &job_id,
                                                 const std::vector<ComponentInput> &components) const;
  // DRAFT -> ACTIVE once the stored components validate clean.
  JobRecord ActivateJob(const std::string &job_id) const;

 private:
  std::shared_ptr<PostgresConfig> config_;
  domain::IdentifierPolicy policy_;
};

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_JOBS_REPOSITORY_H
