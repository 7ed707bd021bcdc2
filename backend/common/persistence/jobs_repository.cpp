#include "jobs_repository.h"

#include <utility>

#include "../domain/component_suggestions.h"
#include "../domain/errors.h"
#include "../logger.h"
#include "job_identifier_allocator.h"
#include "job_queries.h"
#include "jobs_repository_utils.h"
#include "postgres.h"
#include "row_mapping.h"
#include "transaction.h"

namespace persistence {
namespace {

logging::ServiceLogger &Logger() {
  return logging::ServiceLogger::Instance("persistence");
}

std::vector<domain::JobComponent> InitialComponents(const JobCreateInput &input) {
  if (input.components.has_value()) {
    return detail::BuildComponents(*input.components);
  }
  std::vector<domain::JobComponent> components;
  for (const auto &suggestion : domain::SuggestComponents(input.classification)) {
    components.push_back(domain::ToJobComponent(suggestion));
  }
  return components;
}

std::optional<std::string> OptionalEnum(std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return std::string(value);
}

BaseJobIdTaken TakenIn(pqxx::work &txn) {
  return [&txn](const std::string &base_job_id) { return detail::BaseJobIdExists(txn, base_job_id); };
}

}  // namespace

JobsRepository::JobsRepository(std::shared_ptr<PostgresConfig> config, domain::IdentifierPolicy policy)
    : config_(std::move(config)), policy_(std::move(policy)) {}

domain::JobIdentifiers JobsRepository::AllocateJobIdentifiers(const std::string &job_type_code) const {
  domain::RequireValidTypeCode(job_type_code);
  const JobIdentifierAllocator allocator(policy_);
  auto identifiers = RunInTransaction(*config_, "allocate_job_identifiers", [&](pqxx::work &txn) {
    MasterSequenceCounter counter(txn);
    return allocator.Allocate(job_type_code, counter.AsSource(), TakenIn(txn));
  });
  Logger().Info("job_identifiers_reserved",
                {{"baseJobId", identifiers.base_job_id}, {"masterSeq", identifiers.master_seq}});
  return identifiers;
}

JobCreateResult JobsRepository::CreateJob(const JobCreateInput &input) const {
  if (!input.specs.is_object()) {
    throw domain::InvalidArgumentError("invalid_specs", "specs must be a JSON object");
  }
  const auto type_code = detail::ResolveJobTypeCode(input.job_type_code, input.classification);
  const auto components = InitialComponents(input);
  const auto issues = domain::ValidateComponents(components);
  const JobIdentifierAllocator allocator(policy_);
  const auto &classification = input.classification;

  auto result = RunInTransaction(*config_, "create_job", [&](pqxx::work &txn) {
    MasterSequenceCounter counter(txn);
    const auto identifiers = allocator.Allocate(type_code, counter.AsSource(), TakenIn(txn));
    const auto row = txn.exec_params1(
        std::string("insert into jobs(title, customer_id, base_job_id, master_seq, job_type_code, job_meta_type, "
                    "mail_format, job_type, envelope_components, routing_type, pathway, status, specs) "
                    "values ($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13::jsonb) returning ") +
            detail::kJobColumns,
        detail::NullIfEmpty(input.title), detail::NullIfEmpty(input.customer_id), identifiers.base_job_id,
        identifiers.master_seq, identifiers.job_type_code, OptionalEnum(domain::ToString(classification.meta_type)),
        OptionalEnum(domain::ToString(classification.mail_format)),
        OptionalEnum(domain::ToString(classification.job_type)), classification.envelope_components,
        detail::NullIfEmpty(input.routing_type), detail::NullIfEmpty(input.pathway), std::string(kJobStatusDraft),
        input.specs.dump());
    JobCreateResult created;
    created.job = detail::RowToJob(row);
    for (const auto &component : components) {
      created.components.push_back(detail::InsertComponent(txn, created.job.id, component));
    }
    return created;
  });
  result.issues = issues;
  Logger().Info("job_created", {{"jobId", result.job.id},
                                {"baseJobId", result.job.base_job_id},
                                {"components", result.components.size()},
                                {"issues", result.issues.size()}});
  return result;
}

JobRecord JobsRepository::GetJobById(const std::string &id) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  return detail::LoadJob(txn, id, false);
}

JobRecord JobsRepository::FindJob(const std::string &reference) const {
  if (detail::LooksLikeUuid(reference)) {
    return GetJobById(reference);
  }
  if (!domain::ParseBaseJobId(reference, policy_).has_value()) {
    throw domain::NotFoundError("job", reference);
  }
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  auto job = detail::FindJobByBaseId(txn, reference);
  if (!job.has_value()) {
    throw domain::NotFoundError("job", reference);
  }
  return *job;
}

std::vector<ComponentRecord> JobsRepository::ListComponents(const std::string &job_id) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  detail::LoadJob(txn, job_id, false);
  return detail::LoadComponents(txn, job_id);
}

std::vector<ComponentRecord> JobsRepository::ReplaceComponents(const std::string &job_id,
                                                               const std::vector<ComponentInput> &components) const {
  const auto prepared = detail::BuildComponents(components);
  return RunInTransaction(*config_, "replace_components", [&](pqxx::work &txn) {
    detail::LoadJob(txn, job_id, true);
    txn.exec_params("delete from job_components where job_id=$1", job_id);
    std::vector<ComponentRecord> stored;
    stored.reserve(prepared.size());
    for (const auto &component : prepared) {
      stored.push_back(detail::InsertComponent(txn, job_id, component));
    }
    txn.exec_params("update jobs set updated_at=now() where id=$1", job_id);
    return stored;
  });
}

JobRecord JobsRepository::ActivateJob(const std::string &job_id) const {
  return RunInTransaction(*config_, "activate_job", [&](pqxx::work &txn) {
    const auto job = detail::LoadJob(txn, job_id, true);
    if (job.status != kJobStatusDraft) {
      throw domain::InvalidTransitionError("activate", "job", job.status);
    }
    std::vector<domain::JobComponent> components;
    for (auto &record : detail::LoadComponents(txn, job_id)) {
      components.push_back(std::move(record.component));
    }
    auto issues = domain::ValidateComponents(components);
    if (!issues.empty()) {
      throw domain::ValidationFailedError(std::move(issues));
    }
    const auto row = txn.exec_params1(
        std::string("update jobs set status=$2, updated_at=now() where id=$1 returning ") + detail::kJobColumns,
        job_id, std::string(kJobStatusActive));
    return detail::RowToJob(row);
  });
}

}  // namespace persistence
