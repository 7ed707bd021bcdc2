#ifndef PRINTBROKER_PERSISTENCE_JOB_QUERIES_H
#define PRINTBROKER_PERSISTENCE_JOB_QUERIES_H

#include <optional>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "jobs_repository.h"

namespace persistence::detail {

// Empty strings are stored as SQL null.
std::optional<std::string> NullIfEmpty(const std::string &value);

// Reads the job, optionally taking its row lock for the rest of the
// transaction. Throws NotFoundError for unknown or malformed ids.
JobRecord LoadJob(pqxx::transaction_base &txn, const std::string &job_id, bool for_update);

// Looks a job up by its human-facing base job id. Returns nullopt when no
// job carries it.
std::optional<JobRecord> FindJobByBaseId(pqxx::transaction_base &txn, const std::string &base_job_id);

bool BaseJobIdExists(pqxx::transaction_base &txn, const std::string &base_job_id);

std::vector<ComponentRecord> LoadComponents(pqxx::work &txn, const std::string &job_id);

ComponentRecord InsertComponent(pqxx::work &txn, const std::string &job_id, const domain::JobComponent &component);

}  // namespace persistence::detail

#endif  // PRINTBROKER_PERSISTENCE_JOB_QUERIES_H
