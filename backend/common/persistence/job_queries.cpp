#include "job_queries.h"

#include "../domain/errors.h"
#include "jobs_repository_utils.h"
#include "row_mapping.h"

namespace persistence::detail {

std::optional<std::string> NullIfEmpty(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

JobRecord LoadJob(pqxx::transaction_base &txn, const std::string &job_id, bool for_update) {
  if (!LooksLikeUuid(job_id)) {
    throw domain::NotFoundError("job", job_id);
  }
  std::string query = std::string("select ") + kJobColumns + " from jobs where id=$1";
  if (for_update) {
    query += " for update";
  }
  const auto result = txn.exec_params(query, job_id);
  if (result.empty()) {
    throw domain::NotFoundError("job", job_id);
  }
  return RowToJob(result[0]);
}

std::optional<JobRecord> FindJobByBaseId(pqxx::transaction_base &txn, const std::string &base_job_id) {
  const auto result =
      txn.exec_params(std::string("select ") + kJobColumns + " from jobs where base_job_id=$1", base_job_id);
  if (result.empty()) {
    return std::nullopt;
  }
  return RowToJob(result[0]);
}

bool BaseJobIdExists(pqxx::transaction_base &txn, const std::string &base_job_id) {
  return txn.exec_params1("select exists(select 1 from jobs where base_job_id=$1)", base_job_id)[0].as<bool>();
}

std::vector<ComponentRecord> LoadComponents(pqxx::work &txn, const std::string &job_id) {
  const auto result = txn.exec_params(
      std::string("select ") + kComponentColumns + " from job_components where job_id=$1 order by sort_order, id",
      job_id);
  std::vector<ComponentRecord> components;
  components.reserve(result.size());
  for (const auto &row : result) {
    components.push_back(RowToComponent(row));
  }
  return components;
}

ComponentRecord InsertComponent(pqxx::work &txn, const std::string &job_id, const domain::JobComponent &component) {
  const auto row = txn.exec_params1(
      std::string("insert into job_components(job_id, type, name, description, owner, vendor_id, artwork_required, "
                  "data_required, sort_order, status) values ($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) returning ") +
          kComponentColumns,
      job_id, std::string(domain::ToString(component.type)), component.name, NullIfEmpty(component.description),
      std::string(domain::ToString(component.owner)), NullIfEmpty(component.vendor_id), component.artwork_required,
      component.data_required, component.sort_order, component.status);
  return RowToComponent(row);
}

}  // namespace persistence::detail
