#include "audit_repository.h"

#include "job_queries.h"
#include "jobs_repository_utils.h"

namespace persistence {

AuditRepository::AuditRepository(std::shared_ptr<PostgresConfig> config)
    : config_(std::move(config)) {}

void AuditRepository::RecordEvent(const std::string &actor_id, const std::string &action,
                                  const std::string &subject, const nlohmann::json &details,
                                  const std::string &ip_address) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  txn.exec_params("insert into audit_logs(actor, action, subject, details, ip) values ($1,$2,$3,$4::jsonb,$5)",
                  detail::NullIfEmpty(actor_id), action, subject, details.dump(), detail::NullIfEmpty(ip_address));
  txn.commit();
}

std::vector<AuditEvent> AuditRepository::ListEvents(const std::string &subject, int limit) const {
  pqxx::connection conn = config_->Connect();
  pqxx::work txn(conn);
  const auto result = txn.exec_params(
      "select id, actor, action, subject, details, ip, created_at from audit_logs where subject=$1 "
      "order by created_at asc, id asc limit $2",
      subject, limit);
  std::vector<AuditEvent> events;
  events.reserve(result.size());
  for (const auto &row : result) {
    AuditEvent event;
    event.id = row["id"].c_str();
    event.actor = row["actor"].is_null() ? std::string{} : row["actor"].c_str();
    event.action = row["action"].c_str();
    event.subject = row["subject"].c_str();
    event.details = detail::ParseJsonObject(
        row["details"].is_null() ? std::nullopt : std::optional<std::string>(row["details"].c_str()));
    event.ip_address = row["ip"].is_null() ? std::string{} : row["ip"].c_str();
    event.created_at = row["created_at"].is_null() ? std::string{} : row["created_at"].c_str();
    events.push_back(std::move(event));
  }
  return events;
}

}  // namespace persistence
