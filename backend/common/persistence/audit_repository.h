#ifndef PRINTBROKER_PERSISTENCE_AUDIT_REPOSITORY_H
#define PRINTBROKER_PERSISTENCE_AUDIT_REPOSITORY_H

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

#include "postgres.h"

namespace persistence {

struct AuditEvent {
  std::string id;
  std::string actor;
  std::string action;
  std::string subject;
  nlohmann::json details = nlohmann::json::object();
  std::string ip_address;
  std::string created_at;
};

// Append-only log of job and change-order events.
class AuditRepository {
 public:
  explicit AuditRepository(std::shared_ptr<PostgresConfig> config);

  void RecordEvent(const std::string &actor_id, const std::string &action, const std::string &subject,
                   const nlohmann::json &details, const std::string &ip_address = {}) const;
  // Oldest first.
  std::vector<AuditEvent> ListEvents(const std::string &subject, int limit) const;

 private:
  std::shared_ptr<PostgresConfig> config_;
};

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_AUDIT_REPOSITORY_H
