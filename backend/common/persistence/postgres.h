#ifndef PRINTBROKER_PERSISTENCE_POSTGRES_H
#define PRINTBROKER_PERSISTENCE_POSTGRES_H

#include <pqxx/pqxx>

#include <memory>
#include <string>

namespace persistence {

struct TransactionSettings {
  // Attempts per operation when a transaction loses a lock or counter race.
  int max_attempts = 5;
  // Applied with "set local lock_timeout"; 0 waits forever.
  int lock_timeout_ms = 5000;
};

class PostgresConfig {
 public:
  explicit PostgresConfig(std::string conninfo, TransactionSettings settings = {});

  const std::string &ConnInfo() const;
  const TransactionSettings &Settings() const;
  pqxx::connection Connect() const;

 private:
  std::string conninfo_;
  TransactionSettings settings_;
};

std::shared_ptr<PostgresConfig> MakePostgresConfigFromEnv(const std::string &env_var,
                                                          const std::string &default_url,
                                                          TransactionSettings settings = {});

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_POSTGRES_H
