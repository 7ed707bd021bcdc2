#include "postgres.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace persistence {

PostgresConfig::PostgresConfig(std::string conninfo, TransactionSettings settings)
    : conninfo_(std::move(conninfo)), settings_(settings) {
  if (conninfo_.empty()) {
    throw std::invalid_argument("connection string must not be empty");
  }
  settings_.max_attempts = std::max(1, settings_.max_attempts);
  settings_.lock_timeout_ms = std::max(0, settings_.lock_timeout_ms);
}

const std::string &PostgresConfig::ConnInfo() const {
  return conninfo_;
}

const TransactionSettings &PostgresConfig::Settings() const {
  return settings_;
}

pqxx::connection PostgresConfig::Connect() const {
  return pqxx::connection(conninfo_);
}

std::shared_ptr<PostgresConfig> MakePostgresConfigFromEnv(const std::string &env_var,
                                                          const std::string &default_url,
                                                          TransactionSettings settings) {
  const char *value = std::getenv(env_var.c_str());
  std::string conninfo = (value && *value) ? std::string(value) : default_url;
  return std::make_shared<PostgresConfig>(std::move(conninfo), settings);
}

}  // namespace persistence
