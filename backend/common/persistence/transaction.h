#ifndef PRINTBROKER_PERSISTENCE_TRANSACTION_H
#define PRINTBROKER_PERSISTENCE_TRANSACTION_H

#include <string>
#include <string_view>

#include <pqxx/pqxx>

#include "../domain/errors.h"
#include "postgres.h"

namespace persistence {
namespace detail {

// Serialization failures, deadlocks, unique violations and lock timeouts.
bool IsRetryableConflict(std::string_view sqlstate);

void ApplyLockTimeout(pqxx::work &txn, int lock_timeout_ms);

void LogConflict(std::string_view operation, int attempt, int max_attempts, const pqxx::sql_error &error);

}  // namespace detail

// Runs fn(txn) in a fresh transaction on its own connection and commits.
// Conflicts with concurrent writers roll the attempt back and start over;
// once the configured attempts are used up the conflict surfaces as
// domain::SequenceConflictError. Every other exception propagates as is.
template <typename Fn>
auto RunInTransaction(const PostgresConfig &config, std::string_view operation, Fn &&fn) {
  const int max_attempts = config.Settings().max_attempts;
  for (int attempt = 1;; ++attempt) {
    try {
      pqxx::connection conn = config.Connect();
      pqxx::work txn(conn);
      detail::ApplyLockTimeout(txn, config.Settings().lock_timeout_ms);
      auto result = fn(txn);
      txn.commit();
      return result;
    } catch (const pqxx::sql_error &ex) {
      if (!detail::IsRetryableConflict(ex.sqlstate())) {
        throw;
      }
      detail::LogConflict(operation, attempt, max_attempts, ex);
      if (attempt >= max_attempts) {
        throw domain::SequenceConflictError(operation);
      }
    }
  }
}

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_TRANSACTION_H
