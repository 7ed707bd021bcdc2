#include "transaction.h"

#include "../logger.h"

namespace persistence::detail {

namespace {

constexpr char kSerializationFailure[] = "40001";
constexpr char kDeadlockDetected[] = "40P01";
constexpr char kUniqueViolation[] = "23505";
constexpr char kLockNotAvailable[] = "55P03";

}  // namespace

bool IsRetryableConflict(std::string_view sqlstate) {
  return sqlstate == kSerializationFailure || sqlstate == kDeadlockDetected || sqlstate == kUniqueViolation ||
         sqlstate == kLockNotAvailable;
}

void ApplyLockTimeout(pqxx::work &txn, int lock_timeout_ms) {
  txn.exec("set local lock_timeout = " + std::to_string(lock_timeout_ms));
}

void LogConflict(std::string_view operation, int attempt, int max_attempts, const pqxx::sql_error &error) {
  auto &logger = logging::ServiceLogger::Instance("persistence");
  const nlohmann::json context = {{"operation", std::string(operation)},
                                  {"attempt", attempt},
                                  {"maxAttempts", max_attempts},
                                  {"sqlstate", error.sqlstate()}};
  if (attempt >= max_attempts) {
    logger.Error("transaction_conflict_exhausted", context);
  } else {
    logger.Warn("transaction_conflict_retry", context);
  }
}

}  // namespace persistence::detail
