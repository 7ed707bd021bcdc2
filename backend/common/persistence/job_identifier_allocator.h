#ifndef PRINTBROKER_PERSISTENCE_JOB_IDENTIFIER_ALLOCATOR_H
#define PRINTBROKER_PERSISTENCE_JOB_IDENTIFIER_ALLOCATOR_H

#include <cstdint>
#include <functional>
#include <string>

#include <pqxx/pqxx>

#include "../domain/job_identifiers.h"

namespace persistence {

// Returns the next value of the named counter. A counter that does not exist
// yet starts at first_value.
using SequenceSource = std::function<std::int64_t(const std::string &counter_key, std::int64_t first_value)>;

// Reports whether a base job id is already stored.
using BaseJobIdTaken = std::function<bool(const std::string &base_job_id)>;

// Counter rows in master_sequences. Next() bumps the row with a single upsert,
// which keeps the row locked until the surrounding transaction ends, so
// concurrent callers queue up behind each other and never see the same value.
class MasterSequenceCounter {
 public:
  explicit MasterSequenceCounter(pqxx::work &txn);

  std::int64_t Next(const std::string &counter_key, std::int64_t first_value);
  SequenceSource AsSource();

 private:
  pqxx::work &txn_;
};

class JobIdentifierAllocator {
 public:
  explicit JobIdentifierAllocator(domain::IdentifierPolicy policy);

  // Throws InvalidArgumentError before touching the counter when the type
  // code is malformed. When is_taken is set, counter values whose base job id
  // already exists are skipped; IdentifierCollisionError is thrown after
  // kMaxSkippedValues consecutive collisions.
  domain::JobIdentifiers Allocate(const std::string &job_type_code, const SequenceSource &next_value,
                                  const BaseJobIdTaken &is_taken = {}) const;

  static constexpr int kMaxSkippedValues = 1000;

  const domain::IdentifierPolicy &policy() const { return policy_; }

 private:
  domain::IdentifierPolicy policy_;
};

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_JOB_IDENTIFIER_ALLOCATOR_H
