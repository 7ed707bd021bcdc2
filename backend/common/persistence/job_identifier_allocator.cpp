#include "job_identifier_allocator.h"

#include <utility>

#include "../domain/errors.h"

namespace persistence {

MasterSequenceCounter::MasterSequenceCounter(pqxx::work &txn) : txn_(txn) {}

std::int64_t MasterSequenceCounter::Next(const std::string &counter_key, std::int64_t first_value) {
  const auto row = txn_.exec_params1(
      "insert into master_sequences(id, current_value) values ($1, $2) "
      "on conflict (id) do update set current_value = master_sequences.current_value + 1, updated_at = now() "
      "returning current_value",
      counter_key, first_value);
  return row["current_value"].as<std::int64_t>();
}

SequenceSource MasterSequenceCounter::AsSource() {
  return [this](const std::string &counter_key, std::int64_t first_value) { return Next(counter_key, first_value); };
}

JobIdentifierAllocator::JobIdentifierAllocator(domain::IdentifierPolicy policy) : policy_(std::move(policy)) {}

domain::JobIdentifiers JobIdentifierAllocator::Allocate(const std::string &job_type_code,
                                                        const SequenceSource &next_value,
                                                        const BaseJobIdTaken &is_taken) const {
  domain::RequireValidTypeCode(job_type_code);
  const auto counter_key = domain::SequenceCounterKey(policy_, job_type_code);
  auto identifiers =
      domain::MakeJobIdentifiers(job_type_code, next_value(counter_key, policy_.sequence_start + 1), policy_);
  if (!is_taken) {
    return identifiers;
  }
  for (int skipped = 0; is_taken(identifiers.base_job_id); ++skipped) {
    if (skipped == kMaxSkippedValues) {
      throw domain::IdentifierCollisionError(counter_key, identifiers.base_job_id);
    }
    identifiers =
        domain::MakeJobIdentifiers(job_type_code, next_value(counter_key, policy_.sequence_start + 1), policy_);
  }
  return identifiers;
}

}  // namespace persistence
