#ifndef PRINTBROKER_PERSISTENCE_CHANGE_ORDER_ALLOCATOR_H
#define PRINTBROKER_PERSISTENCE_CHANGE_ORDER_ALLOCATOR_H

#include <string>

#include <pqxx/pqxx>

#include "jobs_repository.h"

namespace persistence {

struct AllocatedChangeOrder {
  int version = 0;
  std::string change_order_no;
};

// Hands out the next change-order version of a job. The caller must hold the
// job's row lock (detail::LoadJob with for_update) so that concurrent
// creators queue on it and each sees the maximum committed before it; the
// unique (job_id, version) constraint catches anything that slips through.
class ChangeOrderAllocator {
 public:
  AllocatedChangeOrder AllocateNext(pqxx::work &txn, const JobRecord &locked_job) const;

  // Version and number that follow current_max for the job.
  static AllocatedChangeOrder NextAfter(const JobRecord &job, int current_max);
};

}  // namespace persistence

#endif  // PRINTBROKER_PERSISTENCE_CHANGE_ORDER_ALLOCATOR_H
