#include "change_order_allocator.h"

#include "../domain/job_identifiers.h"

namespace persistence {

AllocatedChangeOrder ChangeOrderAllocator::AllocateNext(pqxx::work &txn, const JobRecord &locked_job) const {
  const auto row = txn.exec_params1(
      "select coalesce(max(version), 0) as current_version from change_orders where job_id=$1", locked_job.id);
  return NextAfter(locked_job, row["current_version"].as<int>());
}

AllocatedChangeOrder ChangeOrderAllocator::NextAfter(const JobRecord &job, int current_max) {
  AllocatedChangeOrder next;
  next.version = current_max + 1;
  next.change_order_no = domain::FormatChangeOrderNo(job.base_job_id, next.version);
  return next;
}

}  // namespace persistence
