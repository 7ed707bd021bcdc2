#ifndef PRINTBROKER_PERSISTENCE_ROW_MAPPING_H
#define PRINTBROKER_PERSISTENCE_ROW_MAPPING_H

#include <pqxx/pqxx>

#include "change_orders_repository.h"
#include "jobs_repository.h"

namespace persistence::detail {

constexpr char kJobColumns[] =
    "id, title, customer_id, base_job_id, master_seq, job_type_code, job_meta_type, mail_format, job_type, "
    "envelope_components, routing_type, pathway, status, specs, effective_co_version, created_at, updated_at";

constexpr char kChangeOrderColumns[] =
    "id, job_id, version, change_order_no, status, summary, changes, affects_vendors, requires_new_po, "
    "requires_reprice, approved_at, approved_by, rejected_at, rejection_reason, content_digest, created_at, "
    "updated_at";

constexpr char kComponentColumns[] =
    "id, job_id, type, name, description, owner, vendor_id, artwork_required, data_required, sort_order, status";

JobRecord RowToJob(const pqxx::row &row);
ChangeOrderRecord RowToChangeOrder(const pqxx::row &row);
ComponentRecord RowToComponent(const pqxx::row &row);

}  // namespace persistence::detail

#endif  // PRINTBROKER_PERSISTENCE_ROW_MAPPING_H
