#include <memory>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../../common/domain/component_suggestions.h"
#include "../../common/domain/component_validation.h"
#include "../../common/domain/errors.h"
#include "../../common/env_loader.h"
#include "../../common/http_support.h"
#include "../../common/logger.h"
#include "../../common/persistence/audit_repository.h"
#include "../../common/persistence/change_orders_repository.h"
#include "../../common/persistence/jobs_repository.h"
#include "../../common/persistence/postgres.h"
#include "../../common/service_config.h"
#include "http_mapping.h"

using json = nlohmann::json;

namespace {

constexpr char kServiceName[] = "jobs";
constexpr int kHistoryLimit = 200;

logging::ServiceLogger &JobsLogger() {
  static auto &logger = logging::ServiceLogger::Instance(kServiceName);
  return logger;
}

void SendError(httplib::Response &res, const char *operation, const std::exception &ex) {
  const int status = jobs_http::StatusForError(ex);
  const auto body = jobs_http::ErrorBody(ex);
  http_support::MetricsRegistry::Instance().RecordDomainError(kServiceName, body.value("error", "unknown"));
  if (status >= 500) {
    JobsLogger().Error(std::string(operation) + "_failed", {{"message", ex.what()}, {"status", status}});
  } else {
    JobsLogger().Warn(std::string(operation) + "_rejected", {{"message", ex.what()}, {"status", status}});
  }
  http_support::SendJson(res, body, status);
}

std::string ActorOf(const httplib::Request &req) {
  return req.get_header_value("X-Actor-Id");
}

// Audit writes never fail the request that triggered them.
void RecordAudit(const persistence::AuditRepository &audit, const httplib::Request &req, const std::string &action,
                 const std::string &subject, const json &details) {
  try {
    audit.RecordEvent(ActorOf(req), action, subject, details, req.remote_addr);
  } catch (const std::exception &ex) {
    JobsLogger().Warn("audit_write_failed", {{"action", action}, {"subject", subject}, {"message", ex.what()}});
  }
}

}  // namespace

int main() {
  env::LoadEnvironment();

  const auto settings = config::LoadServiceConfig();
  for (const auto &warning : settings.warnings) {
    JobsLogger().Warn("config_fallback", {{"detail", warning}});
  }
  persistence::TransactionSettings transactions;
  transactions.max_attempts = settings.max_transaction_attempts;
  transactions.lock_timeout_ms = settings.lock_timeout_ms;
  auto database = std::make_shared<persistence::PostgresConfig>(settings.database_url, transactions);

  persistence::JobsRepository jobs(database, settings.identifiers);
  persistence::ChangeOrdersRepository change_orders(database, settings.workflow);
  persistence::AuditRepository audit(database);

  httplib::Server server;
  http_support::ConfigureServer(server, kServiceName);
  http_support::ExposeMetrics(server, kServiceName);

  server.Get("/health", [](const httplib::Request &, httplib::Response &res) {
    http_support::SendJson(res, json{{"status", "ok"}});
  });

  server.Post("/jobs/identifiers", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto body = jobs_http::ParseBody(req.body);
      std::string code = body.value("jobTypeCode", "");
      if (code.empty()) {
        code = domain::DeriveTypeCode(jobs_http::ParseClassification(body));
      }
      const auto identifiers = jobs.AllocateJobIdentifiers(code);
      RecordAudit(audit, req, "job_identifiers_reserved", identifiers.base_job_id,
                  json{{"masterSeq", identifiers.master_seq}});
      http_support::SendJson(res, jobs_http::IdentifiersToJson(identifiers), 201);
    } catch (const std::exception &ex) {
      SendError(res, "allocate_job_identifiers", ex);
    }
  });

  server.Post("/jobs", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto input = jobs_http::ParseJobCreateInput(jobs_http::ParseBody(req.body));
      const auto created = jobs.CreateJob(input);
      RecordAudit(audit, req, "job_created", created.job.id,
                  json{{"baseJobId", created.job.base_job_id}, {"jobTypeCode", created.job.job_type_code}});
      json components = json::array();
      for (const auto &record : created.components) {
        components.push_back(jobs_http::ComponentRecordToJson(record));
      }
      http_support::SendJson(res,
                             json{{"job", jobs_http::JobToJson(created.job)},
                                  {"components", components},
                                  {"issues", jobs_http::IssuesToJson(created.issues)}},
                             201);
    } catch (const std::exception &ex) {
      SendError(res, "create_job", ex);
    }
  });

  server.Get(R"(/jobs/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      http_support::SendJson(res, jobs_http::JobToJson(jobs.FindJob(req.matches[1])));
    } catch (const std::exception &ex) {
      SendError(res, "get_job", ex);
    }
  });

  server.Get(R"(/jobs/([^/]+)/components)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto records = jobs.ListComponents(req.matches[1]);
      json components = json::array();
      std::vector<domain::JobComponent> current;
      for (const auto &record : records) {
        components.push_back(jobs_http::ComponentRecordToJson(record));
        current.push_back(record.component);
      }
      http_support::SendJson(res, json{{"components", components},
                                       {"issues", jobs_http::IssuesToJson(domain::ValidateComponents(current))}});
    } catch (const std::exception &ex) {
      SendError(res, "list_components", ex);
    }
  });

  server.Put(R"(/jobs/([^/]+)/components)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const std::string job_id = req.matches[1];
      const auto body = jobs_http::ParseBody(req.body);
      const auto inputs = jobs_http::ParseComponentInputs(body.value("components", json::array()));
      const auto records = jobs.ReplaceComponents(job_id, inputs);
      json components = json::array();
      std::vector<domain::JobComponent> current;
      for (const auto &record : records) {
        components.push_back(jobs_http::ComponentRecordToJson(record));
        current.push_back(record.component);
      }
      RecordAudit(audit, req, "job_components_replaced", job_id, json{{"count", records.size()}});
      http_support::SendJson(res, json{{"components", components},
                                       {"issues", jobs_http::IssuesToJson(domain::ValidateComponents(current))}});
    } catch (const std::exception &ex) {
      SendError(res, "replace_components", ex);
    }
  });

  server.Post(R"(/jobs/([^/]+)/activate)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto job = jobs.ActivateJob(req.matches[1]);
      RecordAudit(audit, req, "job_activated", job.id, json{{"baseJobId", job.base_job_id}});
      http_support::SendJson(res, jobs_http::JobToJson(job));
    } catch (const std::exception &ex) {
      SendError(res, "activate_job", ex);
    }
  });

  server.Get(R"(/jobs/([^/]+)/effective-state)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      http_support::SendJson(res, jobs_http::EffectiveStateToJson(change_orders.GetEffectiveState(req.matches[1])));
    } catch (const std::exception &ex) {
      SendError(res, "get_effective_state", ex);
    }
  });

  server.Get(R"(/jobs/([^/]+)/change-orders)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      json array = json::array();
      for (const auto &record : change_orders.ListForJob(req.matches[1])) {
        array.push_back(jobs_http::ChangeOrderToJson(record));
      }
      http_support::SendJson(res, json{{"changeOrders", array}});
    } catch (const std::exception &ex) {
      SendError(res, "list_change_orders", ex);
    }
  });

  server.Post(R"(/jobs/([^/]+)/change-orders)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto input = jobs_http::ParseChangeOrderCreateInput(req.matches[1], jobs_http::ParseBody(req.body));
      const auto record = change_orders.CreateChangeOrder(input);
      RecordAudit(audit, req, "change_order_created", record.id,
                  json{{"changeOrderNo", record.change_order_no}, {"version", record.version}});
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(record), 201);
    } catch (const std::exception &ex) {
      SendError(res, "create_change_order", ex);
    }
  });

  server.Get(R"(/change-orders/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(change_orders.GetChangeOrder(req.matches[1])));
    } catch (const std::exception &ex) {
      SendError(res, "get_change_order", ex);
    }
  });

  server.Patch(R"(/change-orders/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto update = jobs_http::ParseChangeOrderUpdate(jobs_http::ParseBody(req.body));
      const auto record = change_orders.UpdateDraft(req.matches[1], update);
      RecordAudit(audit, req, "change_order_updated", record.id, json{{"changeOrderNo", record.change_order_no}});
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(record));
    } catch (const std::exception &ex) {
      SendError(res, "update_change_order", ex);
    }
  });

  server.Post(R"(/change-orders/([^/]+)/submit)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto record = change_orders.SubmitForApproval(req.matches[1]);
      RecordAudit(audit, req, "change_order_submitted", record.id, json{{"changeOrderNo", record.change_order_no}});
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(record));
    } catch (const std::exception &ex) {
      SendError(res, "submit_change_order", ex);
    }
  });

  server.Post(R"(/change-orders/([^/]+)/withdraw)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto record = change_orders.Withdraw(req.matches[1]);
      RecordAudit(audit, req, "change_order_withdrawn", record.id, json{{"changeOrderNo", record.change_order_no}});
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(record));
    } catch (const std::exception &ex) {
      SendError(res, "withdraw_change_order", ex);
    }
  });

  server.Post(R"(/change-orders/([^/]+)/approve)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto body = jobs_http::ParseBody(req.body);
      std::string approver = body.value("approverId", "");
      if (approver.empty()) {
        approver = ActorOf(req);
      }
      const auto result = change_orders.Approve(req.matches[1], approver);
      RecordAudit(audit, req, "change_order_approved", result.change_order.id,
                  json{{"changeOrderNo", result.change_order.change_order_no},
                       {"approvedBy", result.change_order.approved_by.value_or("")},
                       {"contentDigest", result.change_order.content_digest.value_or("")}});
      http_support::SendJson(res, json{{"changeOrder", jobs_http::ChangeOrderToJson(result.change_order)},
                                       {"job", jobs_http::JobToJson(result.job)}});
    } catch (const std::exception &ex) {
      SendError(res, "approve_change_order", ex);
    }
  });

  server.Post(R"(/change-orders/([^/]+)/reject)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto body = jobs_http::ParseBody(req.body);
      const auto record = change_orders.Reject(req.matches[1], body.value("reason", ""));
      RecordAudit(audit, req, "change_order_rejected", record.id,
                  json{{"changeOrderNo", record.change_order_no},
                       {"reason", record.rejection_reason.value_or("")}});
      http_support::SendJson(res, jobs_http::ChangeOrderToJson(record));
    } catch (const std::exception &ex) {
      SendError(res, "reject_change_order", ex);
    }
  });

  server.Get(R"(/change-orders/([^/]+)/integrity)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      http_support::SendJson(res, jobs_http::IntegrityToJson(change_orders.VerifyIntegrity(req.matches[1])));
    } catch (const std::exception &ex) {
      SendError(res, "verify_change_order", ex);
    }
  });

  server.Get(R"(/change-orders/([^/]+)/history)", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto record = change_orders.GetChangeOrder(req.matches[1]);
      json events = json::array();
      for (const auto &event : audit.ListEvents(record.id, kHistoryLimit)) {
        events.push_back(jobs_http::AuditEventToJson(event));
      }
      http_support::SendJson(res, json{{"changeOrderNo", record.change_order_no}, {"events", events}});
    } catch (const std::exception &ex) {
      SendError(res, "change_order_history", ex);
    }
  });

  server.Post("/components/suggestions", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto classification = jobs_http::ParseClassification(jobs_http::ParseBody(req.body));
      json array = json::array();
      for (const auto &suggestion : domain::SuggestComponents(classification)) {
        array.push_back(jobs_http::SuggestionToJson(suggestion));
      }
      http_support::SendJson(res, json{{"jobTypeCode", domain::DeriveTypeCode(classification)},
                                       {"components", array}});
    } catch (const std::exception &ex) {
      SendError(res, "suggest_components", ex);
    }
  });

  server.Post("/components/validate", [&](const httplib::Request &req, httplib::Response &res) {
    try {
      const auto body = jobs_http::ParseBody(req.body);
      const auto components = jobs_http::ParseComponents(body.value("components", json::array()));
      const auto issues = domain::ValidateComponents(components);
      http_support::SendJson(res, json{{"valid", issues.empty()}, {"issues", jobs_http::IssuesToJson(issues)}});
    } catch (const std::exception &ex) {
      SendError(res, "validate_components", ex);
    }
  });

  JobsLogger().Info("starting_jobs_service",
                    {{"port", settings.port},
                     {"sequenceScope", std::string(domain::ToString(settings.identifiers.scope))},
                     {"singleOpenChangeOrder", settings.workflow.single_open_change_order},
                     {"allowDirectApproval", settings.workflow.allow_direct_approval}});
  if (!server.listen("0.0.0.0", settings.port)) {
    JobsLogger().Error("listen_failed", {{"port", settings.port}});
    return 1;
  }
  return 0;
}
