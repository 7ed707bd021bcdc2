#ifndef PRINTBROKER_HTTP_SUPPORT_H
#define PRINTBROKER_HTTP_SUPPORT_H

#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "logger.h"

namespace http_support {

class MetricsRegistry {
 public:
  static MetricsRegistry &Instance() {
    static MetricsRegistry instance;
    return instance;
  }

  void RecordRequest(std::string_view service, std::string_view method, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_totals_[std::string(service)][{std::string(method), status}] += 1;
  }

  // Counts domain failures by error code (sequence_conflict, immutable_record, ...).
  void RecordDomainError(std::string_view service, std::string_view code) {
    std::lock_guard<std::mutex> lock(mutex_);
    domain_errors_[std::string(service)][std::string(code)] += 1;
  }

  std::string Render(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto service_key = std::string(service);
    std::ostringstream oss;
    oss << "# HELP service_request_total Total HTTP requests handled by the service" << '\n';
    oss << "# TYPE service_request_total counter" << '\n';
    if (auto it = request_totals_.find(service_key); it != request_totals_.end()) {
      for (const auto &entry : it->second) {
        oss << "service_request_total{service=\"" << service_key << "\",method=\"" << std::get<0>(entry.first)
            << "\",status=\"" << std::get<1>(entry.first) << "\"} " << entry.second << '\n';
      }
    }
    oss << "# HELP service_domain_errors_total Requests rejected with a domain error" << '\n';
    oss << "# TYPE service_domain_errors_total counter" << '\n';
    if (auto it = domain_errors_.find(service_key); it != domain_errors_.end()) {
      for (const auto &entry : it->second) {
        oss << "service_domain_errors_total{service=\"" << service_key << "\",code=\"" << entry.first << "\"} "
            << entry.second << '\n';
      }
    }
    return oss.str();
  }

 private:
  using RequestKey = std::tuple<std::string, int>;

  MetricsRegistry() = default;

  std::mutex mutex_;
  std::map<std::string, std::map<RequestKey, long long>> request_totals_;
  std::map<std::string, std::map<std::string, long long>> domain_errors_;
};

inline std::string RequestId(const httplib::Request &req) {
  if (auto value = req.get_header_value("X-Request-Id"); !value.empty()) {
    return value;
  }
  static std::atomic<unsigned long long> counter{0};
  return "generated-" + std::to_string(std::hash<std::string>{}(req.method + req.path)) + "-" +
         std::to_string(++counter);
}

inline void SendJson(httplib::Response &res, const nlohmann::json &payload, int status = 200) {
  res.status = status;
  res.set_content(payload.dump(), "application/json");
}

inline void ConfigureServer(httplib::Server &server, std::string_view service_name) {
  server.set_logger([service_name](const auto &req, const auto &res) {
    std::ostringstream oss;
    oss << req.method << ' ' << req.path << " -> " << res.status;
    auto &logger = logging::ServiceLogger::Instance(service_name);
    logger.Log("http", oss.str(), {{"requestId", RequestId(req)}});
    MetricsRegistry::Instance().RecordRequest(service_name, req.method, res.status);
    if (res.status >= 500) {
      logger.Error("http_server_error", {{"method", req.method}, {"path", req.path}, {"status", res.status}});
    }
  });

  server.set_exception_handler([service_name](const auto &req, auto &res, std::exception_ptr ep) {
    std::string message = "unknown";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception &ex) {
        message = ex.what();
      }
    }
    logging::ServiceLogger::Instance(service_name)
        .Error("unhandled_exception",
               {{"method", req.method}, {"path", req.path}, {"message", message}, {"requestId", RequestId(req)}});
    SendJson(res, {{"error", "internal_server_error"}}, 500);
  });
}

inline void ExposeMetrics(httplib::Server &server, std::string_view service_name) {
  server.Get("/metrics", [service_name](const httplib::Request &, httplib::Response &res) {
    res.set_content(MetricsRegistry::Instance().Render(service_name), "text/plain; version=0.0.4; charset=utf-8");
  });
}

}  // namespace http_support

#endif  // PRINTBROKER_HTTP_SUPPORT_H
