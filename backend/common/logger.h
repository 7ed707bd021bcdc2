#ifndef PRINTBROKER_LOGGER_H
#define PRINTBROKER_LOGGER_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace logging {

enum class Severity { kInfo = 0, kWarn = 1, kError = 2 };

namespace detail {

inline std::string TimestampNow() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto seconds = clock::to_time_t(now);
  std::tm tm;
  gmtime_r(&seconds, &tm);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count()
      << 'Z';
  return oss.str();
}

inline std::string SanitizeServiceName(std::string_view service) {
  std::string sanitized;
  sanitized.reserve(service.size());
  for (const char ch : service) {
    const bool keep = std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
    sanitized += keep ? ch : '_';
  }
  return sanitized.empty() ? std::string("service") : sanitized;
}

// "http" and unknown categories count as info.
inline Severity SeverityOf(std::string_view category) {
  if (category == "error") {
    return Severity::kError;
  }
  if (category == "warn") {
    return Severity::kWarn;
  }
  return Severity::kInfo;
}

inline Severity ThresholdFromEnv() {
  std::string level;
  if (const char *env = std::getenv("LOG_LEVEL")) {
    level = env;
  }
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (level == "error") {
    return Severity::kError;
  }
  if (level == "warn" || level == "warning") {
    return Severity::kWarn;
  }
  return Severity::kInfo;
}

inline const std::filesystem::path &LogDirectoryPath() {
  static std::once_flag flag;
  static std::filesystem::path directory;
  std::call_once(flag, []() {
    const char *env = std::getenv("LOG_DIRECTORY");
    directory = (env && *env) ? std::filesystem::path(env) : std::filesystem::path("logs");
    if (!directory.is_absolute()) {
      directory = std::filesystem::current_path() / directory;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
  });
  return directory;
}

inline nlohmann::json BuildLogEntry(std::string_view timestamp, std::string_view service, std::string_view category,
                                    std::string_view message, const nlohmann::json &context) {
  nlohmann::json entry = {{"timestamp", std::string(timestamp)},
                          {"service", std::string(service)},
                          {"category", std::string(category)},
                          {"message", std::string(message)}};
  if (!context.is_null() && !(context.is_object() && context.empty())) {
    entry["context"] = context;
  }
  return entry;
}

inline void AppendLogEntry(const std::filesystem::path &path, const std::string &line) {
  std::ofstream stream(path, std::ios::app);
  if (stream.is_open()) {
    stream << line << '\n';
  }
}

inline std::mutex &LogMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace detail

// One logger per service name; entries go to {LOG_DIRECTORY}/{service}.log as
// JSON lines, errors are duplicated into errors.log, and everything at or
// above LOG_LEVEL is echoed to std::clog.
class ServiceLogger {
 public:
  static ServiceLogger &Instance(std::string_view service_name) {
    const auto key = detail::SanitizeServiceName(service_name);
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<ServiceLogger>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto &slot = registry[key];
    if (!slot) {
      slot.reset(new ServiceLogger(service_name.empty() ? key : std::string(service_name), key));
    }
    return *slot;
  }

  ServiceLogger(const ServiceLogger &) = delete;
  ServiceLogger &operator=(const ServiceLogger &) = delete;

  void Log(std::string_view category, std::string_view message, const nlohmann::json &context = nullptr) {
    const auto severity = detail::SeverityOf(category);
    if (severity < threshold_) {
      return;
    }
    const auto entry = detail::BuildLogEntry(detail::TimestampNow(), service_name_, category, message, context);
    const auto line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(detail::LogMutex());
    detail::AppendLogEntry(log_file_, line);
    if (severity == Severity::kError) {
      detail::AppendLogEntry(detail::LogDirectoryPath() / "errors.log", line);
    }
    std::clog << '[' << service_name_ << "] " << category << ' ' << message;
    if (entry.contains("context")) {
      std::clog << ' ' << entry["context"].dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::clog << std::endl;
  }

  void Info(std::string_view message, const nlohmann::json &context = nullptr) { Log("info", message, context); }

  void Warn(std::string_view message, const nlohmann::json &context = nullptr) { Log("warn", message, context); }

  void Error(std::string_view message, const nlohmann::json &context = nullptr) { Log("error", message, context); }

  const std::string &service() const { return service_name_; }
  const std::string &service_key() const { return service_key_; }

 private:
  ServiceLogger(std::string service_name, std::string service_key)
      : service_name_(std::move(service_name)),
        service_key_(std::move(service_key)),
        log_file_(detail::LogDirectoryPath() / (service_key_ + ".log")),
        threshold_(detail::ThresholdFromEnv()) {}

  std::string service_name_;
  std::string service_key_;
  std::filesystem::path log_file_;
  Severity threshold_;
};

}  // namespace logging

#endif  // PRINTBROKER_LOGGER_H
