#include "service_config.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace config {

namespace {

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

class Reader {
 public:
  Reader(const EnvLookup &lookup, std::vector<std::string> *warnings) : lookup_(lookup), warnings_(warnings) {}

  std::optional<std::string> Raw(const std::string &key) const {
    auto value = lookup_(key);
    if (!value || value->empty()) {
      return std::nullopt;
    }
    return value;
  }

  std::string String(const std::string &key, const std::string &fallback) const {
    return Raw(key).value_or(fallback);
  }

  long long Integer(const std::string &key, long long fallback, long long min, long long max) const {
    const auto value = Raw(key);
    if (!value) {
      return fallback;
    }
    try {
      std::size_t consumed = 0;
      const long long parsed = std::stoll(*value, &consumed);
      if (consumed == value->size() && parsed >= min && parsed <= max) {
        return parsed;
      }
    } catch (const std::exception &) {
      // fall through to the warning below
    }
    warnings_->push_back(key + " must be an integer in [" + std::to_string(min) + ", " + std::to_string(max) +
                         "], using " + std::to_string(fallback));
    return fallback;
  }

  bool Flag(const std::string &key, bool fallback) const {
    const auto value = Raw(key);
    if (!value) {
      return fallback;
    }
    const auto lowered = Lowercase(*value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
      return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
      return false;
    }
    warnings_->push_back(key + " must be a boolean, using " + (fallback ? "true" : "false"));
    return fallback;
  }

 private:
  const EnvLookup &lookup_;
  std::vector<std::string> *warnings_;
};

}  // namespace

ServiceConfig LoadServiceConfig(const EnvLookup &lookup) {
  ServiceConfig config;
  Reader reader(lookup, &config.warnings);

  config.database_url = reader.String("DATABASE_URL", kDefaultDatabaseUrl);
  config.port = static_cast<int>(reader.Integer("JOBS_PORT", 8082, 1, 65535));

  if (const auto scope = reader.Raw("JOB_ID_SEQUENCE_SCOPE")) {
    if (const auto parsed = domain::ParseSequenceScope(*scope)) {
      config.identifiers.scope = *parsed;
    } else {
      config.warnings.push_back("JOB_ID_SEQUENCE_SCOPE must be global or type_code, using global");
    }
  }
  config.identifiers.sequence_start = reader.Integer("JOB_ID_SEQUENCE_START", 0, 0, INT64_MAX - 1);
  config.identifiers.sequence_width = static_cast<int>(
      reader.Integer("JOB_ID_SEQUENCE_WIDTH", 6, domain::kMinSequenceWidth, domain::kMaxSequenceWidth));
  if (const auto separator = lookup("JOB_ID_SEPARATOR")) {
    const bool usable = separator->size() <= 1 &&
                        std::all_of(separator->begin(), separator->end(),
                                    [](char ch) { return ch == '-' || ch == '_' || ch == '.'; });
    if (usable) {
      config.identifiers.separator = *separator;
    } else {
      config.warnings.push_back("JOB_ID_SEPARATOR must be empty or one of - _ ., using none");
    }
  }

  config.workflow.allow_direct_approval = reader.Flag("CHANGE_ORDER_ALLOW_DIRECT_APPROVAL", false);
  config.workflow.single_open_change_order = reader.Flag("CHANGE_ORDER_SINGLE_OPEN", false);

  config.max_transaction_attempts = static_cast<int>(reader.Integer("TRANSACTION_MAX_ATTEMPTS", 5, 1, 20));
  config.lock_timeout_ms = static_cast<int>(reader.Integer("DATABASE_LOCK_TIMEOUT_MS", 5000, 0, 600000));
  return config;
}

ServiceConfig LoadServiceConfig() {
  return LoadServiceConfig([](const std::string &key) -> std::optional<std::string> {
    if (const char *value = std::getenv(key.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  });
}

}  // namespace config
