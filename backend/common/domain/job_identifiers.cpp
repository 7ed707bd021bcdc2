#include "job_identifiers.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

#include "errors.h"

namespace domain {

namespace {

constexpr std::size_t kMaxTypeCodeLength = 8;
constexpr char kGlobalCounterKey[] = "master-seq";
constexpr std::size_t kMaxSequenceDigits = 18;

}  // namespace

bool IsValidTypeCode(std::string_view type_code) {
  if (type_code.empty() || type_code.size() > kMaxTypeCodeLength) {
    return false;
  }
  if (type_code.front() < 'A' || type_code.front() > 'Z') {
    return false;
  }
  return std::all_of(type_code.begin(), type_code.end(), [](char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
  });
}

void RequireValidTypeCode(std::string_view type_code) {
  if (!IsValidTypeCode(type_code)) {
    throw InvalidArgumentError("invalid_job_type_code",
                               "job type code '" + std::string(type_code) +
                                   "' must be 1-8 characters of A-Z and 0-9 starting with a letter");
  }
}

std::string SequenceCounterKey(const IdentifierPolicy &policy, std::string_view type_code) {
  if (policy.scope == SequenceScope::kPerTypeCode) {
    return std::string(kGlobalCounterKey) + ":" + std::string(type_code);
  }
  return kGlobalCounterKey;
}

std::string FormatBaseJobId(std::string_view type_code, std::int64_t master_seq, const IdentifierPolicy &policy) {
  RequireValidTypeCode(type_code);
  if (master_seq < 1) {
    throw InvalidArgumentError("invalid_master_seq", "master sequence must be positive");
  }
  const int width = std::clamp(policy.sequence_width, kMinSequenceWidth, kMaxSequenceWidth);
  std::ostringstream oss;
  oss << type_code << policy.separator << std::setfill('0') << std::setw(width) << master_seq;
  return oss.str();
}

JobIdentifiers MakeJobIdentifiers(std::string_view type_code, std::int64_t master_seq,
                                  const IdentifierPolicy &policy) {
  JobIdentifiers identifiers;
  identifiers.base_job_id = FormatBaseJobId(type_code, master_seq, policy);
  identifiers.master_seq = master_seq;
  identifiers.job_type_code = std::string(type_code);
  return identifiers;
}

std::optional<JobIdentifiers> ParseBaseJobId(std::string_view base_job_id, const IdentifierPolicy &policy) {
  std::string_view type_code;
  std::string_view digits;
  if (!policy.separator.empty()) {
    const auto split = base_job_id.rfind(policy.separator);
    if (split == std::string_view::npos) {
      return std::nullopt;
    }
    type_code = base_job_id.substr(0, split);
    digits = base_job_id.substr(split + policy.separator.size());
  } else {
    const auto width =
        static_cast<std::size_t>(std::clamp(policy.sequence_width, kMinSequenceWidth, kMaxSequenceWidth));
    if (base_job_id.size() <= width) {
      return std::nullopt;
    }
    type_code = base_job_id.substr(0, base_job_id.size() - width);
    digits = base_job_id.substr(base_job_id.size() - width);
  }
  if (!IsValidTypeCode(type_code) || digits.empty() || digits.size() > kMaxSequenceDigits ||
      !std::all_of(digits.begin(), digits.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
    return std::nullopt;
  }
  const std::int64_t master_seq = std::stoll(std::string(digits));
  if (master_seq < 1) {
    return std::nullopt;
  }
  JobIdentifiers parsed;
  parsed.base_job_id = std::string(base_job_id);
  parsed.master_seq = master_seq;
  parsed.job_type_code = std::string(type_code);
  return parsed;
}

std::string FormatChangeOrderNo(std::string_view base_job_id, int version) {
  if (base_job_id.empty()) {
    throw InvalidArgumentError("invalid_base_job_id", "base job id must not be empty");
  }
  if (version < 1) {
    throw InvalidArgumentError("invalid_version", "change order version must be at least 1");
  }
  return std::string(base_job_id) + "-CO" + std::to_string(version);
}

std::optional<ChangeOrderNumber> ParseChangeOrderNo(std::string_view change_order_no) {
  static const std::regex kPattern(R"(^(.+)-CO([1-9][0-9]{0,8})$)");
  const std::string text(change_order_no);
  std::smatch matches;
  if (!std::regex_match(text, matches, kPattern)) {
    return std::nullopt;
  }
  ChangeOrderNumber parsed;
  parsed.base_job_id = matches[1];
  parsed.version = std::stoi(matches[2]);
  return parsed;
}

std::optional<SequenceScope> ParseSequenceScope(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lowered.empty() || lowered == "global") {
    return SequenceScope::kGlobal;
  }
  if (lowered == "type_code" || lowered == "per_type_code") {
    return SequenceScope::kPerTypeCode;
  }
  return std::nullopt;
}

std::string_view ToString(SequenceScope scope) {
  return scope == SequenceScope::kPerTypeCode ? "type_code" : "global";
}

}  // namespace domain
