#ifndef PRINTBROKER_DOMAIN_JOB_IDENTIFIERS_H
#define PRINTBROKER_DOMAIN_JOB_IDENTIFIERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

enum class SequenceScope { kGlobal, kPerTypeCode };

// Numbering policy for base job ids. With the defaults the first job of a
// fresh store coded "BK" becomes "BK000001".
struct IdentifierPolicy {
  SequenceScope scope = SequenceScope::kGlobal;
  std::int64_t sequence_start = 0;
  int sequence_width = 6;
  std::string separator;
};

struct JobIdentifiers {
  std::string base_job_id;
  std::int64_t master_seq = 0;
  std::string job_type_code;
};

struct ChangeOrderNumber {
  std::string base_job_id;
  int version = 0;
};

constexpr int kMinSequenceWidth = 1;
constexpr int kMaxSequenceWidth = 12;

bool IsValidTypeCode(std::string_view type_code);

// Throws InvalidArgumentError for a malformed code, when it is not acceptable
// as the embedded prefix of a base job id.
void RequireValidTypeCode(std::string_view type_code);

// Key of the master_sequences row the policy draws from.
std::string SequenceCounterKey(const IdentifierPolicy &policy, std::string_view type_code);

std::string FormatBaseJobId(std::string_view type_code, std::int64_t master_seq, const IdentifierPolicy &policy);

JobIdentifiers MakeJobIdentifiers(std::string_view type_code, std::int64_t master_seq,
                                  const IdentifierPolicy &policy);

// Splits a base job id formatted under the policy back into type code and
// master sequence. Without a separator the sequence is read as the trailing
// sequence_width digits, so an id whose sequence outgrew the width is read
// with the extra digits in the type code.
std::optional<JobIdentifiers> ParseBaseJobId(std::string_view base_job_id, const IdentifierPolicy &policy);

std::string FormatChangeOrderNo(std::string_view base_job_id, int version);

std::optional<ChangeOrderNumber> ParseChangeOrderNo(std::string_view change_order_no);

std::optional<SequenceScope> ParseSequenceScope(std::string_view value);
std::string_view ToString(SequenceScope scope);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_JOB_IDENTIFIERS_H
