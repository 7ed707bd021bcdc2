#ifndef PRINTBROKER_DOMAIN_JOB_CLASSIFICATION_H
#define PRINTBROKER_DOMAIN_JOB_CLASSIFICATION_H

#include <optional>
#include <string>
#include <string_view>

namespace domain {

enum class JobMetaType { kUnspecified, kJob, kMailing };

enum class MailFormat { kUnspecified, kSelfMailer, kPostcard, kEnvelope };

enum class JobType { kUnspecified, kFlat, kFolded, kBookletSelfCover, kBookletPlusCover };

struct JobClassification {
  JobMetaType meta_type = JobMetaType::kUnspecified;
  MailFormat mail_format = MailFormat::kUnspecified;
  JobType job_type = JobType::kUnspecified;
  std::optional<int> envelope_components;
  bool has_samples = false;
  bool has_data = false;
  bool has_versions = false;
};

// Unspecified values render as an empty string and parse back from one.
std::string_view ToString(JobMetaType value);
std::string_view ToString(MailFormat value);
std::string_view ToString(JobType value);

std::optional<JobMetaType> ParseJobMetaType(std::string_view value);
std::optional<MailFormat> ParseMailFormat(std::string_view value);
std::optional<JobType> ParseJobType(std::string_view value);

// Envelope component count used for codes and descriptions; missing or
// non-positive counts mean a single component.
int EffectiveEnvelopeComponents(const JobClassification &classification);

// MS / MP / ME{n} for mailings, FJ / HJ / BJ for everything else.
std::string DeriveTypeCode(const JobClassification &classification);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_JOB_CLASSIFICATION_H
