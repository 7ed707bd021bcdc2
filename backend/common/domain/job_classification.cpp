#include "job_classification.h"

namespace domain {

std::string_view ToString(JobMetaType value) {
  switch (value) {
    case JobMetaType::kJob:
      return "JOB";
    case JobMetaType::kMailing:
      return "MAILING";
    case JobMetaType::kUnspecified:
      break;
  }
  return "";
}

std::string_view ToString(MailFormat value) {
  switch (value) {
    case MailFormat::kSelfMailer:
      return "SELF_MAILER";
    case MailFormat::kPostcard:
      return "POSTCARD";
    case MailFormat::kEnvelope:
      return "ENVELOPE";
    case MailFormat::kUnspecified:
      break;
  }
  return "";
}

std::string_view ToString(JobType value) {
  switch (value) {
    case JobType::kFlat:
      return "FLAT";
    case JobType::kFolded:
      return "FOLDED";
    case JobType::kBookletSelfCover:
      return "BOOKLET_SELF_COVER";
    case JobType::kBookletPlusCover:
      return "BOOKLET_PLUS_COVER";
    case JobType::kUnspecified:
      break;
  }
  return "";
}

std::optional<JobMetaType> ParseJobMetaType(std::string_view value) {
  if (value.empty()) {
    return JobMetaType::kUnspecified;
  }
  if (value == "JOB") {
    return JobMetaType::kJob;
  }
  if (value == "MAILING") {
    return JobMetaType::kMailing;
  }
  return std::nullopt;
}

std::optional<MailFormat> ParseMailFormat(std::string_view value) {
  if (value.empty()) {
    return MailFormat::kUnspecified;
  }
  if (value == "SELF_MAILER") {
    return MailFormat::kSelfMailer;
  }
  if (value == "POSTCARD") {
    return MailFormat::kPostcard;
  }
  if (value == "ENVELOPE") {
    return MailFormat::kEnvelope;
  }
  return std::nullopt;
}

std::optional<JobType> ParseJobType(std::string_view value) {
  if (value.empty()) {
    return JobType::kUnspecified;
  }
  if (value == "FLAT") {
    return JobType::kFlat;
  }
  if (value == "FOLDED") {
    return JobType::kFolded;
  }
  if (value == "BOOKLET_SELF_COVER") {
    return JobType::kBookletSelfCover;
  }
  if (value == "BOOKLET_PLUS_COVER") {
    return JobType::kBookletPlusCover;
  }
  return std::nullopt;
}

int EffectiveEnvelopeComponents(const JobClassification &classification) {
  if (!classification.envelope_components.has_value() || *classification.envelope_components <= 0) {
    return 1;
  }
  return *classification.envelope_components;
}

std::string DeriveTypeCode(const JobClassification &classification) {
  if (classification.meta_type == JobMetaType::kMailing) {
    switch (classification.mail_format) {
      case MailFormat::kPostcard:
        return "MP";
      case MailFormat::kEnvelope:
        return "ME" + std::to_string(EffectiveEnvelopeComponents(classification));
      case MailFormat::kSelfMailer:
      case MailFormat::kUnspecified:
        break;
    }
    return "MS";
  }
  switch (classification.job_type) {
    case JobType::kFolded:
      return "HJ";
    case JobType::kBookletSelfCover:
    case JobType::kBookletPlusCover:
      return "BJ";
    case JobType::kFlat:
    case JobType::kUnspecified:
      break;
  }
  return "FJ";
}

}  // namespace domain
