#ifndef PRINTBROKER_DOMAIN_COMPONENT_VALIDATION_H
#define PRINTBROKER_DOMAIN_COMPONENT_VALIDATION_H

#include <optional>
#include <string>
#include <vector>

#include "components.h"
#include "errors.h"

namespace domain {

struct ValidationIssue {
  std::string code;
  std::string message;
  std::optional<int> component_index;
  std::string component_name;
};

// Checks a job's component set. Never throws and never touches its input;
// whether issues block anything is up to the caller.
std::vector<ValidationIssue> ValidateComponents(const std::vector<JobComponent> &components);

// Raised by callers that refuse to proceed while issues remain.
class ValidationFailedError : public DomainError {
 public:
  explicit ValidationFailedError(std::vector<ValidationIssue> issues);

  const std::vector<ValidationIssue> &issues() const { return issues_; }

 private:
  std::vector<ValidationIssue> issues_;
};

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_COMPONENT_VALIDATION_H
