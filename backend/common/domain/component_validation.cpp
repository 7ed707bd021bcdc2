#include "component_validation.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace domain {

namespace {

bool HasType(const std::vector<JobComponent> &components, ComponentType type) {
  return std::any_of(components.begin(), components.end(),
                     [type](const JobComponent &component) { return component.type == type; });
}

std::string SummarizeIssues(const std::vector<ValidationIssue> &issues) {
  std::ostringstream oss;
  oss << "component validation failed";
  for (std::size_t i = 0; i < issues.size(); ++i) {
    oss << (i == 0 ? ": " : "; ") << issues[i].message;
  }
  return oss.str();
}

}  // namespace

std::vector<ValidationIssue> ValidateComponents(const std::vector<JobComponent> &components) {
  std::vector<ValidationIssue> issues;

  if (!HasType(components, ComponentType::kPrint)) {
    issues.push_back({"missing_print", "Missing PRINT component (required for all jobs)", std::nullopt, {}});
  }
  if (!HasType(components, ComponentType::kProof)) {
    issues.push_back({"missing_proof", "Missing PROOF component (required for all jobs)", std::nullopt, {}});
  }

  for (std::size_t i = 0; i < components.size(); ++i) {
    const auto &component = components[i];
    if (component.owner == ComponentOwner::kVendor && component.vendor_id.empty()) {
      issues.push_back({"vendor_missing_vendor_id", "Vendor-owned component missing vendorId",
                        static_cast<int>(i), component.name});
    }
  }
  return issues;
}

ValidationFailedError::ValidationFailedError(std::vector<ValidationIssue> issues)
    : DomainError("validation_failed", SummarizeIssues(issues)), issues_(std::move(issues)) {}

}  // namespace domain
