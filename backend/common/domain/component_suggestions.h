#ifndef PRINTBROKER_DOMAIN_COMPONENT_SUGGESTIONS_H
#define PRINTBROKER_DOMAIN_COMPONENT_SUGGESTIONS_H

#include <string>
#include <vector>

#include "components.h"
#include "job_classification.h"

namespace domain {

struct SuggestedComponent {
  ComponentType type = ComponentType::kOther;
  std::string name;
  std::string description;
  ComponentOwner owner = ComponentOwner::kInternal;
  bool artwork_required = false;
  bool data_required = false;
  int sort_order = 0;
};

bool operator==(const SuggestedComponent &lhs, const SuggestedComponent &rhs);
bool operator!=(const SuggestedComponent &lhs, const SuggestedComponent &rhs);

// Default production steps for a job. Always starts with PRINT, always
// contains PROOF and always ends with SHIPPING; sort_order counts up from 0.
std::vector<SuggestedComponent> SuggestComponents(const JobClassification &classification);

JobComponent ToJobComponent(const SuggestedComponent &suggestion);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_COMPONENT_SUGGESTIONS_H
