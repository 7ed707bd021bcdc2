#ifndef PRINTBROKER_DOMAIN_COMPONENTS_H
#define PRINTBROKER_DOMAIN_COMPONENTS_H

#include <optional>
#include <string>
#include <string_view>

namespace domain {

enum class ComponentType { kPrint, kData, kProof, kMailing, kFinishing, kBindery, kShipping, kSamples, kOther };

enum class ComponentOwner { kInternal, kVendor };

struct ComponentRequirements {
  bool artwork_required = false;
  bool data_required = false;
};

// A production step attached to a job, as stored and as validated.
struct JobComponent {
  ComponentType type = ComponentType::kOther;
  std::string name;
  std::string description;
  ComponentOwner owner = ComponentOwner::kInternal;
  std::string vendor_id;
  bool artwork_required = false;
  bool data_required = false;
  int sort_order = 0;
  std::string status = "PENDING";
};

std::string_view ToString(ComponentType type);
std::string_view ToString(ComponentOwner owner);

std::optional<ComponentType> ParseComponentType(std::string_view value);
std::optional<ComponentOwner> ParseComponentOwner(std::string_view value);

ComponentRequirements ComponentDefaultsFor(ComponentType type);

// Keyword match over a free-text component name, for rows that predate typed
// components.
ComponentType InferComponentType(std::string_view name);

// Legacy supplier labels: JD is in-house, LAHLOUH and THIRD_PARTY are vendors.
ComponentOwner OwnerForSupplier(std::string_view supplier);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_COMPONENTS_H
