#include "components.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace domain {

namespace {

constexpr std::array<std::pair<ComponentType, std::string_view>, 9> kTypeNames{{
    {ComponentType::kPrint, "PRINT"},
    {ComponentType::kData, "DATA"},
    {ComponentType::kProof, "PROOF"},
    {ComponentType::kMailing, "MAILING"},
    {ComponentType::kFinishing, "FINISHING"},
    {ComponentType::kBindery, "BINDERY"},
    {ComponentType::kShipping, "SHIPPING"},
    {ComponentType::kSamples, "SAMPLES"},
    {ComponentType::kOther, "OTHER"},
}};

bool ContainsAny(const std::string &haystack, std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](std::string_view needle) { return haystack.find(needle) != std::string::npos; });
}

}  // namespace

std::string_view ToString(ComponentType type) {
  for (const auto &entry : kTypeNames) {
    if (entry.first == type) {
      return entry.second;
    }
  }
  return "OTHER";
}

std::string_view ToString(ComponentOwner owner) {
  return owner == ComponentOwner::kVendor ? "VENDOR" : "INTERNAL";
}

std::optional<ComponentType> ParseComponentType(std::string_view value) {
  for (const auto &entry : kTypeNames) {
    if (entry.second == value) {
      return entry.first;
    }
  }
  return std::nullopt;
}

std::optional<ComponentOwner> ParseComponentOwner(std::string_view value) {
  if (value == "INTERNAL") {
    return ComponentOwner::kInternal;
  }
  if (value == "VENDOR") {
    return ComponentOwner::kVendor;
  }
  return std::nullopt;
}

ComponentRequirements ComponentDefaultsFor(ComponentType type) {
  switch (type) {
    case ComponentType::kPrint:
    case ComponentType::kProof:
      return {true, false};
    case ComponentType::kData:
    case ComponentType::kMailing:
      return {false, true};
    case ComponentType::kFinishing:
    case ComponentType::kBindery:
    case ComponentType::kShipping:
    case ComponentType::kSamples:
    case ComponentType::kOther:
      break;
  }
  return {false, false};
}

ComponentType InferComponentType(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

  if (ContainsAny(lowered, {"print", "letter", "postcard", "mailer"})) {
    return ComponentType::kPrint;
  }
  if (ContainsAny(lowered, {"data", "list", "cass", "ncoa"})) {
    return ComponentType::kData;
  }
  if (ContainsAny(lowered, {"proof"})) {
    return ComponentType::kProof;
  }
  if (ContainsAny(lowered, {"mail", "postal", "drop"})) {
    return ComponentType::kMailing;
  }
  if (ContainsAny(lowered, {"insert", "assembly", "fold", "finish"})) {
    return ComponentType::kFinishing;
  }
  if (ContainsAny(lowered, {"bind", "stitch", "saddle"})) {
    return ComponentType::kBindery;
  }
  if (ContainsAny(lowered, {"ship", "deliver"})) {
    return ComponentType::kShipping;
  }
  if (ContainsAny(lowered, {"sample"})) {
    return ComponentType::kSamples;
  }
  return ComponentType::kOther;
}

ComponentOwner OwnerForSupplier(std::string_view supplier) {
  if (supplier == "LAHLOUH" || supplier == "THIRD_PARTY") {
    return ComponentOwner::kVendor;
  }
  return ComponentOwner::kInternal;
}

}  // namespace domain
