#ifndef PRINTBROKER_DOMAIN_CHANGE_SET_H
#define PRINTBROKER_DOMAIN_CHANGE_SET_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace domain {

// nullptr clears the field in the effective specs.
using SpecValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

// Edits to the job specs carried by a change order: field name -> new scalar value.
// Known fields are type-checked; unknown fields accept any scalar.
class ChangeSet {
 public:
  ChangeSet() = default;

  // Throws ChangeSetError for anything but an object of valid fields.
  static ChangeSet FromJson(const nlohmann::json &payload);

  // Throws ChangeSetError when the field name or value is not acceptable.
  void Set(const std::string &field, SpecValue value);

  nlohmann::json ToJson() const;

  // Stable text form with sorted keys; input of content digests.
  std::string Canonical() const;

  // Overlays the fields onto a specs object; null values erase.
  void ApplyTo(nlohmann::json &specs) const;

  bool empty() const { return fields_.empty(); }
  std::size_t size() const { return fields_.size(); }
  const std::map<std::string, SpecValue> &fields() const { return fields_; }

 private:
  std::map<std::string, SpecValue> fields_;
};

bool operator==(const ChangeSet &lhs, const ChangeSet &rhs);

// Base specs with each change set applied in the given (ascending version) order.
nlohmann::json MergeChangeSets(const nlohmann::json &base_specs, const std::vector<ChangeSet> &in_version_order);

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_CHANGE_SET_H
