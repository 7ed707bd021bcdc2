#include "change_set.h"

#include <cmath>
#include <limits>
#include <optional>
#include <regex>
#include <string_view>
#include <type_traits>
#include <utility>

#include "errors.h"

namespace domain {

namespace {

enum class FieldKind { kInteger, kNumber, kDate, kText };

std::optional<FieldKind> KnownFieldKind(const std::string &field) {
  static const std::map<std::string, FieldKind> kKnownFields = {
      {"quantity", FieldKind::kInteger},   {"envelopeComponents", FieldKind::kInteger},
      {"sellPrice", FieldKind::kNumber},   {"dueDate", FieldKind::kDate},
      {"mailDate", FieldKind::kDate},      {"inHomesDate", FieldKind::kDate},
      {"paper", FieldKind::kText},         {"size", FieldKind::kText},
      {"colors", FieldKind::kText},        {"notes", FieldKind::kText},
  };
  if (const auto it = kKnownFields.find(field); it != kKnownFields.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool IsValidFieldName(const std::string &field) {
  static const std::regex kPattern(R"(^[A-Za-z][A-Za-z0-9_.]{0,63}$)");
  return std::regex_match(field, kPattern);
}

bool IsCalendarDate(const std::string &value) {
  static const std::regex kPattern(R"(^([0-9]{4})-([0-9]{2})-([0-9]{2})$)");
  std::smatch matches;
  if (!std::regex_match(value, matches, kPattern)) {
    return false;
  }
  const int year = std::stoi(matches[1]);
  const int month = std::stoi(matches[2]);
  const int day = std::stoi(matches[3]);
  if (month < 1 || month > 12) {
    return false;
  }
  static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  const int last_day = (month == 2 && leap) ? 29 : kDaysInMonth[month - 1];
  return day >= 1 && day <= last_day;
}

void CheckKnownField(const std::string &field, FieldKind kind, const SpecValue &value) {
  if (std::holds_alternative<std::nullptr_t>(value)) {
    return;
  }
  switch (kind) {
    case FieldKind::kInteger:
      if (!std::holds_alternative<std::int64_t>(value) || std::get<std::int64_t>(value) < 0) {
        throw ChangeSetError("field '" + field + "' must be a non-negative integer");
      }
      return;
    case FieldKind::kNumber: {
      double number = 0;
      if (std::holds_alternative<std::int64_t>(value)) {
        number = static_cast<double>(std::get<std::int64_t>(value));
      } else if (std::holds_alternative<double>(value)) {
        number = std::get<double>(value);
      } else {
        throw ChangeSetError("field '" + field + "' must be a number");
      }
      if (!std::isfinite(number) || number < 0) {
        throw ChangeSetError("field '" + field + "' must be a non-negative number");
      }
      return;
    }
    case FieldKind::kDate:
      if (!std::holds_alternative<std::string>(value) || !IsCalendarDate(std::get<std::string>(value))) {
        throw ChangeSetError("field '" + field + "' must be a YYYY-MM-DD date");
      }
      return;
    case FieldKind::kText:
      if (!std::holds_alternative<std::string>(value)) {
        throw ChangeSetError("field '" + field + "' must be a string");
      }
      return;
  }
}

SpecValue FromJsonValue(const std::string &field, const nlohmann::json &value) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
      return nullptr;
    case nlohmann::json::value_t::boolean:
      return value.get<bool>();
    case nlohmann::json::value_t::number_integer:
      return value.get<std::int64_t>();
    case nlohmann::json::value_t::number_unsigned: {
      const auto unsigned_value = value.get<std::uint64_t>();
      if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw ChangeSetError("field '" + field + "' is out of range");
      }
      return static_cast<std::int64_t>(unsigned_value);
    }
    case nlohmann::json::value_t::number_float:
      return value.get<double>();
    case nlohmann::json::value_t::string:
      return value.get<std::string>();
    default:
      break;
  }
  throw ChangeSetError("field '" + field + "' must be a scalar value");
}

nlohmann::json ToJsonValue(const SpecValue &value) {
  return std::visit(
      [](const auto &held) -> nlohmann::json {
        using Held = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<Held, std::nullptr_t>) {
          return nullptr;
        } else {
          return held;
        }
      },
      value);
}

}  // namespace

ChangeSet ChangeSet::FromJson(const nlohmann::json &payload) {
  ChangeSet change_set;
  if (payload.is_null()) {
    return change_set;
  }
  if (!payload.is_object()) {
    throw ChangeSetError("changes must be a JSON object");
  }
  for (const auto &item : payload.items()) {
    change_set.Set(item.key(), FromJsonValue(item.key(), item.value()));
  }
  return change_set;
}

void ChangeSet::Set(const std::string &field, SpecValue value) {
  if (!IsValidFieldName(field)) {
    throw ChangeSetError("field name '" + field + "' is not valid");
  }
  if (const auto kind = KnownFieldKind(field)) {
    CheckKnownField(field, *kind, value);
  }
  if (std::holds_alternative<double>(value) && !std::isfinite(std::get<double>(value))) {
    throw ChangeSetError("field '" + field + "' must be finite");
  }
  fields_[field] = std::move(value);
}

nlohmann::json ChangeSet::ToJson() const {
  nlohmann::json payload = nlohmann::json::object();
  for (const auto &[field, value] : fields_) {
    payload[field] = ToJsonValue(value);
  }
  return payload;
}

std::string ChangeSet::Canonical() const {
  return ToJson().dump();
}

void ChangeSet::ApplyTo(nlohmann::json &specs) const {
  if (!specs.is_object()) {
    specs = nlohmann::json::object();
  }
  for (const auto &[field, value] : fields_) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
      specs.erase(field);
    } else {
      specs[field] = ToJsonValue(value);
    }
  }
}

bool operator==(const ChangeSet &lhs, const ChangeSet &rhs) {
  return lhs.fields() == rhs.fields();
}

nlohmann::json MergeChangeSets(const nlohmann::json &base_specs, const std::vector<ChangeSet> &in_version_order) {
  nlohmann::json effective = base_specs.is_object() ? base_specs : nlohmann::json::object();
  for (const auto &change_set : in_version_order) {
    change_set.ApplyTo(effective);
  }
  return effective;
}

}  // namespace domain
