#ifndef PRINTBROKER_DOMAIN_ERRORS_H
#define PRINTBROKER_DOMAIN_ERRORS_H

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace domain {

// Base of every failure the job core reports. code() is the stable
// snake_case identifier sent back to HTTP callers.
class DomainError : public std::runtime_error {
 public:
  DomainError(std::string code, const std::string &message)
      : std::runtime_error(message), code_(std::move(code)) {}

  const std::string &code() const { return code_; }

 private:
  std::string code_;
};

class NotFoundError : public DomainError {
 public:
  NotFoundError(std::string_view entity, std::string_view id)
      : DomainError("not_found", std::string(entity) + " " + std::string(id) + " does not exist"),
        entity_(entity) {}

  const std::string &entity() const { return entity_; }

 private:
  std::string entity_;
};

class InvalidArgumentError : public DomainError {
 public:
  InvalidArgumentError(std::string code, const std::string &message)
      : DomainError(std::move(code), message) {}
};

class ChangeSetError : public DomainError {
 public:
  explicit ChangeSetError(const std::string &message) : DomainError("invalid_changes", message) {}
};

class InvalidTransitionError : public DomainError {
 public:
  InvalidTransitionError(std::string_view action, std::string_view subject, std::string_view status)
      : DomainError("invalid_transition", "cannot " + std::string(action) + " " + std::string(subject) +
                                              " in status " + std::string(status)) {}
};

class ImmutableRecordError : public DomainError {
 public:
  ImmutableRecordError(std::string_view change_order_no, std::string_view detail)
      : DomainError("immutable_record",
                    "change order " + std::string(change_order_no) + " is immutable: " + std::string(detail)) {}
};

// A concurrent transaction won the race for a counter or version slot.
// Repositories retry internally and only surface this once attempts run out.
class SequenceConflictError : public DomainError {
 public:
  explicit SequenceConflictError(std::string_view operation)
      : DomainError("sequence_conflict", "concurrent update conflict during " + std::string(operation)) {}
};

class OpenChangeOrderError : public DomainError {
 public:
  explicit OpenChangeOrderError(std::string_view open_change_order_no)
      : DomainError("open_change_order_exists",
                    "change order " + std::string(open_change_order_no) + " is still open for this job") {}
};

// The counter kept producing base job ids that already exist, e.g. after
// switching between global and per-type sequence scope.
class IdentifierCollisionError : public DomainError {
 public:
  IdentifierCollisionError(std::string_view counter_key, std::string_view last_candidate)
      : DomainError("identifier_collision", "counter " + std::string(counter_key) + " keeps colliding with existing "
                                            "base job ids (last tried " + std::string(last_candidate) + ")") {}
};

}  // namespace domain

#endif  // PRINTBROKER_DOMAIN_ERRORS_H
