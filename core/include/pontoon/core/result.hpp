#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/id.hpp"

namespace pontoon::core {

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

enum class ValidationCode : std::uint8_t {
  kOutOfBounds = 0,
  kOverlap = 1,
  kNoSupport = 2,
  kDisconnected = 3,
  kNotFound = 4,
  kAlreadyAtPosition = 5,
  kSameValue = 6,
  kPipelineBusy = 7,
  kNoCell = 8,
  kInvalidArgument = 9,
};

// Stable upper-case identifiers, e.g. "OUT_OF_BOUNDS".
[[nodiscard]] std::string_view to_string(ValidationCode code);

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  ValidationCode code = ValidationCode::kInvalidArgument;
  std::string message{};
  std::optional<GridPosition> position{};
  ObjectId object_id = kInvalidObjectId;

  bool operator==(const ValidationIssue& other) const = default;
};

// Issues are kept in rule order; the first error is the primary failure.
struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
  [[nodiscard]] bool has_code(ValidationCode code) const;
  [[nodiscard]] std::optional<ValidationCode> first_code() const;
  [[nodiscard]] std::vector<std::string> messages() const;

  bool operator==(const ValidationResult& other) const = default;
};

enum class OperationKind : std::uint8_t {
  kPlace = 0,
  kRemove = 1,
  kMove = 2,
  kRotate = 3,
  kRecolor = 4,
  kBatchPlace = 5,
  kBatchRemove = 6,
  kSelect = 7,
  kCheckpoint = 8,
};

[[nodiscard]] std::string_view to_string(OperationKind kind);

// Record of one applied change. before/after carry the pontoon value on each side.
struct Operation {
  OperationKind kind = OperationKind::kPlace;
  std::uint64_t sequence = 0;
  std::int64_t timestamp_ms = 0;
  std::vector<ObjectId> affected_ids{};
  std::optional<Pontoon> before{};
  std::optional<Pontoon> after{};
  std::string description{};
};

struct ChangeSet {
  std::vector<ObjectId> created_ids;
  std::vector<ObjectId> updated_ids;
  std::vector<ObjectId> deleted_ids;

  [[nodiscard]] bool empty() const { return created_ids.empty() && updated_ids.empty() && deleted_ids.empty(); }
};

template <typename TValue>
struct EditResult {
  bool ok = false;
  TValue value{};
  std::vector<std::string> errors{};
  std::vector<ValidationIssue> issues{};
  std::vector<Operation> operations{};
  ChangeSet change_set{};

  [[nodiscard]] std::string error() const { return errors.empty() ? std::string{} : errors.front(); }

  [[nodiscard]] std::optional<ValidationCode> first_code() const {
    for (const ValidationIssue& issue : issues) {
      if (issue.severity == ValidationSeverity::kError) {
        return issue.code;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] bool has_code(ValidationCode code) const {
    for (const ValidationIssue& issue : issues) {
      if (issue.code == code) {
        return true;
      }
    }
    return false;
  }

  void add_issue(ValidationIssue issue) {
    if (issue.severity == ValidationSeverity::kError) {
      errors.push_back(issue.message);
    }
    issues.push_back(std::move(issue));
  }

  void add_issues(const ValidationResult& validation) {
    for (const ValidationIssue& issue : validation.issues) {
      add_issue(issue);
    }
  }

  void fail(ValidationCode code, std::string message, ObjectId object_id = kInvalidObjectId,
            std::optional<GridPosition> position = std::nullopt) {
    ok = false;
    add_issue({ValidationSeverity::kError, code, std::move(message), position, object_id});
  }
};

}  // namespace pontoon::core
