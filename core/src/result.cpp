#include "pontoon/core/result.hpp"

namespace pontoon::core {

std::string_view to_string(ValidationCode code) {
  switch (code) {
  case ValidationCode::kOutOfBounds:
    return "OUT_OF_BOUNDS";
  case ValidationCode::kOverlap:
    return "OVERLAP";
  case ValidationCode::kNoSupport:
    return "NO_SUPPORT";
  case ValidationCode::kDisconnected:
    return "DISCONNECTED";
  case ValidationCode::kNotFound:
    return "NOT_FOUND";
  case ValidationCode::kAlreadyAtPosition:
    return "ALREADY_AT_POSITION";
  case ValidationCode::kSameValue:
    return "SAME_VALUE";
  case ValidationCode::kPipelineBusy:
    return "PIPELINE_BUSY";
  case ValidationCode::kNoCell:
    return "NO_CELL";
  case ValidationCode::kInvalidArgument:
    return "INVALID_ARGUMENT";
  default:
    return "UNKNOWN";
  }
}

std::string_view to_string(OperationKind kind) {
  switch (kind) {
  case OperationKind::kPlace:
    return "place";
  case OperationKind::kRemove:
    return "remove";
  case OperationKind::kMove:
    return "move";
  case OperationKind::kRotate:
    return "rotate";
  case OperationKind::kRecolor:
    return "recolor";
  case OperationKind::kBatchPlace:
    return "batch_place";
  case OperationKind::kBatchRemove:
    return "batch_remove";
  case OperationKind::kSelect:
    return "select";
  case OperationKind::kCheckpoint:
    return "checkpoint";
  default:
    return "unknown";
  }
}

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

bool ValidationResult::has_code(ValidationCode code) const {
  for (const ValidationIssue& issue : issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

std::optional<ValidationCode> ValidationResult::first_code() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return issue.code;
    }
  }
  return std::nullopt;
}

std::vector<std::string> ValidationResult::messages() const {
  std::vector<std::string> out;
  out.reserve(issues.size());
  for (const ValidationIssue& issue : issues) {
    out.push_back(issue.message);
  }
  return out;
}

} // namespace pontoon::core
