#include "pontoon/core/operations.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "pontoon/core/placement_validator.hpp"

namespace pontoon::core {

namespace {

std::string describe_place(const Pontoon& pontoon) {
  std::ostringstream oss;
  oss << "Place " << to_string(pontoon.type) << " " << pontoon_display_id(pontoon.id) << " at "
      << to_string(pontoon.position);
  return oss.str();
}

Operation make_operation(OperationKind kind, std::vector<ObjectId> ids, std::optional<Pontoon> before,
                         std::optional<Pontoon> after, std::string description) {
  Operation operation;
  operation.kind = kind;
  operation.affected_ids = std::move(ids);
  operation.before = std::move(before);
  operation.after = std::move(after);
  operation.description = std::move(description);
  return operation;
}

template <typename TValue>
void add_as_warnings(EditResult<TValue>& result, const std::vector<ValidationIssue>& issues) {
  for (ValidationIssue issue : issues) {
    issue.severity = ValidationSeverity::kWarning;
    result.issues.push_back(std::move(issue));
  }
}

} // namespace

EditResult<Grid> GridOperations::Place(const Grid& grid, const SpatialIndex& index, const GridPosition& position,
                                       PontoonType type, PontoonColor color, Rotation rotation,
                                       const OperationOptions& options) {
  EditResult<Grid> result;
  result.value = grid;
  const ValidationResult check = PlacementValidator(grid, index).CanPlace(position, type);
  if (!check.ok()) {
    result.add_issues(check);
    return result;
  }

  Pontoon pontoon;
  pontoon.id = grid.next_id();
  pontoon.position = position;
  pontoon.type = type;
  pontoon.color = color;
  pontoon.rotation = rotation;
  Grid next = grid.with_pontoon(pontoon);

  if (options.enforce_connectivity && splits_platform(grid, next)) {
    result.add_issue(disconnected_issue(next, pontoon.id));
    return result;
  }

  result.ok = true;
  result.value = std::move(next);
  result.change_set.created_ids.push_back(pontoon.id);
  result.operations.push_back(
      make_operation(OperationKind::kPlace, {pontoon.id}, std::nullopt, pontoon, describe_place(pontoon)));
  return result;
}

EditResult<Grid> GridOperations::Remove(const Grid& grid, const SpatialIndex& index, ObjectId id,
                                        const OperationOptions& options) {
  EditResult<Grid> result;
  result.value = grid;
  const ValidationResult check = PlacementValidator(grid, index).CanRemove(id);
  if (!check.ok()) {
    result.add_issues(check);
    return result;
  }

  const Pontoon removed = *grid.find(id);
  Grid next = grid.without_pontoon(id);
  if (options.enforce_connectivity && splits_platform(grid, next)) {
    result.add_issue(disconnected_issue(next, id));
    return result;
  }

  result.ok = true;
  result.value = std::move(next);
  result.change_set.deleted_ids.push_back(id);
  result.operations.push_back(make_operation(OperationKind::kRemove, {id}, removed, std::nullopt,
                                             "Remove " + pontoon_display_id(id) + " from " +
                                                 to_string(removed.position)));
  return result;
}

EditResult<Grid> GridOperations::Move(const Grid& grid, const SpatialIndex& index, ObjectId id,
                                      const GridPosition& new_position, const OperationOptions& options) {
  EditResult<Grid> result;
  result.value = grid;
  const ValidationResult check = PlacementValidator(grid, index).CanMove(id, new_position);
  if (!check.ok()) {
    result.add_issues(check);
    return result;
  }

  const Pontoon before = *grid.find(id);
  Pontoon after = before;
  after.position = new_position;
  Grid next = grid.with_pontoon(after);
  if (options.enforce_connectivity && splits_platform(grid, next)) {
    result.add_issue(disconnected_issue(next, id));
    return result;
  }

  result.ok = true;
  result.value = std::move(next);
  result.change_set.updated_ids.push_back(id);
  result.operations.push_back(make_operation(OperationKind::kMove, {id}, before, after,
                                             "Move " + pontoon_display_id(id) + " from " +
                                                 to_string(before.position) + " to " + to_string(new_position)));
  return result;
}

EditResult<Grid> GridOperations::Rotate(const Grid& grid, ObjectId id, Rotation rotation) {
  EditResult<Grid> result;
  result.value = grid;
  const Pontoon* pontoon = grid.find(id);
  if (pontoon == nullptr) {
    result.fail(ValidationCode::kNotFound, "pontoon " + pontoon_display_id(id) + " not found", id);
    return result;
  }
  if (pontoon->rotation == rotation) {
    result.fail(ValidationCode::kSameValue,
                "pontoon already faces " + std::string(to_string(rotation)), id, pontoon->position);
    return result;
  }

  const Pontoon before = *pontoon;
  Pontoon after = before;
  after.rotation = rotation;
  result.ok = true;
  result.value = grid.with_pontoon(after);
  result.change_set.updated_ids.push_back(id);
  result.operations.push_back(make_operation(OperationKind::kRotate, {id}, before, after,
                                             "Rotate " + pontoon_display_id(id) + " to " +
                                                 std::to_string(rotation_degrees(rotation)) + " deg"));
  return result;
}

EditResult<Grid> GridOperations::Recolor(const Grid& grid, ObjectId id, PontoonColor color) {
  EditResult<Grid> result;
  result.value = grid;
  const Pontoon* pontoon = grid.find(id);
  if (pontoon == nullptr) {
    result.fail(ValidationCode::kNotFound, "pontoon " + pontoon_display_id(id) + " not found", id);
    return result;
  }
  if (pontoon->color == color) {
    result.fail(ValidationCode::kSameValue, "pontoon already has this color", id, pontoon->position);
    return result;
  }

  const Pontoon before = *pontoon;
  Pontoon after = before;
  after.color = color;
  result.ok = true;
  result.value = grid.with_pontoon(after);
  result.change_set.updated_ids.push_back(id);
  result.operations.push_back(make_operation(OperationKind::kRecolor, {id}, before, after,
                                             "Paint " + pontoon_display_id(id) + " " +
                                                 std::string(to_string(color))));
  return result;
}

EditResult<BatchOutcome> GridOperations::PlaceBatch(const Grid& grid, const SpatialIndex& index,
                                                    const std::vector<GridPosition>& positions, PontoonType type,
                                                    PontoonColor color, Rotation rotation, bool skip_invalid,
                                                    const OperationOptions& options) {
  EditResult<BatchOutcome> result;
  result.value.grid = grid;
  if (positions.empty()) {
    result.fail(ValidationCode::kInvalidArgument, "batch contains no positions");
    return result;
  }

  Grid working = grid;
  SpatialIndex working_index = index;
  std::vector<Operation> operations;
  for (const GridPosition& position : positions) {
    EditResult<Grid> step = Place(working, working_index, position, type, color, rotation, options);
    if (!step.ok) {
      if (!skip_invalid) {
        result.add_issues(ValidationResult{step.issues});
        return result;
      }
      result.value.failures.push_back({position, kInvalidObjectId, step.issues});
      add_as_warnings(result, step.issues);
      continue;
    }
    const ObjectId id = step.change_set.created_ids.front();
    working = std::move(step.value);
    if (!working_index.Insert(id, position, footprint_extent(type))) {
      working_index.Rebuild(working);
    }
    result.value.affected_ids.push_back(id);
    result.change_set.created_ids.push_back(id);
    operations.insert(operations.end(), step.operations.begin(), step.operations.end());
  }

  if (result.value.affected_ids.empty()) {
    result.fail(result.value.failures.front().issues.front().code,
                "none of the " + std::to_string(positions.size()) + " requested positions could be placed");
    result.change_set = {};
    return result;
  }

  result.ok = true;
  result.value.grid = std::move(working);
  result.operations = std::move(operations);
  result.operations.push_back(make_operation(OperationKind::kBatchPlace, result.value.affected_ids, std::nullopt,
                                             std::nullopt,
                                             "Batch place " + std::to_string(result.value.affected_ids.size()) +
                                                 " " + std::string(to_string(type)) + " pontoons"));
  return result;
}

EditResult<BatchOutcome> GridOperations::RemoveBatch(const Grid& grid, const SpatialIndex& index,
                                                     const std::vector<ObjectId>& ids, bool skip_invalid,
                                                     const OperationOptions& options) {
  EditResult<BatchOutcome> result;
  result.value.grid = grid;
  if (ids.empty()) {
    result.fail(ValidationCode::kInvalidArgument, "batch contains no pontoon ids");
    return result;
  }

  std::vector<ObjectId> ordered = ids;
  std::stable_sort(ordered.begin(), ordered.end(), [&grid](ObjectId a, ObjectId b) {
    const Pontoon* pa = grid.find(a);
    const Pontoon* pb = grid.find(b);
    const int level_a = (pa == nullptr) ? 0 : pa->position.y;
    const int level_b = (pb == nullptr) ? 0 : pb->position.y;
    return level_a > level_b;
  });

  Grid working = grid;
  SpatialIndex working_index = index;
  std::vector<Operation> operations;
  for (ObjectId id : ordered) {
    EditResult<Grid> step = Remove(working, working_index, id, options);
    if (!step.ok) {
      if (!skip_invalid) {
        result.add_issues(ValidationResult{step.issues});
        return result;
      }
      const Pontoon* pontoon = working.find(id);
      result.value.failures.push_back({pontoon == nullptr ? GridPosition{} : pontoon->position, id, step.issues});
      add_as_warnings(result, step.issues);
      continue;
    }
    working = std::move(step.value);
    if (!working_index.Remove(id)) {
      working_index.Rebuild(working);
    }
    result.value.affected_ids.push_back(id);
    result.change_set.deleted_ids.push_back(id);
    operations.insert(operations.end(), step.operations.begin(), step.operations.end());
  }

  if (result.value.affected_ids.empty()) {
    result.fail(result.value.failures.front().issues.front().code,
                "none of the " + std::to_string(ids.size()) + " requested pontoons could be removed");
    result.change_set = {};
    return result;
  }

  result.ok = true;
  result.value.grid = std::move(working);
  result.operations = std::move(operations);
  result.operations.push_back(make_operation(OperationKind::kBatchRemove, result.value.affected_ids, std::nullopt,
                                             std::nullopt,
                                             "Batch remove " + std::to_string(result.value.affected_ids.size()) +
                                                 " pontoons"));
  return result;
}

bool GridOperations::splits_platform(const Grid& before, const Grid& after) {
  const std::size_t parts_before = connected_components(before.occupied_cells()).size();
  const std::size_t parts_after = connected_components(after.occupied_cells()).size();
  return parts_after > std::max<std::size_t>(1, parts_before);
}

ValidationIssue GridOperations::disconnected_issue(const Grid& after, ObjectId id) {
  const std::size_t parts = connected_components(after.occupied_cells()).size();
  const Pontoon* pontoon = after.find(id);
  std::optional<GridPosition> where;
  if (pontoon != nullptr) {
    where = pontoon->position;
  }
  return {ValidationSeverity::kError, ValidationCode::kDisconnected,
          "edit would split the platform into " + std::to_string(parts) + " parts", where, id};
}

EditResult<Grid> as_grid_result(const EditResult<BatchOutcome>& batch) {
  EditResult<Grid> result;
  result.ok = batch.ok;
  result.value = batch.value.grid;
  result.errors = batch.errors;
  result.issues = batch.issues;
  result.operations = batch.operations;
  result.change_set = batch.change_set;
  return result;
}

} // namespace pontoon::core
