#include "pontoon/core/placement_validator.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

namespace pontoon::core {

namespace {

ValidationIssue make_error(ValidationCode code, std::string message, const GridPosition& cell,
                           ObjectId object_id = kInvalidObjectId) {
  return {ValidationSeverity::kError, code, std::move(message), cell, object_id};
}

bool footprint_contains(const std::vector<GridPosition>& cells, const GridPosition& cell) {
  return std::find(cells.begin(), cells.end(), cell) != cells.end();
}

} // namespace

ValidationResult PlacementValidator::CanPlace(const GridPosition& position, PontoonType type,
                                              ObjectId exclude_id) const {
  ValidationResult result;
  const GridDimensions& dimensions = grid_.dimensions();
  const std::vector<GridPosition> cells = footprint_of(position, type);

  std::vector<GridPosition> in_bounds;
  in_bounds.reserve(cells.size());
  for (const GridPosition& cell : cells) {
    if (!dimensions.contains(cell)) {
      result.issues.push_back(make_error(ValidationCode::kOutOfBounds,
                                         "cell " + to_string(cell) + " is outside the grid", cell, exclude_id));
      continue;
    }
    in_bounds.push_back(cell);
  }

  for (const GridPosition& cell : in_bounds) {
    const ObjectId occupant = claimant(cell, exclude_id);
    if (occupant != kInvalidObjectId) {
      result.issues.push_back(make_error(ValidationCode::kOverlap,
                                         "cell " + to_string(cell) + " is occupied by " +
                                             pontoon_display_id(occupant),
                                         cell, occupant));
    }
  }

  if (position.y > dimensions.min_level) {
    for (const GridPosition& cell : in_bounds) {
      if (!HasSupport(cell, exclude_id)) {
        result.issues.push_back(make_error(ValidationCode::kNoSupport,
                                           "cell " + to_string(cell) + " needs a pontoon directly below at " +
                                               to_string(cell.below()),
                                           cell, exclude_id));
      }
    }
  }
  return result;
}

ValidationResult PlacementValidator::CanMove(ObjectId id, const GridPosition& new_position) const {
  ValidationResult result;
  const Pontoon* pontoon = grid_.find(id);
  if (pontoon == nullptr) {
    result.issues.push_back(
        make_error(ValidationCode::kNotFound, "pontoon " + pontoon_display_id(id) + " not found", new_position, id));
    return result;
  }
  if (pontoon->position == new_position) {
    result.issues.push_back(make_error(ValidationCode::kAlreadyAtPosition,
                                       pontoon_display_id(id) + " is already at " + to_string(new_position),
                                       new_position, id));
    return result;
  }

  result = CanPlace(new_position, pontoon->type, id);

  const std::vector<GridPosition> new_cells = footprint_of(new_position, pontoon->type);
  for (ObjectId dependent_id : DependentsOf(id)) {
    const Pontoon* dependent = grid_.find(dependent_id);
    if (dependent == nullptr) {
      continue;
    }
    for (const GridPosition& cell : dependent->cells()) {
      const GridPosition below = cell.below();
      if (claimant(below, id) != kInvalidObjectId || footprint_contains(new_cells, below)) {
        continue;
      }
      result.issues.push_back(make_error(ValidationCode::kNoSupport,
                                         "moving " + pontoon_display_id(id) + " would leave " +
                                             pontoon_display_id(dependent_id) + " unsupported at " + to_string(cell),
                                         cell, dependent_id));
    }
  }
  return result;
}

ValidationResult PlacementValidator::CanRemove(ObjectId id) const {
  ValidationResult result;
  const Pontoon* pontoon = grid_.find(id);
  if (pontoon == nullptr) {
    result.issues.push_back({ValidationSeverity::kError, ValidationCode::kNotFound,
                             "pontoon " + pontoon_display_id(id) + " not found", std::nullopt, id});
    return result;
  }
  for (ObjectId dependent_id : DependentsOf(id)) {
    const Pontoon* dependent = grid_.find(dependent_id);
    const GridPosition where = (dependent == nullptr) ? pontoon->position.above() : dependent->position;
    result.issues.push_back(make_error(ValidationCode::kNoSupport,
                                       pontoon_display_id(id) + " carries " + pontoon_display_id(dependent_id) +
                                           " and cannot be removed",
                                       where, dependent_id));
  }
  return result;
}

bool PlacementValidator::HasSupport(const GridPosition& position, ObjectId exclude_id) const {
  if (position.y <= grid_.dimensions().min_level) {
    return true;
  }
  return claimant(position.below(), exclude_id) != kInvalidObjectId;
}

std::vector<ObjectId> PlacementValidator::DependentsOf(ObjectId id) const {
  std::vector<ObjectId> dependents;
  for (const GridPosition& cell : index_.CellsOf(id)) {
    const ObjectId above = index_.OccupantAt(cell.above());
    if (above != kInvalidObjectId && above != id &&
        std::find(dependents.begin(), dependents.end(), above) == dependents.end()) {
      dependents.push_back(above);
    }
  }
  std::sort(dependents.begin(), dependents.end());
  return dependents;
}

ValidationResult PlacementValidator::ValidateConnectivity() const {
  ValidationResult result;
  const std::vector<std::vector<GridPosition>> components = connected_components(index_.occupied_cells());
  if (components.size() <= 1) {
    return result;
  }
  for (std::size_t i = 1; i < components.size(); ++i) {
    const GridPosition& first = components[i].front();
    std::ostringstream oss;
    oss << "platform is split into " << components.size() << " parts; part " << (i + 1) << " ("
        << components[i].size() << " cells) starts at " << to_string(first);
    result.issues.push_back(make_error(ValidationCode::kDisconnected, oss.str(), first, index_.OccupantAt(first)));
  }
  return result;
}

std::vector<GridPosition> PlacementValidator::FindNearbyValidPositions(const GridPosition& target, PontoonType type,
                                                                       int max_distance) const {
  std::vector<GridPosition> positions;
  const GridDimensions& dimensions = grid_.dimensions();
  for (int distance = 0; distance <= max_distance; ++distance) {
    for (int dz = -distance; dz <= distance; ++dz) {
      for (int dx = -distance; dx <= distance; ++dx) {
        if (std::max(std::abs(dx), std::abs(dz)) != distance) {
          continue;
        }
        const GridPosition candidate = target.moved_by(dx, 0, dz);
        if (!dimensions.contains(candidate)) {
          continue;
        }
        if (CanPlace(candidate, type).ok()) {
          positions.push_back(candidate);
        }
      }
    }
  }
  return positions;
}

ObjectId PlacementValidator::claimant(const GridPosition& cell, ObjectId exclude_id) const {
  const ObjectId occupant = index_.OccupantAt(cell);
  if (occupant == exclude_id) {
    return kInvalidObjectId;
  }
  return occupant;
}

} // namespace pontoon::core
