#pragma once

#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/result.hpp"
#include "pontoon/core/spatial_index.hpp"

namespace pontoon::core {

// Rules consulted identically for hover preview and for commits. Holds
// references only; the grid and index must outlive the validator and agree
// with each other.
//
// Every check reports the full ordered issue list: bounds, overlap, support,
// then dependants. Overlap and support are only evaluated for in-bounds cells.
class PlacementValidator {
 public:
  PlacementValidator(const Grid& grid, const SpatialIndex& index) : grid_(grid), index_(index) {}

  // exclude_id's current cells count neither as overlap nor as support.
  [[nodiscard]] ValidationResult CanPlace(const GridPosition& position, PontoonType type,
                                          ObjectId exclude_id = kInvalidObjectId) const;
  [[nodiscard]] ValidationResult CanMove(ObjectId id, const GridPosition& new_position) const;
  // Fails NO_SUPPORT while another pontoon rests on id.
  [[nodiscard]] ValidationResult CanRemove(ObjectId id) const;

  [[nodiscard]] bool HasSupport(const GridPosition& position, ObjectId exclude_id = kInvalidObjectId) const;
  // Pontoons with at least one cell directly above one of id's cells.
  [[nodiscard]] std::vector<ObjectId> DependentsOf(ObjectId id) const;

  // One issue per extra component; empty and single-cell layouts pass.
  [[nodiscard]] ValidationResult ValidateConnectivity() const;

  // Chebyshev rings on target's level, nearest ring first, then z, then x.
  [[nodiscard]] std::vector<GridPosition> FindNearbyValidPositions(const GridPosition& target, PontoonType type,
                                                                   int max_distance) const;

 private:
  [[nodiscard]] ObjectId claimant(const GridPosition& cell, ObjectId exclude_id) const;

  const Grid& grid_;
  const SpatialIndex& index_;
};

}  // namespace pontoon::core
