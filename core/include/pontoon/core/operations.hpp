#pragma once

#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/result.hpp"
#include "pontoon/core/spatial_index.hpp"

namespace pontoon::core {

struct OperationOptions {
  // Reject edits that split the platform into more parts than it already has.
  bool enforce_connectivity = false;
};

struct BatchFailure {
  GridPosition position{};
  ObjectId id = kInvalidObjectId;
  std::vector<ValidationIssue> issues{};
};

struct BatchOutcome {
  Grid grid{};
  std::vector<ObjectId> affected_ids{};
  std::vector<BatchFailure> failures{};
};

// Validated pure transforms: Grid in, new Grid out. The index must describe
// the input grid; it is read, never written. On failure value holds the
// unchanged input grid and issues name the failing rules.
class GridOperations {
 public:
  static EditResult<Grid> Place(const Grid& grid, const SpatialIndex& index, const GridPosition& position,
                                PontoonType type, PontoonColor color, Rotation rotation,
                                const OperationOptions& options = {});
  static EditResult<Grid> Remove(const Grid& grid, const SpatialIndex& index, ObjectId id,
                                 const OperationOptions& options = {});
  static EditResult<Grid> Move(const Grid& grid, const SpatialIndex& index, ObjectId id,
                               const GridPosition& new_position, const OperationOptions& options = {});
  // Orientation only; occupancy is unchanged.
  static EditResult<Grid> Rotate(const Grid& grid, ObjectId id, Rotation rotation);
  static EditResult<Grid> Recolor(const Grid& grid, ObjectId id, PontoonColor color);

  // skip_invalid: failing positions are reported as warnings and skipped;
  // otherwise the first failure aborts the whole batch.
  static EditResult<BatchOutcome> PlaceBatch(const Grid& grid, const SpatialIndex& index,
                                             const std::vector<GridPosition>& positions, PontoonType type,
                                             PontoonColor color, Rotation rotation, bool skip_invalid,
                                             const OperationOptions& options = {});
  // Removes upper levels first so stacks can be cleared in one call.
  static EditResult<BatchOutcome> RemoveBatch(const Grid& grid, const SpatialIndex& index,
                                              const std::vector<ObjectId>& ids, bool skip_invalid,
                                              const OperationOptions& options = {});

 private:
  [[nodiscard]] static bool splits_platform(const Grid& before, const Grid& after);
  [[nodiscard]] static ValidationIssue disconnected_issue(const Grid& after, ObjectId id);
};

// Drops the batch bookkeeping so a batch can run through a Grid-valued commit path.
[[nodiscard]] EditResult<Grid> as_grid_result(const EditResult<BatchOutcome>& batch);

}  // namespace pontoon::core
