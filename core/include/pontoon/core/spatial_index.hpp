#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/result.hpp"

namespace pontoon::core {

struct SpatialIndexStats {
  std::size_t element_count = 0;
  std::size_t occupied_cells = 0;
  std::size_t inserts = 0;
  std::size_t removals = 0;
  std::size_t moves = 0;
  std::size_t rejected_updates = 0;
  std::size_t rebuilds = 0;
};

// Derived occupancy cache: cell -> id and id -> footprint. Rebuildable from a
// Grid at any time; the Grid stays the source of truth. Every mutator either
// applies completely or leaves the index untouched.
class SpatialIndex {
 public:
  SpatialIndex() = default;

  [[nodiscard]] static SpatialIndex FromGrid(const Grid& grid);

  // Returns false when the grid breaks exclusivity and some pontoon could not be indexed.
  bool Rebuild(const Grid& grid);
  void Clear();

  // Fails without change when id is already registered or any cell is taken.
  bool Insert(ObjectId id, const GridPosition& anchor, const FootprintExtent& extent);
  bool Remove(ObjectId id);
  // Single step; fails without change when id is unknown or the new cells are
  // taken by another element.
  bool MoveElement(ObjectId id, const GridPosition& new_anchor);

  [[nodiscard]] ObjectId OccupantAt(const GridPosition& cell) const;
  [[nodiscard]] bool IsOccupied(const GridPosition& cell) const { return occupant_by_cell_.contains(cell); }
  [[nodiscard]] bool Contains(ObjectId id) const { return entries_.contains(id); }
  [[nodiscard]] std::optional<GridPosition> AnchorOf(ObjectId id) const;
  [[nodiscard]] std::vector<GridPosition> CellsOf(ObjectId id) const;
  // Ids with at least one cell inside the inclusive box, ascending.
  [[nodiscard]] std::vector<ObjectId> QueryRegion(const GridPosition& corner_a, const GridPosition& corner_b) const;

  // Compares against the entity table; one issue per mismatching id or cell.
  [[nodiscard]] ValidationResult CheckConsistency(const Grid& grid) const;
  [[nodiscard]] bool IsConsistentWith(const Grid& grid) const { return CheckConsistency(grid).ok(); }

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t occupied_cell_count() const { return occupant_by_cell_.size(); }
  [[nodiscard]] CellSet occupied_cells() const;
  [[nodiscard]] SpatialIndexStats stats() const;

 private:
  struct Entry {
    GridPosition anchor{};
    FootprintExtent extent{};
  };

  [[nodiscard]] static std::vector<GridPosition> covered_cells(const GridPosition& anchor,
                                                               const FootprintExtent& extent);
  [[nodiscard]] bool cells_free_for(ObjectId id, const std::vector<GridPosition>& cells) const;

  std::unordered_map<GridPosition, ObjectId, GridPositionHash> occupant_by_cell_{};
  std::unordered_map<ObjectId, Entry> entries_{};
  SpatialIndexStats counters_{};
};

}  // namespace pontoon::core
