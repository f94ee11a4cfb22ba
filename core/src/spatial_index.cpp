#include "pontoon/core/spatial_index.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace pontoon::core {

SpatialIndex SpatialIndex::FromGrid(const Grid& grid) {
  SpatialIndex index;
  index.Rebuild(grid);
  return index;
}

bool SpatialIndex::Rebuild(const Grid& grid) {
  occupant_by_cell_.clear();
  entries_.clear();
  occupant_by_cell_.reserve(grid.occupied_cell_count());
  entries_.reserve(grid.size());
  // A rejected insert means the grid itself breaks exclusivity.
  bool complete = true;
  for (const Pontoon& pontoon : grid.sorted_pontoons()) {
    complete = Insert(pontoon.id, pontoon.position, footprint_extent(pontoon.type)) && complete;
  }
  ++counters_.rebuilds;
  return complete;
}

void SpatialIndex::Clear() {
  occupant_by_cell_.clear();
  entries_.clear();
}

bool SpatialIndex::Insert(ObjectId id, const GridPosition& anchor, const FootprintExtent& extent) {
  if (id == kInvalidObjectId || entries_.contains(id)) {
    ++counters_.rejected_updates;
    return false;
  }
  const std::vector<GridPosition> cells = covered_cells(anchor, extent);
  if (!cells_free_for(id, cells)) {
    ++counters_.rejected_updates;
    return false;
  }
  for (const GridPosition& cell : cells) {
    occupant_by_cell_[cell] = id;
  }
  entries_[id] = Entry{anchor, extent};
  ++counters_.inserts;
  return true;
}

bool SpatialIndex::Remove(ObjectId id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    ++counters_.rejected_updates;
    return false;
  }
  for (const GridPosition& cell : covered_cells(it->second.anchor, it->second.extent)) {
    auto cell_it = occupant_by_cell_.find(cell);
    if (cell_it != occupant_by_cell_.end() && cell_it->second == id) {
      occupant_by_cell_.erase(cell_it);
    }
  }
  entries_.erase(it);
  ++counters_.removals;
  return true;
}

bool SpatialIndex::MoveElement(ObjectId id, const GridPosition& new_anchor) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    ++counters_.rejected_updates;
    return false;
  }
  const std::vector<GridPosition> new_cells = covered_cells(new_anchor, it->second.extent);
  if (!cells_free_for(id, new_cells)) {
    ++counters_.rejected_updates;
    return false;
  }

  for (const GridPosition& cell : covered_cells(it->second.anchor, it->second.extent)) {
    auto cell_it = occupant_by_cell_.find(cell);
    if (cell_it != occupant_by_cell_.end() && cell_it->second == id) {
      occupant_by_cell_.erase(cell_it);
    }
  }
  for (const GridPosition& cell : new_cells) {
    occupant_by_cell_[cell] = id;
  }
  it->second.anchor = new_anchor;
  ++counters_.moves;
  return true;
}

ObjectId SpatialIndex::OccupantAt(const GridPosition& cell) const {
  auto it = occupant_by_cell_.find(cell);
  if (it == occupant_by_cell_.end()) {
    return kInvalidObjectId;
  }
  return it->second;
}

std::optional<GridPosition> SpatialIndex::AnchorOf(ObjectId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.anchor;
}

std::vector<GridPosition> SpatialIndex::CellsOf(ObjectId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return {};
  }
  return covered_cells(it->second.anchor, it->second.extent);
}

std::vector<ObjectId> SpatialIndex::QueryRegion(const GridPosition& corner_a, const GridPosition& corner_b) const {
  const GridPosition lo{std::min(corner_a.x, corner_b.x), std::min(corner_a.y, corner_b.y),
                        std::min(corner_a.z, corner_b.z)};
  const GridPosition hi{std::max(corner_a.x, corner_b.x), std::max(corner_a.y, corner_b.y),
                        std::max(corner_a.z, corner_b.z)};
  const std::size_t box_cells = static_cast<std::size_t>(hi.x - lo.x + 1) *
                                static_cast<std::size_t>(hi.y - lo.y + 1) *
                                static_cast<std::size_t>(hi.z - lo.z + 1);

  std::unordered_set<ObjectId> found;
  if (box_cells <= occupant_by_cell_.size()) {
    for (const GridPosition& cell : cells_in_box(lo, hi)) {
      const ObjectId id = OccupantAt(cell);
      if (id != kInvalidObjectId) {
        found.insert(id);
      }
    }
  } else {
    for (const auto& [cell, id] : occupant_by_cell_) {
      if (cell.x >= lo.x && cell.x <= hi.x && cell.y >= lo.y && cell.y <= hi.y && cell.z >= lo.z &&
          cell.z <= hi.z) {
        found.insert(id);
      }
    }
  }

  std::vector<ObjectId> ids(found.begin(), found.end());
  std::sort(ids.begin(), ids.end());
  return ids;
}

ValidationResult SpatialIndex::CheckConsistency(const Grid& grid) const {
  ValidationResult result;
  std::size_t expected_cells = 0;
  for (const Pontoon& pontoon : grid.sorted_pontoons()) {
    const FootprintExtent extent = footprint_extent(pontoon.type);
    expected_cells += extent.cell_count();
    auto it = entries_.find(pontoon.id);
    if (it == entries_.end()) {
      result.issues.push_back({ValidationSeverity::kError, ValidationCode::kNotFound,
                               pontoon_display_id(pontoon.id) + " is missing from the spatial index",
                               pontoon.position, pontoon.id});
      continue;
    }
    if (!(it->second.anchor == pontoon.position) || !(it->second.extent == extent)) {
      result.issues.push_back({ValidationSeverity::kError, ValidationCode::kInvalidArgument,
                               pontoon_display_id(pontoon.id) + " is indexed at " + to_string(it->second.anchor) +
                                   " but stored at " + to_string(pontoon.position),
                               pontoon.position, pontoon.id});
      continue;
    }
    for (const GridPosition& cell : pontoon.cells()) {
      if (OccupantAt(cell) != pontoon.id) {
        result.issues.push_back({ValidationSeverity::kError, ValidationCode::kOverlap,
                                 "cell " + to_string(cell) + " is not registered to " +
                                     pontoon_display_id(pontoon.id),
                                 cell, pontoon.id});
      }
    }
  }

  for (const auto& [id, entry] : entries_) {
    if (!grid.contains(id)) {
      result.issues.push_back({ValidationSeverity::kError, ValidationCode::kNotFound,
                               pontoon_display_id(id) + " is indexed but not in the grid", entry.anchor, id});
    }
  }
  if (occupant_by_cell_.size() != expected_cells) {
    result.issues.push_back({ValidationSeverity::kError, ValidationCode::kInvalidArgument,
                             "index holds " + std::to_string(occupant_by_cell_.size()) + " cells, grid covers " +
                                 std::to_string(expected_cells),
                             std::nullopt, kInvalidObjectId});
  }
  return result;
}

CellSet SpatialIndex::occupied_cells() const {
  CellSet cells;
  cells.reserve(occupant_by_cell_.size());
  for (const auto& [cell, id] : occupant_by_cell_) {
    cells.insert(cell);
  }
  return cells;
}

SpatialIndexStats SpatialIndex::stats() const {
  SpatialIndexStats out = counters_;
  out.element_count = entries_.size();
  out.occupied_cells = occupant_by_cell_.size();
  return out;
}

std::vector<GridPosition> SpatialIndex::covered_cells(const GridPosition& anchor, const FootprintExtent& extent) {
  std::vector<GridPosition> cells;
  cells.reserve(extent.cell_count());
  for (int dy = 0; dy < extent.y; ++dy) {
    for (int dz = 0; dz < extent.z; ++dz) {
      for (int dx = 0; dx < extent.x; ++dx) {
        cells.push_back(anchor.moved_by(dx, dy, dz));
      }
    }
  }
  return cells;
}

bool SpatialIndex::cells_free_for(ObjectId id, const std::vector<GridPosition>& cells) const {
  for (const GridPosition& cell : cells) {
    auto it = occupant_by_cell_.find(cell);
    if (it != occupant_by_cell_.end() && it->second != id) {
      return false;
    }
  }
  return true;
}

} // namespace pontoon::core
