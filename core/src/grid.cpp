#include "pontoon/core/grid.hpp"

#include <algorithm>
#include <queue>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace pontoon::core {

namespace {

bool cell_less(const GridPosition& a, const GridPosition& b) {
  if (a.y != b.y) {
    return a.y < b.y;
  }
  if (a.z != b.z) {
    return a.z < b.z;
  }
  return a.x < b.x;
}

} // namespace

std::vector<Pontoon> Grid::sorted_pontoons() const { return pontoons_.items(); }

const Pontoon* Grid::pontoon_at(const GridPosition& position) const {
  for (const Pontoon& pontoon : pontoons_.items()) {
    if (pontoon.position.y != position.y || pontoon.position.z != position.z) {
      continue;
    }
    for (const GridPosition& cell : pontoon.cells()) {
      if (cell == position) {
        return &pontoon;
      }
    }
  }
  return nullptr;
}

std::vector<Pontoon> Grid::pontoons_at_level(int level) const {
  std::vector<Pontoon> out;
  for (const Pontoon& pontoon : pontoons_.items()) {
    if (pontoon.position.y == level) {
      out.push_back(pontoon);
    }
  }
  return out;
}

CellSet Grid::occupied_cells() const {
  CellSet cells;
  for (const Pontoon& pontoon : pontoons_.items()) {
    for (const GridPosition& cell : pontoon.cells()) {
      cells.insert(cell);
    }
  }
  return cells;
}

std::size_t Grid::occupied_cell_count() const {
  std::size_t count = 0;
  for (const Pontoon& pontoon : pontoons_.items()) {
    count += footprint_extent(pontoon.type).cell_count();
  }
  return count;
}

GridStatistics Grid::Statistics() const {
  GridStatistics stats;
  stats.pontoon_count = pontoons_.size();
  stats.occupied_cells = occupied_cell_count();
  stats.total_cells = dimensions_.cell_count();
  if (stats.total_cells > 0) {
    stats.utilization_percent =
        100.0 * static_cast<double>(stats.occupied_cells) / static_cast<double>(stats.total_cells);
  }
  for (const Pontoon& pontoon : pontoons_.items()) {
    ++stats.pontoons_by_level[pontoon.position.y];
    ++stats.pontoons_by_type[pontoon.type];
    ++stats.pontoons_by_color[pontoon.color];
  }
  return stats;
}

ValidationResult Grid::Validate() const {
  ValidationResult result;

  if (!dimensions_.valid()) {
    result.issues.push_back({ValidationSeverity::kError, ValidationCode::kInvalidArgument,
                             "grid dimensions must be positive", std::nullopt, kInvalidObjectId});
    return result;
  }

  std::unordered_map<GridPosition, ObjectId, GridPositionHash> claimed;
  for (const Pontoon& pontoon : sorted_pontoons()) {
    if (pontoon.id == kInvalidObjectId) {
      result.issues.push_back({ValidationSeverity::kError, ValidationCode::kInvalidArgument,
                               "pontoon has invalid id", pontoon.position, pontoon.id});
    }
    for (const GridPosition& cell : pontoon.cells()) {
      if (!dimensions_.contains(cell)) {
        result.issues.push_back({ValidationSeverity::kError, ValidationCode::kOutOfBounds,
                                 "cell " + to_string(cell) + " is outside the grid", cell, pontoon.id});
        continue;
      }
      auto [it, inserted] = claimed.emplace(cell, pontoon.id);
      if (!inserted) {
        std::ostringstream oss;
        oss << "cell " << to_string(cell) << " is claimed by " << pontoon_display_id(it->second) << " and "
            << pontoon_display_id(pontoon.id);
        result.issues.push_back(
            {ValidationSeverity::kError, ValidationCode::kOverlap, oss.str(), cell, pontoon.id});
      }
    }
  }

  for (const Pontoon& pontoon : sorted_pontoons()) {
    if (pontoon.position.y <= dimensions_.min_level) {
      continue;
    }
    for (const GridPosition& cell : pontoon.cells()) {
      if (!claimed.contains(cell.below())) {
        result.issues.push_back({ValidationSeverity::kError, ValidationCode::kNoSupport,
                                 "cell " + to_string(cell) + " has nothing below it", cell, pontoon.id});
      }
    }
  }

  CellSet cells;
  for (const auto& [cell, id] : claimed) {
    cells.insert(cell);
  }
  const std::size_t component_count = connected_components(cells).size();
  if (component_count > 1) {
    result.issues.push_back({ValidationSeverity::kWarning, ValidationCode::kDisconnected,
                             "platform consists of " + std::to_string(component_count) + " separate parts",
                             std::nullopt, kInvalidObjectId});
  }
  return result;
}

bool Grid::operator==(const Grid& other) const {
  return dimensions_ == other.dimensions_ && pontoons_.same_contents(other.pontoons_);
}

Grid Grid::with_pontoon(const Pontoon& pontoon) const {
  Grid next = *this;
  next.pontoons_.upsert(pontoon);
  next.next_id_ = std::max(next.next_id_, pontoon.id + 1);
  return next;
}

Grid Grid::without_pontoon(ObjectId id) const {
  Grid next = *this;
  next.pontoons_.remove(id);
  return next;
}

std::vector<std::vector<GridPosition>> connected_components(const CellSet& cells) {
  std::vector<GridPosition> ordered(cells.begin(), cells.end());
  std::sort(ordered.begin(), ordered.end(), cell_less);

  std::vector<std::vector<GridPosition>> components;
  CellSet visited;
  visited.reserve(cells.size());
  for (const GridPosition& start : ordered) {
    if (visited.contains(start)) {
      continue;
    }
    std::vector<GridPosition> component;
    std::queue<GridPosition> queue;
    queue.push(start);
    visited.insert(start);
    while (!queue.empty()) {
      const GridPosition current = queue.front();
      queue.pop();
      component.push_back(current);
      for (const GridPosition& next : current.neighbors()) {
        if (!cells.contains(next) || visited.contains(next)) {
          continue;
        }
        visited.insert(next);
        queue.push(next);
      }
    }
    std::sort(component.begin(), component.end(), cell_less);
    components.push_back(std::move(component));
  }
  return components;
}

} // namespace pontoon::core
