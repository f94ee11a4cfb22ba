#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_set>
#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/object_store.hpp"
#include "pontoon/core/result.hpp"

namespace pontoon::core {

struct PortableGrid;

using CellSet = std::unordered_set<GridPosition, GridPositionHash>;

struct GridStatistics {
  std::size_t pontoon_count = 0;
  std::size_t occupied_cells = 0;
  std::size_t total_cells = 0;
  double utilization_percent = 0.0;
  std::map<int, std::size_t> pontoons_by_level{};
  std::map<PontoonType, std::size_t> pontoons_by_type{};
  std::map<PontoonColor, std::size_t> pontoons_by_color{};
};

// Authoritative entity table. Grid is an immutable value: every edit produces a
// new Grid through GridOperations, which validates before building it. The id
// counter travels with the value so snapshots restore ids exactly.
class Grid {
 public:
  Grid() = default;
  explicit Grid(const GridDimensions& dimensions) : dimensions_(dimensions) {}

  [[nodiscard]] const GridDimensions& dimensions() const { return dimensions_; }
  [[nodiscard]] std::size_t size() const { return pontoons_.size(); }
  [[nodiscard]] bool empty() const { return pontoons_.empty(); }
  [[nodiscard]] ObjectId next_id() const { return next_id_; }

  [[nodiscard]] bool contains(ObjectId id) const { return pontoons_.contains(id); }
  [[nodiscard]] const Pontoon* find(ObjectId id) const { return pontoons_.find(id); }
  [[nodiscard]] const std::vector<Pontoon>& pontoons() const { return pontoons_.items(); }
  [[nodiscard]] std::vector<Pontoon> sorted_pontoons() const;

  // Linear scans over the entity table. Hot paths use SpatialIndex instead.
  [[nodiscard]] const Pontoon* pontoon_at(const GridPosition& position) const;
  [[nodiscard]] bool has_pontoon_at(const GridPosition& position) const { return pontoon_at(position) != nullptr; }
  [[nodiscard]] std::vector<Pontoon> pontoons_at_level(int level) const;
  [[nodiscard]] CellSet occupied_cells() const;
  [[nodiscard]] std::size_t occupied_cell_count() const;

  [[nodiscard]] GridStatistics Statistics() const;

  // Full audit of bounds, exclusivity and support. Disconnected parts are
  // reported as a warning.
  [[nodiscard]] ValidationResult Validate() const;

  // Dimensions and pontoon mapping; storage order and the id counter are ignored.
  bool operator==(const Grid& other) const;

 private:
  friend class GridOperations;
  friend EditResult<Grid> FromPortable(const PortableGrid& portable);

  [[nodiscard]] Grid with_pontoon(const Pontoon& pontoon) const;
  [[nodiscard]] Grid without_pontoon(ObjectId id) const;

  GridDimensions dimensions_{};
  ObjectStore<Pontoon> pontoons_{};
  ObjectId next_id_ = 1;
};

// Face-adjacent components (6-neighbourhood), each sorted by y, z, x.
[[nodiscard]] std::vector<std::vector<GridPosition>> connected_components(const CellSet& cells);

}  // namespace pontoon::core
