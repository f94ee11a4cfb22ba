#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/types.hpp"

namespace pontoon::core {

enum class CameraProjection : std::uint8_t {
  kPerspective = 0,
  kOrthographic = 1,
};

struct Camera {
  Vec3d position{12.0, 14.0, 12.0};
  Vec3d target{};
  Vec3d up{0.0, 1.0, 0.0};
  // Vertical field of view for perspective, visible height in metres for orthographic.
  double fovy_deg = 45.0;
  CameraProjection projection = CameraProjection::kPerspective;

  bool operator==(const Camera& other) const = default;
};

struct Viewport {
  double width = 0.0;
  double height = 0.0;

  bool operator==(const Viewport& other) const = default;
};

struct CoordinateSettings {
  double cell_size_m = 0.5;
  double level_height_m = 0.4;
  std::size_t cache_capacity = 1024;
};

struct CoordinateCacheStats {
  std::size_t entries = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t invalidations = 0;
};

// Single authority for pointer -> world -> cell conversions. Hover preview and
// commit both resolve cells here, so identical inputs always give identical cells.
//
// The grid is centred on the world origin: cell (x, z) spans
// [(x - width/2) * cell, (x - width/2 + 1) * cell) and level y sits at
// y * level_height.
class CoordinateCalculator {
 public:
  explicit CoordinateCalculator(const CoordinateSettings& settings = {});

  // Cell under the pointer on the active level, or nullopt when the pointer is
  // outside the viewport, the ray misses the level plane, or the hit is off-grid.
  [[nodiscard]] std::optional<GridPosition> ScreenToGrid(const ScreenPoint& pointer, const Camera& camera,
                                                         const Viewport& viewport, const GridDimensions& dimensions,
                                                         int active_level);

  [[nodiscard]] std::optional<Ray3d> ScreenRay(const ScreenPoint& pointer, const Camera& camera,
                                               const Viewport& viewport) const;
  [[nodiscard]] std::optional<Vec3d> IntersectLevel(const Ray3d& ray, int level) const;

  // Centre of the cell's footprint on the level plane.
  [[nodiscard]] Vec3d GridToWorld(const GridPosition& position, const GridDimensions& dimensions) const;
  // Exact inverse of GridToWorld; no bounds check.
  [[nodiscard]] GridPosition WorldToGrid(const Vec3d& world, const GridDimensions& dimensions) const;
  // Corner point between cells, ix in [0, width], iz in [0, height].
  [[nodiscard]] Vec3d GridIntersectionToWorld(int ix, int iz, int level, const GridDimensions& dimensions) const;
  // Centre of a whole pontoon footprint; differs from GridToWorld for DOUBLE.
  [[nodiscard]] Vec3d FootprintCenter(const GridPosition& anchor, PontoonType type,
                                      const GridDimensions& dimensions) const;
  [[nodiscard]] double LevelWorldY(int level) const;
  // True when the world point lies over a grid cell within the level range.
  [[nodiscard]] bool IsInBounds(const Vec3d& world, const GridDimensions& dimensions) const;

  void ClearCache();
  void UpdateSettings(const CoordinateSettings& settings);

  [[nodiscard]] const CoordinateSettings& settings() const { return settings_; }
  [[nodiscard]] CoordinateCacheStats cache_stats() const;

 private:
  struct CacheKey {
    double x = 0.0;
    double y = 0.0;
    int level = 0;

    bool operator==(const CacheKey& other) const = default;
  };

  struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const;
  };

  struct CacheSignature {
    Camera camera{};
    Viewport viewport{};
    GridDimensions dimensions{};

    bool operator==(const CacheSignature& other) const = default;
  };

  [[nodiscard]] std::optional<GridPosition> resolve_cell(const ScreenPoint& pointer, const Camera& camera,
                                                         const Viewport& viewport, const GridDimensions& dimensions,
                                                         int active_level) const;

  CoordinateSettings settings_{};
  std::optional<CacheSignature> cache_signature_{};
  std::unordered_map<CacheKey, std::optional<GridPosition>, CacheKeyHash> cache_{};
  CoordinateCacheStats cache_counters_{};
};

}  // namespace pontoon::core
