#include "pontoon/core/coordinate_calculator.hpp"

#include <cmath>
#include <functional>
#include <limits>

namespace pontoon::core {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kParallelEps = 1e-9;

// Saturates instead of overflowing; NaN maps to the lowest index.
int saturating_index(double value) {
  constexpr double kLowest = static_cast<double>(std::numeric_limits<int>::min());
  constexpr double kHighest = static_cast<double>(std::numeric_limits<int>::max());
  if (!(value > kLowest)) {
    return std::numeric_limits<int>::min();
  }
  if (!(value < kHighest)) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(value);
}

} // namespace

std::size_t CoordinateCalculator::CacheKeyHash::operator()(const CacheKey& key) const {
  std::size_t h = std::hash<double>{}(key.x);
  h ^= std::hash<double>{}(key.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
  h ^= std::hash<int>{}(key.level) + 0x9e3779b9 + (h << 6) + (h >> 2);
  return h;
}

CoordinateCalculator::CoordinateCalculator(const CoordinateSettings& settings) : settings_(settings) {}

std::optional<GridPosition> CoordinateCalculator::ScreenToGrid(const ScreenPoint& pointer, const Camera& camera,
                                                               const Viewport& viewport,
                                                               const GridDimensions& dimensions, int active_level) {
  const CacheSignature signature{camera, viewport, dimensions};
  if (!cache_signature_.has_value() || !(*cache_signature_ == signature)) {
    if (cache_signature_.has_value()) {
      ++cache_counters_.invalidations;
    }
    cache_.clear();
    cache_signature_ = signature;
  }

  const bool cacheable = std::isfinite(pointer.x) && std::isfinite(pointer.y) && settings_.cache_capacity > 0;
  const CacheKey key{pointer.x, pointer.y, active_level};
  if (cacheable) {
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      ++cache_counters_.hits;
      return it->second;
    }
  }

  ++cache_counters_.misses;
  const std::optional<GridPosition> cell = resolve_cell(pointer, camera, viewport, dimensions, active_level);
  if (cacheable) {
    if (cache_.size() >= settings_.cache_capacity) {
      cache_.clear();
    }
    cache_.emplace(key, cell);
  }
  return cell;
}

std::optional<Ray3d> CoordinateCalculator::ScreenRay(const ScreenPoint& pointer, const Camera& camera,
                                                     const Viewport& viewport) const {
  if (!(viewport.width > 0.0) || !(viewport.height > 0.0)) {
    return std::nullopt;
  }
  if (!(pointer.x >= 0.0 && pointer.x < viewport.width && pointer.y >= 0.0 && pointer.y < viewport.height)) {
    return std::nullopt;
  }

  const Vec3d forward = normalized(camera.target - camera.position);
  const Vec3d right = normalized(cross(forward, camera.up));
  if (length(forward) <= 0.0 || length(right) <= 0.0) {
    return std::nullopt;
  }
  const Vec3d true_up = cross(right, forward);

  // Normalised device coordinates, +y up.
  const double ndc_x = (pointer.x / viewport.width) * 2.0 - 1.0;
  const double ndc_y = 1.0 - (pointer.y / viewport.height) * 2.0;
  const double aspect = viewport.width / viewport.height;

  Ray3d ray;
  if (camera.projection == CameraProjection::kOrthographic) {
    const double half_height = camera.fovy_deg * 0.5;
    ray.origin = camera.position + right * (ndc_x * half_height * aspect) + true_up * (ndc_y * half_height);
    ray.direction = forward;
    return ray;
  }

  const double tan_half = std::tan(camera.fovy_deg * 0.5 * kPi / 180.0);
  ray.origin = camera.position;
  ray.direction = normalized(forward + right * (ndc_x * tan_half * aspect) + true_up * (ndc_y * tan_half));
  return ray;
}

std::optional<Vec3d> CoordinateCalculator::IntersectLevel(const Ray3d& ray, int level) const {
  if (std::abs(ray.direction.y) < kParallelEps) {
    return std::nullopt;
  }
  const double t = (LevelWorldY(level) - ray.origin.y) / ray.direction.y;
  if (t < 0.0) {
    return std::nullopt;
  }
  return ray.origin + ray.direction * t;
}

Vec3d CoordinateCalculator::GridToWorld(const GridPosition& position, const GridDimensions& dimensions) const {
  const double cell = settings_.cell_size_m;
  return {
      (static_cast<double>(position.x) - dimensions.width * 0.5 + 0.5) * cell,
      LevelWorldY(position.y),
      (static_cast<double>(position.z) - dimensions.height * 0.5 + 0.5) * cell,
  };
}

GridPosition CoordinateCalculator::WorldToGrid(const Vec3d& world, const GridDimensions& dimensions) const {
  const double cell = settings_.cell_size_m;
  return {
      saturating_index(std::floor(world.x / cell + dimensions.width * 0.5)),
      saturating_index(std::round(world.y / settings_.level_height_m)),
      saturating_index(std::floor(world.z / cell + dimensions.height * 0.5)),
  };
}

Vec3d CoordinateCalculator::GridIntersectionToWorld(int ix, int iz, int level,
                                                    const GridDimensions& dimensions) const {
  const double cell = settings_.cell_size_m;
  return {
      (static_cast<double>(ix) - dimensions.width * 0.5) * cell,
      LevelWorldY(level),
      (static_cast<double>(iz) - dimensions.height * 0.5) * cell,
  };
}

Vec3d CoordinateCalculator::FootprintCenter(const GridPosition& anchor, PontoonType type,
                                            const GridDimensions& dimensions) const {
  const FootprintExtent extent = footprint_extent(type);
  const Vec3d first = GridToWorld(anchor, dimensions);
  const double cell = settings_.cell_size_m;
  return {
      first.x + (extent.x - 1) * cell * 0.5,
      first.y,
      first.z + (extent.z - 1) * cell * 0.5,
  };
}

double CoordinateCalculator::LevelWorldY(int level) const {
  return static_cast<double>(level) * settings_.level_height_m;
}

bool CoordinateCalculator::IsInBounds(const Vec3d& world, const GridDimensions& dimensions) const {
  return dimensions.valid() && dimensions.contains(WorldToGrid(world, dimensions));
}

void CoordinateCalculator::ClearCache() {
  cache_.clear();
  cache_signature_.reset();
}

void CoordinateCalculator::UpdateSettings(const CoordinateSettings& settings) {
  settings_ = settings;
  ClearCache();
}

CoordinateCacheStats CoordinateCalculator::cache_stats() const {
  CoordinateCacheStats out = cache_counters_;
  out.entries = cache_.size();
  return out;
}

std::optional<GridPosition> CoordinateCalculator::resolve_cell(const ScreenPoint& pointer, const Camera& camera,
                                                               const Viewport& viewport,
                                                               const GridDimensions& dimensions,
                                                               int active_level) const {
  if (!dimensions.valid() || !dimensions.contains_level(active_level)) {
    return std::nullopt;
  }
  const std::optional<Ray3d> ray = ScreenRay(pointer, camera, viewport);
  if (!ray.has_value()) {
    return std::nullopt;
  }
  const std::optional<Vec3d> hit = IntersectLevel(*ray, active_level);
  if (!hit.has_value()) {
    return std::nullopt;
  }
  // Grazing rays land arbitrarily far away, so range-check before converting.
  const double fx = hit->x / settings_.cell_size_m + dimensions.width * 0.5;
  const double fz = hit->z / settings_.cell_size_m + dimensions.height * 0.5;
  if (!(fx >= 0.0 && fx < dimensions.width) || !(fz >= 0.0 && fz < dimensions.height)) {
    return std::nullopt;
  }
  return GridPosition{static_cast<int>(std::floor(fx)), active_level, static_cast<int>(std::floor(fz))};
}

} // namespace pontoon::core
