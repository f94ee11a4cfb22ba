#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pontoon/core/id.hpp"

namespace pontoon::core {

enum class Rotation : std::uint8_t {
  kNorth = 0,
  kEast = 1,
  kSouth = 2,
  kWest = 3,
};

enum class PontoonType : std::uint8_t {
  kSingle = 0,
  kDouble = 1,
};

enum class PontoonColor : std::uint8_t {
  kBlue = 0,
  kBlack = 1,
  kGrey = 2,
  kYellow = 3,
};

constexpr std::array<PontoonType, 2> kAllPontoonTypes = {PontoonType::kSingle, PontoonType::kDouble};
constexpr std::array<PontoonColor, 4> kAllPontoonColors = {
    PontoonColor::kBlue, PontoonColor::kBlack, PontoonColor::kGrey, PontoonColor::kYellow};
constexpr std::array<Rotation, 4> kAllRotations = {Rotation::kNorth, Rotation::kEast, Rotation::kSouth,
                                                   Rotation::kWest};

// Discrete cell address. x/z are horizontal, y is the level (0 = water surface).
struct GridPosition {
  int x = 0;
  int y = 0;
  int z = 0;

  bool operator==(const GridPosition& other) const = default;

  [[nodiscard]] GridPosition moved_by(int dx, int dy, int dz) const { return {x + dx, y + dy, z + dz}; }
  [[nodiscard]] GridPosition below() const { return {x, y - 1, z}; }
  [[nodiscard]] GridPosition above() const { return {x, y + 1, z}; }
  [[nodiscard]] GridPosition with_level(int level) const { return {x, level, z}; }

  // Manhattan distance over all three axes.
  [[nodiscard]] int distance_to(const GridPosition& other) const;
  // Chebyshev distance on the horizontal plane; levels are ignored.
  [[nodiscard]] int ring_distance_to(const GridPosition& other) const;

  [[nodiscard]] std::array<GridPosition, 4> horizontal_neighbors() const;
  [[nodiscard]] std::array<GridPosition, 6> neighbors() const;
};

struct GridPositionHash {
  std::size_t operator()(const GridPosition& position) const {
    std::size_t h = std::hash<int>{}(position.x);
    h ^= std::hash<int>{}(position.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<int>{}(position.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};

// Cells covered along each axis, counted from the anchor towards +x/+y/+z.
struct FootprintExtent {
  int x = 1;
  int y = 1;
  int z = 1;

  bool operator==(const FootprintExtent& other) const = default;

  [[nodiscard]] std::size_t cell_count() const {
    return static_cast<std::size_t>(x) * static_cast<std::size_t>(y) * static_cast<std::size_t>(z);
  }
};

// Entity-layer building block. Owned by the Grid value that issued its id.
struct Pontoon {
  ObjectId id = kInvalidObjectId;
  GridPosition position{};
  PontoonType type = PontoonType::kSingle;
  PontoonColor color = PontoonColor::kBlue;
  Rotation rotation = Rotation::kNorth;

  bool operator==(const Pontoon& other) const = default;

  [[nodiscard]] std::vector<GridPosition> cells() const;
};

struct GridDimensions {
  int width = 0;      // cells along X
  int height = 0;     // cells along Z
  int levels = 0;     // stacked levels along Y
  int min_level = 0;  // lowest level; negative for underwater foundations

  bool operator==(const GridDimensions& other) const = default;

  [[nodiscard]] int max_level() const { return min_level + levels - 1; }
  [[nodiscard]] bool valid() const { return width > 0 && height > 0 && levels > 0; }
  [[nodiscard]] bool contains(const GridPosition& position) const {
    return position.x >= 0 && position.x < width && position.z >= 0 && position.z < height &&
           position.y >= min_level && position.y <= max_level();
  }
  [[nodiscard]] bool contains_level(int level) const { return level >= min_level && level <= max_level(); }
  [[nodiscard]] std::size_t cell_count() const {
    if (!valid()) {
      return 0;
    }
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * static_cast<std::size_t>(levels);
  }
};

[[nodiscard]] Rotation next_rotation(Rotation rotation);
[[nodiscard]] int rotation_degrees(Rotation rotation);
[[nodiscard]] std::optional<Rotation> rotation_from_degrees(int degrees);

[[nodiscard]] FootprintExtent footprint_extent(PontoonType type);
// Footprint depends on anchor and type only. Rotation is orientation metadata.
[[nodiscard]] std::vector<GridPosition> footprint_of(const GridPosition& anchor, PontoonType type);
// Inclusive axis-aligned box between two corners, ordered by y, z, then x.
[[nodiscard]] std::vector<GridPosition> cells_in_box(const GridPosition& a, const GridPosition& b);

[[nodiscard]] std::string_view to_string(PontoonType type);
[[nodiscard]] std::string_view to_string(PontoonColor color);
[[nodiscard]] std::string_view to_string(Rotation rotation);
[[nodiscard]] std::string to_string(const GridPosition& position);
[[nodiscard]] std::string_view display_name(PontoonType type);
[[nodiscard]] std::string_view display_name(PontoonColor color);
// 0xRRGGBB.
[[nodiscard]] std::uint32_t color_hex(PontoonColor color);

[[nodiscard]] std::optional<PontoonType> parse_pontoon_type(std::string_view text);
[[nodiscard]] std::optional<PontoonColor> parse_pontoon_color(std::string_view text);
[[nodiscard]] std::optional<Rotation> parse_rotation(std::string_view text);
// Accepts "x,y,z" with optional surrounding whitespace.
[[nodiscard]] std::optional<GridPosition> parse_grid_position(std::string_view text);

}  // namespace pontoon::core
