#include "pontoon/core/entities.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace pontoon::core {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<int> parse_int(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

int GridPosition::distance_to(const GridPosition& other) const {
  return std::abs(x - other.x) + std::abs(y - other.y) + std::abs(z - other.z);
}

int GridPosition::ring_distance_to(const GridPosition& other) const {
  return std::max(std::abs(x - other.x), std::abs(z - other.z));
}

std::array<GridPosition, 4> GridPosition::horizontal_neighbors() const {
  return {moved_by(1, 0, 0), moved_by(-1, 0, 0), moved_by(0, 0, 1), moved_by(0, 0, -1)};
}

std::array<GridPosition, 6> GridPosition::neighbors() const {
  return {moved_by(1, 0, 0), moved_by(-1, 0, 0), moved_by(0, 0, 1),
          moved_by(0, 0, -1), moved_by(0, 1, 0), moved_by(0, -1, 0)};
}

std::vector<GridPosition> Pontoon::cells() const { return footprint_of(position, type); }

Rotation next_rotation(Rotation rotation) {
  switch (rotation) {
  case Rotation::kNorth:
    return Rotation::kEast;
  case Rotation::kEast:
    return Rotation::kSouth;
  case Rotation::kSouth:
    return Rotation::kWest;
  case Rotation::kWest:
    return Rotation::kNorth;
  default:
    return Rotation::kNorth;
  }
}

int rotation_degrees(Rotation rotation) { return static_cast<int>(rotation) * 90; }

std::optional<Rotation> rotation_from_degrees(int degrees) {
  if (degrees % 90 != 0) {
    return std::nullopt;
  }
  const int normalized = ((degrees % 360) + 360) % 360;
  return static_cast<Rotation>(normalized / 90);
}

FootprintExtent footprint_extent(PontoonType type) {
  switch (type) {
  case PontoonType::kDouble:
    return {2, 1, 1};
  case PontoonType::kSingle:
  default:
    return {1, 1, 1};
  }
}

std::vector<GridPosition> footprint_of(const GridPosition& anchor, PontoonType type) {
  const FootprintExtent extent = footprint_extent(type);
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

std::vector<GridPosition> cells_in_box(const GridPosition& a, const GridPosition& b) {
  const int min_x = std::min(a.x, b.x);
  const int max_x = std::max(a.x, b.x);
  const int min_y = std::min(a.y, b.y);
  const int max_y = std::max(a.y, b.y);
  const int min_z = std::min(a.z, b.z);
  const int max_z = std::max(a.z, b.z);

  std::vector<GridPosition> cells;
  cells.reserve(static_cast<std::size_t>(max_x - min_x + 1) * static_cast<std::size_t>(max_y - min_y + 1) *
                static_cast<std::size_t>(max_z - min_z + 1));
  for (int y = min_y; y <= max_y; ++y) {
    for (int z = min_z; z <= max_z; ++z) {
      for (int x = min_x; x <= max_x; ++x) {
        cells.push_back({x, y, z});
      }
    }
  }
  return cells;
}

std::string_view to_string(PontoonType type) {
  switch (type) {
  case PontoonType::kSingle:
    return "single";
  case PontoonType::kDouble:
    return "double";
  default:
    return "unknown";
  }
}

std::string_view to_string(PontoonColor color) {
  switch (color) {
  case PontoonColor::kBlue:
    return "blue";
  case PontoonColor::kBlack:
    return "black";
  case PontoonColor::kGrey:
    return "grey";
  case PontoonColor::kYellow:
    return "yellow";
  default:
    return "unknown";
  }
}

std::string_view to_string(Rotation rotation) {
  switch (rotation) {
  case Rotation::kNorth:
    return "north";
  case Rotation::kEast:
    return "east";
  case Rotation::kSouth:
    return "south";
  case Rotation::kWest:
    return "west";
  default:
    return "unknown";
  }
}

std::string to_string(const GridPosition& position) {
  std::ostringstream oss;
  oss << position.x << "," << position.y << "," << position.z;
  return oss.str();
}

std::string_view display_name(PontoonType type) {
  switch (type) {
  case PontoonType::kSingle:
    return "Single Pontoon";
  case PontoonType::kDouble:
    return "Double Pontoon";
  default:
    return "Unknown Pontoon";
  }
}

std::string_view display_name(PontoonColor color) {
  switch (color) {
  case PontoonColor::kBlue:
    return "Blue";
  case PontoonColor::kBlack:
    return "Black";
  case PontoonColor::kGrey:
    return "Grey";
  case PontoonColor::kYellow:
    return "Yellow";
  default:
    return "Unknown";
  }
}

std::uint32_t color_hex(PontoonColor color) {
  switch (color) {
  case PontoonColor::kBlue:
    return 0x6183c2u;
  case PontoonColor::kBlack:
    return 0x111111u;
  case PontoonColor::kGrey:
    return 0xe3e4e5u;
  case PontoonColor::kYellow:
    return 0xf7e295u;
  default:
    return 0xffffffu;
  }
}

std::optional<PontoonType> parse_pontoon_type(std::string_view text) {
  text = trim(text);
  for (PontoonType type : kAllPontoonTypes) {
    if (equals_ignore_case(text, to_string(type))) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<PontoonColor> parse_pontoon_color(std::string_view text) {
  text = trim(text);
  for (PontoonColor color : kAllPontoonColors) {
    if (equals_ignore_case(text, to_string(color))) {
      return color;
    }
  }
  return std::nullopt;
}

std::optional<Rotation> parse_rotation(std::string_view text) {
  text = trim(text);
  for (Rotation rotation : kAllRotations) {
    if (equals_ignore_case(text, to_string(rotation))) {
      return rotation;
    }
  }
  if (const std::optional<int> degrees = parse_int(text)) {
    return rotation_from_degrees(*degrees);
  }
  return std::nullopt;
}

std::optional<GridPosition> parse_grid_position(std::string_view text) {
  std::vector<std::string_view> parts;
  while (true) {
    const std::size_t comma = text.find(',');
    if (comma == std::string_view::npos) {
      parts.push_back(text);
      break;
    }
    parts.push_back(text.substr(0, comma));
    text.remove_prefix(comma + 1);
  }
  if (parts.size() != 3) {
    return std::nullopt;
  }
  const std::optional<int> x = parse_int(parts[0]);
  const std::optional<int> y = parse_int(parts[1]);
  const std::optional<int> z = parse_int(parts[2]);
  if (!x.has_value() || !y.has_value() || !z.has_value()) {
    return std::nullopt;
  }
  return GridPosition{*x, *y, *z};
}

} // namespace pontoon::core
