#include "pontoon/core/portable.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace pontoon::core {

PortableGrid ToPortable(const Grid& grid) {
  PortableGrid portable;
  portable.dimensions = grid.dimensions();
  portable.next_id = grid.next_id();
  for (const Pontoon& pontoon : grid.sorted_pontoons()) {
    PortablePontoon item;
    item.id = pontoon.id;
    item.position = pontoon.position;
    item.type = std::string(to_string(pontoon.type));
    item.color = std::string(to_string(pontoon.color));
    item.rotation_deg = rotation_degrees(pontoon.rotation);
    portable.pontoons.push_back(std::move(item));
  }
  return portable;
}

EditResult<Grid> FromPortable(const PortableGrid& portable) {
  EditResult<Grid> result;
  if (!portable.dimensions.valid()) {
    result.fail(ValidationCode::kInvalidArgument, "grid dimensions must be positive");
    return result;
  }

  Grid grid(portable.dimensions);
  std::unordered_set<ObjectId> seen_ids;
  ObjectId max_id = kInvalidObjectId;
  for (const PortablePontoon& item : portable.pontoons) {
    if (item.id == kInvalidObjectId) {
      result.fail(ValidationCode::kInvalidArgument, "pontoon id must be non-zero", item.id, item.position);
      continue;
    }
    if (!seen_ids.insert(item.id).second) {
      result.fail(ValidationCode::kInvalidArgument, "duplicate pontoon id " + pontoon_display_id(item.id), item.id,
                  item.position);
      continue;
    }
    const std::optional<PontoonType> type = parse_pontoon_type(item.type);
    const std::optional<PontoonColor> color = parse_pontoon_color(item.color);
    const std::optional<Rotation> rotation = rotation_from_degrees(item.rotation_deg);
    if (!type.has_value()) {
      result.fail(ValidationCode::kInvalidArgument, "unknown pontoon type '" + item.type + "'", item.id,
                  item.position);
    }
    if (!color.has_value()) {
      result.fail(ValidationCode::kInvalidArgument, "unknown pontoon color '" + item.color + "'", item.id,
                  item.position);
    }
    if (!rotation.has_value()) {
      result.fail(ValidationCode::kInvalidArgument,
                  "rotation must be a multiple of 90 degrees, got " + std::to_string(item.rotation_deg), item.id,
                  item.position);
    }
    if (!type.has_value() || !color.has_value() || !rotation.has_value()) {
      continue;
    }

    Pontoon pontoon;
    pontoon.id = item.id;
    pontoon.position = item.position;
    pontoon.type = *type;
    pontoon.color = *color;
    pontoon.rotation = *rotation;
    grid = grid.with_pontoon(pontoon);
    max_id = std::max(max_id, item.id);
  }
  if (!result.issues.empty()) {
    return result;
  }

  const ValidationResult audit = grid.Validate();
  if (audit.has_errors()) {
    result.add_issues(audit);
    return result;
  }

  // Warnings (a disconnected layout) do not block loading.
  result.issues = audit.issues;
  grid.next_id_ = std::max(portable.next_id, max_id + 1);
  result.ok = true;
  result.value = std::move(grid);
  for (ObjectId id : result.value.pontoons_.sorted_ids()) {
    result.change_set.created_ids.push_back(id);
  }
  return result;
}

} // namespace pontoon::core
