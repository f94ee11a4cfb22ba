#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "pontoon/core/configurator.hpp"
#include "pontoon/core/coordinate_calculator.hpp"
#include "pontoon/core/entities.hpp"
#include "pontoon/core/event_log.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/history.hpp"
#include "pontoon/core/log.hpp"
#include "pontoon/core/operations.hpp"
#include "pontoon/core/pipeline.hpp"
#include "pontoon/core/placement_validator.hpp"
#include "pontoon/core/portable.hpp"
#include "pontoon/core/spatial_index.hpp"

namespace {

using pontoon::core::CameraProjection;
using pontoon::core::Configurator;
using pontoon::core::CoordinateCalculator;
using pontoon::core::EditorEventKind;
using pontoon::core::EditorSettings;
using pontoon::core::EventLog;
using pontoon::core::Grid;
using pontoon::core::GridDimensions;
using pontoon::core::GridOperations;
using pontoon::core::GridPosition;
using pontoon::core::HistoryLedger;
using pontoon::core::InputEvent;
using pontoon::core::InputKind;
using pontoon::core::Key;
using pontoon::core::MoveToolState;
using pontoon::core::ObjectId;
using pontoon::core::OperationKind;
using pontoon::core::OperationPipeline;
using pontoon::core::PipelineOutcome;
using pontoon::core::PipelineResult;
using pontoon::core::PlacementValidator;
using pontoon::core::PontoonColor;
using pontoon::core::PontoonType;
using pontoon::core::PortableGrid;
using pontoon::core::PortablePontoon;
using pontoon::core::Rotation;
using pontoon::core::ScreenPoint;
using pontoon::core::SpatialIndex;
using pontoon::core::ToolKind;
using pontoon::core::ToolSettings;
using pontoon::core::ValidationCode;
using pontoon::core::ValidationIssue;
using pontoon::core::ValidationResult;
using pontoon::core::ValidationSeverity;
using pontoon::core::ViewContext;

constexpr GridDimensions kTenByTen{10, 10, 3, 0};

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool contains_id(const std::vector<ObjectId>& ids, ObjectId id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool has_issue_code(const std::vector<ValidationIssue>& issues, ValidationCode code) {
  for (const auto& issue : issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool almost_equal(const pontoon::core::Vec3d& a, const pontoon::core::Vec3d& b, double eps = 1e-9) {
  return almost_equal(a.x, b.x, eps) && almost_equal(a.y, b.y, eps) && almost_equal(a.z, b.z, eps);
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

// Orthographic camera looking straight down on a 10x10 grid of 0.5 m cells:
// the 100x100 px viewport shows exactly the grid, 10 px per cell.
ViewContext top_down_view() {
  ViewContext view;
  view.camera.position = {0.0, 10.0, 0.0};
  view.camera.target = {0.0, 0.0, 0.0};
  view.camera.up = {0.0, 0.0, -1.0};
  view.camera.fovy_deg = 5.0;
  view.camera.projection = CameraProjection::kOrthographic;
  view.viewport = {100.0, 100.0};
  return view;
}

ScreenPoint pixel_of(int x, int z) {
  return {(x + 0.5) * 10.0, (z + 0.5) * 10.0};
}

InputEvent pointer_event(InputKind kind, int x, int z) {
  InputEvent event;
  event.kind = kind;
  event.pointer = pixel_of(x, z);
  return event;
}

InputEvent key_event(Key key, bool ctrl = false, bool shift = false) {
  InputEvent event;
  event.kind = InputKind::kKey;
  event.key = key;
  event.modifiers.ctrl = ctrl;
  event.modifiers.shift = shift;
  return event;
}

ToolSettings tool_of(ToolKind kind, PontoonType type = PontoonType::kSingle, int level = 0) {
  ToolSettings tool;
  tool.tool = kind;
  tool.type = type;
  tool.active_level = level;
  return tool;
}

ObjectId place_id(Configurator& editor, const GridPosition& position, PontoonType type = PontoonType::kSingle,
                  PontoonColor color = PontoonColor::kBlue) {
  const auto result = editor.PlacePontoon(position, type, color);
  if (!result.ok || result.change_set.created_ids.empty()) {
    return pontoon::core::kInvalidObjectId;
  }
  return result.change_set.created_ids.front();
}

// Intent: DOUBLE covers anchor and x+1; rotation never changes the footprint.
bool test_footprint_is_function_of_anchor_and_type() {
  const auto cells = pontoon::core::footprint_of({3, 1, 4}, PontoonType::kDouble);
  if (cells.size() != 2 || !(cells[0] == GridPosition{3, 1, 4}) || !(cells[1] == GridPosition{4, 1, 4})) {
    return false;
  }

  pontoon::core::Pontoon north;
  north.position = {3, 1, 4};
  north.type = PontoonType::kDouble;
  pontoon::core::Pontoon east = north;
  east.rotation = Rotation::kEast;
  return north.cells() == east.cells() &&
         pontoon::core::footprint_of({0, 0, 0}, PontoonType::kSingle).size() == 1 &&
         pontoon::core::footprint_extent(PontoonType::kDouble).cell_count() == 2;
}

// Intent: Catalogue strings and rotation cycle match the portable form.
bool test_catalogue_and_rotation_cycle() {
  Rotation rotation = Rotation::kNorth;
  for (int i = 0; i < 4; ++i) {
    rotation = pontoon::core::next_rotation(rotation);
  }
  return rotation == Rotation::kNorth &&
         pontoon::core::next_rotation(Rotation::kWest) == Rotation::kNorth &&
         pontoon::core::rotation_degrees(Rotation::kSouth) == 180 &&
         pontoon::core::to_string(PontoonType::kDouble) == "double" &&
         pontoon::core::display_name(PontoonType::kSingle) == "Single Pontoon" &&
         pontoon::core::display_name(PontoonColor::kGrey) == "Grey" &&
         pontoon::core::color_hex(PontoonColor::kBlue) == 0x6183c2u &&
         pontoon::core::color_hex(PontoonColor::kYellow) == 0xf7e295u &&
         pontoon::core::pontoon_display_id(12) == "PN-000012" &&
         pontoon::core::to_string(GridPosition{1, -2, 3}) == "1,-2,3";
}

// Intent: Text parsers accept exact forms and reject malformed ones.
bool test_parse_helpers() {
  const auto position = pontoon::core::parse_grid_position(" 4, 0 ,7");
  return position.has_value() && *position == GridPosition{4, 0, 7} &&
         !pontoon::core::parse_grid_position("1,2").has_value() &&
         !pontoon::core::parse_grid_position("1,2,3,4").has_value() &&
         !pontoon::core::parse_grid_position("a,b,c").has_value() &&
         pontoon::core::parse_rotation("90") == Rotation::kEast &&
         pontoon::core::parse_rotation("West") == Rotation::kWest &&
         !pontoon::core::parse_rotation("45").has_value() &&
         pontoon::core::parse_pontoon_type("DOUBLE") == PontoonType::kDouble &&
         !pontoon::core::parse_pontoon_color("pink").has_value();
}

// Intent: Box enumeration is inclusive and ordered by y, z, then x.
bool test_cells_in_box_order() {
  const auto cells = pontoon::core::cells_in_box({2, 0, 1}, {0, 0, 0});
  return cells.size() == 6 &&
         cells.front() == GridPosition{0, 0, 0} &&
         cells[1] == GridPosition{1, 0, 0} &&
         cells[3] == GridPosition{0, 0, 1} &&
         cells.back() == GridPosition{2, 0, 1};
}

// Intent: Operations return a new Grid and never touch their input.
bool test_grid_is_immutable_value() {
  const Grid empty(kTenByTen);
  const SpatialIndex index = SpatialIndex::FromGrid(empty);
  const auto placed = GridOperations::Place(empty, index, {1, 0, 1}, PontoonType::kSingle, PontoonColor::kBlue,
                                            Rotation::kNorth);
  if (!placed.ok) {
    return false;
  }
  return empty.empty() && placed.value.size() == 1 && empty.next_id() == 1 && placed.value.next_id() == 2 &&
         placed.value.find(1) != nullptr && !(placed.value == empty);
}

// Intent: Statistics count cells, levels, types and colours.
bool test_grid_statistics() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {0, 0, 0}, PontoonType::kDouble) == 0 ||
      place_id(editor, {0, 1, 0}, PontoonType::kSingle, PontoonColor::kYellow) == 0) {
    return false;
  }
  const auto stats = editor.Statistics();
  return stats.pontoon_count == 2 && stats.occupied_cells == 3 && stats.total_cells == 300 &&
         almost_equal(stats.utilization_percent, 1.0) &&
         stats.pontoons_by_level.at(0) == 1 && stats.pontoons_by_level.at(1) == 1 &&
         stats.pontoons_by_type.at(PontoonType::kDouble) == 1 &&
         stats.pontoons_by_color.at(PontoonColor::kYellow) == 1 &&
         editor.PontoonsAtLevel(1).size() == 1;
}

// Intent: Index updates are all-or-nothing and own cells never block a move.
bool test_spatial_index_atomic_updates() {
  SpatialIndex index;
  if (!index.Insert(1, {0, 0, 0}, {2, 1, 1})) {
    return false;
  }
  const bool overlap_rejected = !index.Insert(2, {1, 0, 0}, {1, 1, 1});
  const bool duplicate_rejected = !index.Insert(1, {5, 0, 5}, {1, 1, 1});
  const bool zero_rejected = !index.Insert(0, {6, 0, 6}, {1, 1, 1});
  if (!index.Insert(2, {2, 0, 0}, {1, 1, 1})) {
    return false;
  }

  const bool blocked_move_rejected = !index.MoveElement(1, {1, 0, 0});
  const bool untouched = index.AnchorOf(1) == GridPosition{0, 0, 0} && index.OccupantAt({1, 0, 0}) == 1 &&
                         index.OccupantAt({2, 0, 0}) == 2;
  if (!index.MoveElement(2, {3, 0, 0}) || !index.MoveElement(1, {1, 0, 0})) {
    return false;
  }

  const auto stats = index.stats();
  return overlap_rejected && duplicate_rejected && zero_rejected && blocked_move_rejected && untouched &&
         index.OccupantAt({0, 0, 0}) == 0 && index.OccupantAt({2, 0, 0}) == 1 &&
         index.QueryRegion({0, 0, 0}, {3, 0, 0}) == std::vector<ObjectId>{1, 2} &&
         stats.rejected_updates == 4 && stats.moves == 2 && stats.inserts == 2 && stats.occupied_cells == 3;
}

// Intent: A desynchronised index is detected and rebuilt from the grid.
bool test_spatial_index_rebuild_from_grid() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {0, 0, 0});
  const ObjectId b = place_id(editor, {2, 0, 0}, PontoonType::kDouble);
  if (a == 0 || b == 0 || !editor.index().IsConsistentWith(editor.grid())) {
    return false;
  }

  SpatialIndex copy = editor.index();
  if (!copy.Remove(b) || !copy.Insert(99, {9, 0, 9}, {1, 1, 1})) {
    return false;
  }
  const ValidationResult broken = copy.CheckConsistency(editor.grid());
  if (broken.ok() || !broken.has_code(ValidationCode::kNotFound)) {
    return false;
  }
  return copy.Rebuild(editor.grid()) && copy.IsConsistentWith(editor.grid()) &&
         copy.OccupantAt({3, 0, 0}) == b && !copy.Contains(99);
}

// Intent: Asking canPlace twice without mutation gives the same answer.
bool test_can_place_idempotent() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {4, 0, 4}) == 0) {
    return false;
  }
  const std::vector<GridPosition> candidates = {{4, 0, 4}, {4, 1, 4}, {3, 1, 3}, {9, 0, 9}, {10, 0, 0}, {4, 0, 5}};
  for (const GridPosition& candidate : candidates) {
    for (PontoonType type : pontoon::core::kAllPontoonTypes) {
      if (!(editor.CanPlace(candidate, type) == editor.CanPlace(candidate, type))) {
        return false;
      }
    }
  }
  return true;
}

// Intent: canPlace and place agree for every cell over seeded random grids.
bool test_preview_matches_placement_randomized() {
  const unsigned seeds[] = {7u, 1234u, 20240601u};
  for (unsigned seed : seeds) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> xz(0, 7);
    std::uniform_int_distribution<int> level(0, 2);
    std::uniform_int_distribution<int> coin(0, 1);

    Grid grid(GridDimensions{8, 8, 3, 0});
    SpatialIndex index = SpatialIndex::FromGrid(grid);
    for (int i = 0; i < 80; ++i) {
      const GridPosition position{xz(rng), level(rng), xz(rng)};
      const PontoonType type = coin(rng) == 0 ? PontoonType::kSingle : PontoonType::kDouble;
      auto placed = GridOperations::Place(grid, index, position, type, PontoonColor::kBlue, Rotation::kNorth);
      if (placed.ok) {
        grid = placed.value;
        index = SpatialIndex::FromGrid(grid);
      }
    }
    if (grid.empty() || !grid.Validate().ok()) {
      return false;
    }

    const PlacementValidator validator(grid, index);
    for (const GridPosition& cell : pontoon::core::cells_in_box({-1, 0, -1}, {8, 2, 8})) {
      for (PontoonType type : pontoon::core::kAllPontoonTypes) {
        const bool predicted = validator.CanPlace(cell, type).ok();
        const auto actual = GridOperations::Place(grid, index, cell, type, PontoonColor::kGrey, Rotation::kEast);
        if (predicted != actual.ok) {
          return false;
        }
        if (!actual.ok && !(actual.value == grid)) {
          return false;
        }
      }
    }
  }
  return true;
}

// Intent: Both DOUBLE cells are occupied and block placement until removal.
bool test_double_footprint_exclusivity() {
  Configurator editor(kTenByTen);
  const ObjectId id = place_id(editor, {4, 0, 4}, PontoonType::kDouble);
  if (id == 0) {
    return false;
  }
  const bool both_occupied = editor.PontoonAt({4, 0, 4}).has_value() && editor.PontoonAt({5, 0, 4}).has_value() &&
                             editor.PontoonAt({5, 0, 4})->id == id;
  const auto on_anchor = editor.PlacePontoon({4, 0, 4}, PontoonType::kSingle);
  const auto on_second = editor.PlacePontoon({5, 0, 4}, PontoonType::kSingle);
  const auto straddling = editor.PlacePontoon({3, 0, 4}, PontoonType::kDouble);
  if (!editor.RemovePontoon(id).ok) {
    return false;
  }
  return both_occupied && on_anchor.first_code() == ValidationCode::kOverlap &&
         on_second.first_code() == ValidationCode::kOverlap &&
         straddling.first_code() == ValidationCode::kOverlap &&
         editor.PlacePontoon({5, 0, 4}, PontoonType::kSingle).ok;
}

// Intent: Upper levels need a pontoon directly below every footprint cell.
bool test_support_chain() {
  Configurator editor(kTenByTen);
  const auto unsupported = editor.PlacePontoon({5, 1, 5}, PontoonType::kSingle);
  if (unsupported.ok || unsupported.first_code() != ValidationCode::kNoSupport) {
    return false;
  }
  if (place_id(editor, {5, 0, 5}) == 0) {
    return false;
  }
  const auto supported = editor.PlacePontoon({5, 1, 5}, PontoonType::kSingle);
  const auto half_supported = editor.PlacePontoon({5, 2, 5}, PontoonType::kDouble);
  return supported.ok && half_supported.first_code() == ValidationCode::kNoSupport &&
         editor.grid().size() == 2;
}

// Intent: Every failing rule is reported, bounds before support.
bool test_validation_reports_ordered_rules() {
  Configurator editor(kTenByTen);
  const ValidationResult result = editor.CanPlace({9, 1, 0}, PontoonType::kDouble);
  return !result.ok() && result.issues.size() == 2 &&
         result.issues[0].code == ValidationCode::kOutOfBounds &&
         result.issues[0].position == GridPosition{10, 1, 0} &&
         result.issues[1].code == ValidationCode::kNoSupport &&
         result.issues[1].position == GridPosition{9, 1, 0} &&
         pontoon::core::to_string(result.issues[0].code) == "OUT_OF_BOUNDS";
}

// Intent: Negative min_level acts as the foundation level.
bool test_underwater_foundation_levels() {
  Configurator editor(GridDimensions{6, 6, 3, -1});
  const auto foundation = editor.PlacePontoon({0, -1, 0}, PontoonType::kSingle);
  const auto floating = editor.PlacePontoon({1, 0, 1}, PontoonType::kSingle);
  const auto surface = editor.PlacePontoon({0, 0, 0}, PontoonType::kSingle);
  const auto too_deep = editor.PlacePontoon({2, -2, 2}, PontoonType::kSingle);
  return foundation.ok && floating.first_code() == ValidationCode::kNoSupport && surface.ok &&
         too_deep.first_code() == ValidationCode::kOutOfBounds;
}

// Intent: A supporting pontoon cannot be removed until its load is gone.
bool test_remove_supporter_blocked() {
  Configurator editor(kTenByTen);
  const ObjectId base = place_id(editor, {0, 0, 0});
  const ObjectId top = place_id(editor, {0, 1, 0});
  if (base == 0 || top == 0) {
    return false;
  }
  const auto blocked = editor.RemovePontoon(base);
  if (blocked.ok || blocked.first_code() != ValidationCode::kNoSupport || editor.grid().size() != 2) {
    return false;
  }
  const auto batch = editor.RemovePontoonsBatch({base, top}, false);
  return batch.ok && editor.grid().empty() && batch.value.affected_ids == std::vector<ObjectId>{top, base} &&
         editor.RemovePontoon(base).first_code() == ValidationCode::kNotFound;
}

// Intent: Moves exclude their own cells and keep dependants supported.
bool test_move_rules() {
  Configurator editor(kTenByTen);
  const ObjectId deck = place_id(editor, {0, 0, 0}, PontoonType::kDouble);
  const ObjectId rider = place_id(editor, {1, 1, 0});
  const ObjectId single = place_id(editor, {5, 0, 5});
  const ObjectId load = place_id(editor, {5, 1, 5});
  if (deck == 0 || rider == 0 || single == 0 || load == 0) {
    return false;
  }

  const auto same = editor.MovePontoon(deck, {0, 0, 0});
  const auto strand = editor.MovePontoon(single, {8, 0, 8});
  const auto missing = editor.MovePontoon(404, {8, 0, 8});
  // New footprint (1..2,0,0) still carries the rider at (1,1,0).
  const auto shift = editor.MovePontoon(deck, {1, 0, 0});
  return same.first_code() == ValidationCode::kAlreadyAtPosition &&
         strand.first_code() == ValidationCode::kNoSupport &&
         missing.first_code() == ValidationCode::kNotFound && shift.ok &&
         editor.PontoonAt({0, 0, 0}) == std::nullopt && editor.PontoonAt({2, 0, 0})->id == deck &&
         editor.index().IsConsistentWith(editor.grid());
}

// Intent: Rotate and recolor report SAME_VALUE when nothing would change.
bool test_rotate_and_recolor_same_value() {
  Configurator editor(kTenByTen);
  const ObjectId id = place_id(editor, {3, 0, 3}, PontoonType::kDouble);
  if (id == 0) {
    return false;
  }
  const auto rotated = editor.RotatePontoon(id);
  const auto again = editor.RotatePontoon(id, Rotation::kEast);
  const auto recolor_same = editor.RecolorPontoon(id, PontoonColor::kBlue);
  const auto recolor = editor.RecolorPontoon(id, PontoonColor::kBlack);
  return rotated.ok && editor.grid().find(id)->rotation == Rotation::kEast &&
         editor.grid().find(id)->cells() == pontoon::core::footprint_of({3, 0, 3}, PontoonType::kDouble) &&
         again.first_code() == ValidationCode::kSameValue &&
         recolor_same.first_code() == ValidationCode::kSameValue &&
         recolor_same.error() == "pontoon already has this color" && recolor.ok &&
         editor.grid().find(id)->color == PontoonColor::kBlack;
}

// Intent: Two disjoint 2x2 platforms fail connectivity until joined.
bool test_connectivity_two_platforms() {
  Configurator editor(kTenByTen);
  const std::vector<GridPosition> cells = {{0, 0, 0}, {1, 0, 0}, {0, 0, 1}, {1, 0, 1},
                                           {3, 0, 0}, {4, 0, 0}, {3, 0, 1}, {4, 0, 1}};
  const auto batch = editor.PlacePontoonsBatch(cells, PontoonType::kSingle);
  if (!batch.ok || batch.value.affected_ids.size() != 8) {
    return false;
  }
  const ValidationResult split = editor.ValidateConnectivity();
  if (split.ok() || split.issues.size() != 1 || !split.has_code(ValidationCode::kDisconnected)) {
    return false;
  }
  if (place_id(editor, {2, 0, 0}) == 0) {
    return false;
  }
  return editor.ValidateConnectivity().ok();
}

// Intent: Stacked pontoons count as connected through vertical faces.
bool test_connectivity_includes_vertical_faces() {
  pontoon::core::CellSet cells;
  cells.insert({0, 0, 0});
  cells.insert({0, 1, 0});
  cells.insert({1, 1, 0});
  cells.insert({5, 0, 5});
  const auto components = pontoon::core::connected_components(cells);
  return components.size() == 2 && components[0].size() == 3 && components[1].front() == GridPosition{5, 0, 5};
}

// Intent: Connectivity enforcement rejects edits that split the platform.
bool test_enforced_connectivity() {
  EditorSettings settings;
  settings.enforce_connectivity = true;
  Configurator editor(kTenByTen, settings);
  const ObjectId a = place_id(editor, {0, 0, 0});
  const auto island = editor.PlacePontoon({5, 0, 5}, PontoonType::kSingle);
  const ObjectId b = place_id(editor, {1, 0, 0});
  const ObjectId c = place_id(editor, {2, 0, 0});
  if (a == 0 || b == 0 || c == 0) {
    return false;
  }
  const auto split = editor.RemovePontoon(b);
  const auto trim_end = editor.RemovePontoon(c);
  return island.first_code() == ValidationCode::kDisconnected && split.first_code() == ValidationCode::kDisconnected &&
         trim_end.ok && editor.grid().size() == 2;
}

// Intent: Nearby search walks Chebyshev rings in z-then-x order inside bounds.
bool test_find_nearby_valid_positions() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {5, 0, 5}) == 0) {
    return false;
  }
  const auto ring_one = editor.FindNearbyValidPositions({5, 0, 5}, PontoonType::kSingle, 1);
  const auto corner = editor.FindNearbyValidPositions({0, 0, 0}, PontoonType::kSingle, 1);
  const auto wide = editor.FindNearbyValidPositions({5, 0, 5}, PontoonType::kSingle);
  return ring_one.size() == 8 && ring_one.front() == GridPosition{4, 0, 4} &&
         ring_one.back() == GridPosition{6, 0, 6} && corner.size() == 4 &&
         corner.front() == GridPosition{0, 0, 0} &&
         std::none_of(wide.begin(), wide.end(), [](const GridPosition& p) { return p == GridPosition{5, 0, 5}; }) &&
         wide.back().ring_distance_to({5, 0, 5}) == 5;
}

// Intent: Portable form round-trips dimensions, mapping and the id counter.
bool test_portable_round_trip() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {1, 0, 1}, PontoonType::kDouble, PontoonColor::kGrey);
  const ObjectId b = place_id(editor, {2, 1, 1}, PontoonType::kSingle, PontoonColor::kYellow);
  if (a == 0 || b == 0 || !editor.RotatePontoon(b, Rotation::kWest).ok || !editor.RemovePontoon(b).ok) {
    return false;
  }
  const ObjectId c = place_id(editor, {7, 0, 7});
  const PortableGrid portable = editor.ToPortable();
  const auto restored = pontoon::core::FromPortable(portable);
  return restored.ok && restored.value == editor.grid() &&
         restored.value.next_id() == editor.grid().next_id() && portable.pontoons.size() == 2 &&
         portable.pontoons[0].type == "double" && portable.pontoons[0].color == "grey" &&
         restored.change_set.created_ids == std::vector<ObjectId>{a, c};
}

// Intent: Malformed or rule-breaking portable data is rejected as a whole.
bool test_portable_rejects_invalid_input() {
  PortableGrid overlapping;
  overlapping.dimensions = kTenByTen;
  overlapping.pontoons.push_back({1, {0, 0, 0}, "double", "blue", 0});
  overlapping.pontoons.push_back({2, {1, 0, 0}, "single", "blue", 0});

  PortableGrid bad_fields;
  bad_fields.dimensions = kTenByTen;
  bad_fields.pontoons.push_back({1, {0, 0, 0}, "triple", "pink", 45});

  PortableGrid floating;
  floating.dimensions = kTenByTen;
  floating.pontoons.push_back({1, {0, 1, 0}, "single", "blue", 90});

  PortableGrid duplicate;
  duplicate.dimensions = kTenByTen;
  duplicate.pontoons.push_back({3, {0, 0, 0}, "single", "blue", 0});
  duplicate.pontoons.push_back({3, {4, 0, 4}, "single", "blue", 0});

  const auto a = pontoon::core::FromPortable(overlapping);
  const auto b = pontoon::core::FromPortable(bad_fields);
  const auto c = pontoon::core::FromPortable(floating);
  const auto d = pontoon::core::FromPortable(duplicate);
  return !a.ok && a.has_code(ValidationCode::kOverlap) && a.value.empty() &&
         !b.ok && b.issues.size() == 3 && b.first_code() == ValidationCode::kInvalidArgument &&
         !c.ok && c.has_code(ValidationCode::kNoSupport) &&
         !d.ok && d.first_code() == ValidationCode::kInvalidArgument;
}

// Intent: A disconnected layout loads with a warning, not an error.
bool test_portable_disconnected_is_warning() {
  PortableGrid portable;
  portable.dimensions = kTenByTen;
  portable.pontoons.push_back({4, {0, 0, 0}, "single", "blue", 0});
  portable.pontoons.push_back({9, {6, 0, 6}, "single", "black", 270});
  const auto loaded = pontoon::core::FromPortable(portable);
  return loaded.ok && loaded.errors.empty() && loaded.has_code(ValidationCode::kDisconnected) &&
         loaded.issues.front().severity == ValidationSeverity::kWarning && loaded.value.next_id() == 10 &&
         loaded.value.find(9)->rotation == Rotation::kWest;
}

// Intent: Batch placement skips invalid cells or aborts without partial change.
bool test_batch_place_skip_and_abort() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {1, 0, 0}) == 0) {
    return false;
  }
  const auto skipped = editor.PlacePontoonsBatch({{0, 0, 0}, {1, 0, 0}, {2, 0, 0}}, PontoonType::kSingle);
  if (!skipped.ok || skipped.value.affected_ids.size() != 2 || skipped.value.failures.size() != 1 ||
      !(skipped.value.failures.front().position == GridPosition{1, 0, 0}) || !skipped.errors.empty()) {
    return false;
  }
  const bool warned = has_issue_code(skipped.issues, ValidationCode::kOverlap) &&
                      skipped.issues.front().severity == ValidationSeverity::kWarning;
  const std::size_t history_after_skip = editor.history().size();

  const auto aborted = editor.PlacePontoonsBatch({{3, 0, 0}, {1, 0, 0}}, PontoonType::kSingle,
                                                 PontoonColor::kBlue, Rotation::kNorth, false);
  const auto nothing = editor.PlacePontoonsBatch({{0, 0, 0}, {1, 0, 0}}, PontoonType::kSingle);
  return warned && history_after_skip == 2 && !aborted.ok && aborted.first_code() == ValidationCode::kOverlap &&
         editor.grid().size() == 3 && aborted.value.grid == editor.grid() && editor.history().size() == 2 &&
         !nothing.ok && nothing.first_code() == ValidationCode::kOverlap;
}

// Intent: n undos restore the original grid and n redos the final one.
bool test_undo_redo_symmetry_randomized() {
  std::mt19937 rng(42u);
  std::uniform_int_distribution<int> xz(0, 9);
  std::uniform_int_distribution<int> level(0, 2);
  std::uniform_int_distribution<int> action(0, 4);
  std::uniform_int_distribution<int> color(0, 3);

  Configurator editor(kTenByTen);
  const Grid initial = editor.grid();
  std::size_t successes = 0;
  for (int attempt = 0; attempt < 400 && successes < 30; ++attempt) {
    const std::vector<pontoon::core::Pontoon> current = editor.grid().sorted_pontoons();
    const int choice = current.empty() ? 0 : action(rng);
    const ObjectId target = current.empty() ? 0 : current[static_cast<std::size_t>(xz(rng)) % current.size()].id;
    bool ok = false;
    switch (choice) {
    case 0:
      ok = editor.PlacePontoon({xz(rng), level(rng), xz(rng)},
                               xz(rng) % 2 == 0 ? PontoonType::kSingle : PontoonType::kDouble)
               .ok;
      break;
    case 1:
      ok = editor.RemovePontoon(target).ok;
      break;
    case 2:
      ok = editor.MovePontoon(target, {xz(rng), level(rng), xz(rng)}).ok;
      break;
    case 3:
      ok = editor.RotatePontoon(target).ok;
      break;
    default:
      ok = editor.RecolorPontoon(target, pontoon::core::kAllPontoonColors[static_cast<std::size_t>(color(rng))]).ok;
      break;
    }
    if (ok) {
      ++successes;
    }
  }
  if (successes < 10 || editor.history().size() != successes || !editor.grid().Validate().ok()) {
    return false;
  }

  const Grid final_grid = editor.grid();
  for (std::size_t i = 0; i < successes; ++i) {
    if (!editor.Undo() || !editor.index().IsConsistentWith(editor.grid())) {
      return false;
    }
  }
  if (!(editor.grid() == initial) || editor.Undo()) {
    return false;
  }
  for (std::size_t i = 0; i < successes; ++i) {
    if (!editor.Redo()) {
      return false;
    }
  }
  return editor.grid() == final_grid && !editor.Redo() && editor.index().IsConsistentWith(editor.grid()) &&
         editor.pipeline().stats().index_rebuilds == 0;
}

// Intent: A new edit after undo drops the redo branch; ids are restored exactly.
bool test_history_truncates_redo_branch() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {0, 0, 0});
  const ObjectId b = place_id(editor, {1, 0, 0});
  if (a != 1 || b != 2 || !editor.Undo()) {
    return false;
  }
  const ObjectId c = place_id(editor, {5, 0, 5});
  return c == 2 && !editor.history().can_redo() && editor.history().size() == 2 && !editor.Redo() &&
         editor.grid().find(c)->position == GridPosition{5, 0, 5} &&
         starts_with(editor.history().entries().back().description, "Place single PN-000002");
}

// Intent: Eviction keeps the newest entries and shifts the cursor left.
bool test_history_eviction_and_cursor_shift() {
  std::vector<Grid> grids;
  grids.emplace_back(kTenByTen);
  for (int i = 0; i < 5; ++i) {
    const SpatialIndex index = SpatialIndex::FromGrid(grids.back());
    const auto placed = GridOperations::Place(grids.back(), index, {i, 0, 0}, PontoonType::kSingle,
                                              PontoonColor::kBlue, Rotation::kNorth);
    if (!placed.ok) {
      return false;
    }
    grids.push_back(placed.value);
  }

  HistoryLedger bounded(3);
  for (std::size_t i = 0; i < 5; ++i) {
    bounded.Append(grids[i], grids[i + 1], {}, "step " + std::to_string(i));
  }
  if (bounded.size() != 3 || bounded.applied_count() != 3 || bounded.Stats().evicted_total != 2) {
    return false;
  }
  std::optional<Grid> restored;
  for (int i = 0; i < 3; ++i) {
    restored = bounded.Undo();
  }
  if (!restored.has_value() || !(*restored == grids[2]) || bounded.Undo().has_value()) {
    return false;
  }

  HistoryLedger ledger(10);
  for (std::size_t i = 0; i < 5; ++i) {
    ledger.Append(grids[i], grids[i + 1], {}, "step " + std::to_string(i));
  }
  if (!ledger.Undo().has_value() || !ledger.Undo().has_value() || ledger.applied_count() != 3) {
    return false;
  }
  ledger.SetMaxEntries(2);
  const auto redone = ledger.Redo();
  return ledger.size() == 2 && redone.has_value() && *redone == grids[4] && ledger.applied_count() == 1 &&
         ledger.entries().front().description == "step 3";
}

// Intent: Rollback jumps to a named checkpoint; undo steps over markers.
bool test_checkpoint_rollback() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {0, 0, 0});
  const auto checkpoint = editor.CreateCheckpoint("foundation");
  const ObjectId b = place_id(editor, {1, 0, 0});
  const ObjectId c = place_id(editor, {2, 0, 0});
  if (a == 0 || b == 0 || c == 0 || !checkpoint.ok) {
    return false;
  }
  const auto rolled = editor.RollbackToCheckpoint(checkpoint.value);
  if (!rolled.ok || editor.grid().size() != 1 || editor.grid().find(a) == nullptr ||
      !contains_id(rolled.change_set.deleted_ids, c)) {
    return false;
  }
  const bool missing_rejected =
      editor.RollbackToCheckpoint(999).first_code() == ValidationCode::kNotFound &&
      !editor.CreateCheckpoint("").ok;
  if (!editor.Redo() || editor.grid().find(b) == nullptr) {
    return false;
  }

  // Undo walks back b, then a, skipping the checkpoint marker.
  return missing_rejected && editor.Undo() && editor.grid().size() == 1 && editor.Undo() &&
         editor.grid().empty() && !editor.Undo() && editor.history().Checkpoints().size() == 1 &&
         editor.event_log().count_of(EditorEventKind::kCheckpointRollback) == 1;
}

// Intent: History can list entries affecting a pontoon and jump to a cursor.
bool test_history_queries() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {0, 0, 0});
  const ObjectId b = place_id(editor, {1, 0, 0});
  if (a == 0 || b == 0 || !editor.RecolorPontoon(a, PontoonColor::kGrey).ok) {
    return false;
  }
  const auto touching_a = editor.history().EntriesAffecting(a);
  HistoryLedger copy = editor.history();
  const auto start = copy.JumpTo(0);
  return touching_a.size() == 2 && editor.history().EntriesAffecting(b).size() == 1 && start.has_value() &&
         start->empty() && copy.applied_count() == 0 && copy.can_redo() && !copy.JumpTo(9).has_value() &&
         editor.history().entries().back().operations.front().kind == OperationKind::kRecolor &&
         editor.history().entries().back().operations.front().sequence == 3;
}

// Intent: History can be filtered by operation kind, searched by description and tailed.
bool test_history_search() {
  Configurator editor(kTenByTen);
  const ObjectId a = place_id(editor, {0, 0, 0});
  if (a == 0 || !editor.CreateCheckpoint("Before Deck Extension").ok) {
    return false;
  }
  const ObjectId b = place_id(editor, {1, 0, 0});
  if (b == 0 || !editor.RecolorPontoon(b, PontoonColor::kYellow).ok) {
    return false;
  }
  const HistoryLedger& history = editor.history();
  const auto places = history.EntriesOfKind(OperationKind::kPlace);
  const auto recolors = history.EntriesOfKind(OperationKind::kRecolor);
  const auto markers = history.EntriesOfKind(OperationKind::kCheckpoint);
  const auto found = history.SearchEntries("deck EXT");
  const auto recent = history.RecentEntries(2);
  const auto everything = history.RecentEntries(100);
  return places.size() == 2 && recolors.size() == 1 && markers.size() == 1 && markers.front()->is_checkpoint &&
         found.size() == 1 && found.front()->is_checkpoint && history.SearchEntries("no such edit").empty() &&
         history.SearchEntries("").size() == history.size() && recent.size() == 2 &&
         recent.back() == &history.entries().back() && everything.size() == history.size() &&
         history.RecentEntries(0).empty();
}

// Intent: A commit whose change set misses a change triggers an index rebuild.
bool test_pipeline_rebuilds_stale_index() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {1, 0, 1}) == 0) {
    return false;
  }
  const auto placed = editor.pipeline().Execute(
      "place without change set", [](const Grid& grid, const SpatialIndex& index) {
        auto result = GridOperations::Place(grid, index, {4, 0, 4}, PontoonType::kDouble, PontoonColor::kBlack,
                                            Rotation::kNorth);
        result.change_set = {};
        return result;
      });
  const bool rebuilt_once = placed.ok && editor.pipeline().stats().index_rebuilds == 1 &&
                            editor.event_log().count_of(EditorEventKind::kIndexRebuilt) == 1;
  const ObjectId occupant = editor.index().OccupantAt({5, 0, 4});
  const ValidationResult blocked = editor.CanPlace({5, 0, 4}, PontoonType::kSingle);
  return rebuilt_once && occupant != pontoon::core::kInvalidObjectId &&
         editor.index().IsConsistentWith(editor.grid()) && blocked.has_code(ValidationCode::kOverlap);
}

// Intent: Execute rejects a transform whose grid breaks overlap or support.
bool test_pipeline_rejects_invalid_transform() {
  Configurator editor(kTenByTen);
  const ObjectId base = place_id(editor, {2, 0, 2});
  if (base == 0) {
    return false;
  }
  const Grid before = editor.grid();
  const std::size_t history_before = editor.history().size();

  const auto overlapping = editor.pipeline().Execute("stacked copy", [](const Grid& grid, const SpatialIndex&) {
    pontoon::core::EditResult<Grid> result;
    result.ok = true;
    result.value = grid.with_pontoon({grid.next_id(), {2, 0, 2}, PontoonType::kSingle});
    result.change_set.created_ids.push_back(grid.next_id());
    return result;
  });
  const auto floating = editor.pipeline().Execute("floating deck", [](const Grid& grid, const SpatialIndex&) {
    pontoon::core::EditResult<Grid> result;
    result.ok = true;
    result.value = grid.with_pontoon({grid.next_id(), {7, 1, 7}, PontoonType::kSingle});
    return result;
  });
  return !overlapping.ok && overlapping.has_code(ValidationCode::kOverlap) && overlapping.operations.empty() &&
         !floating.ok && floating.first_code() == ValidationCode::kNoSupport && editor.grid() == before &&
         editor.history().size() == history_before && editor.index().IsConsistentWith(editor.grid()) &&
         editor.pipeline().stats().index_rebuilds == 0 &&
         editor.event_log().count_of(EditorEventKind::kRejected) == 2;
}

// Intent: The worked orthographic example maps pixels to the expected cells.
bool test_screen_to_grid_worked_example() {
  CoordinateCalculator calculator;
  const ViewContext view = top_down_view();
  const auto centre = calculator.ScreenToGrid({50.0, 50.0}, view.camera, view.viewport, kTenByTen, 1);
  const auto top_left = calculator.ScreenToGrid({0.0, 0.0}, view.camera, view.viewport, kTenByTen, 0);
  const auto bottom_right = calculator.ScreenToGrid({99.0, 99.0}, view.camera, view.viewport, kTenByTen, 2);
  const auto outside = calculator.ScreenToGrid({-1.0, 5.0}, view.camera, view.viewport, kTenByTen, 0);
  const auto bad_level = calculator.ScreenToGrid({50.0, 50.0}, view.camera, view.viewport, kTenByTen, 3);
  return centre == GridPosition{5, 1, 5} && top_left == GridPosition{0, 0, 0} &&
         bottom_right == GridPosition{9, 2, 9} && !outside.has_value() && !bad_level.has_value();
}

// Intent: Off-grid hits and degenerate views resolve to no cell.
bool test_screen_to_grid_misses() {
  CoordinateCalculator calculator;
  ViewContext wide = top_down_view();
  wide.camera.fovy_deg = 10.0;
  const auto off_grid = calculator.ScreenToGrid({0.0, 0.0}, wide.camera, wide.viewport, kTenByTen, 0);
  const auto on_grid = calculator.ScreenToGrid({50.0, 50.0}, wide.camera, wide.viewport, kTenByTen, 0);

  ViewContext flat = top_down_view();
  flat.viewport = {0.0, 0.0};
  const auto no_viewport = calculator.ScreenToGrid({0.0, 0.0}, flat.camera, flat.viewport, kTenByTen, 0);

  ViewContext sideways = top_down_view();
  sideways.camera.position = {0.0, 5.0, 10.0};
  sideways.camera.target = {0.0, 5.0, 0.0};
  sideways.camera.up = {0.0, 1.0, 0.0};
  const auto parallel = calculator.ScreenToGrid({50.0, 50.0}, sideways.camera, sideways.viewport, kTenByTen, 0);

  // A pointer just below the horizon meets the level plane billions of metres out.
  ViewContext grazing;
  grazing.camera.position = {0.0, 100.0, 0.0};
  grazing.camera.target = {1000.0, 100.0 - 1e-6, 0.0};
  grazing.camera.up = {0.0, 1.0, 0.0};
  grazing.viewport = {800.0, 600.0};
  const auto horizon = calculator.ScreenToGrid({400.0, 300.00001}, grazing.camera, grazing.viewport, kTenByTen, 0);
  const GridPosition far_cell = calculator.WorldToGrid({1e12, 0.0, -1e12}, kTenByTen);

  return !off_grid.has_value() && on_grid == GridPosition{5, 0, 5} && !no_viewport.has_value() &&
         !parallel.has_value() && !horizon.has_value() && far_cell.x == std::numeric_limits<int>::max() &&
         far_cell.z == std::numeric_limits<int>::min();
}

// Intent: gridToWorld and worldToGrid are exact inverses on every cell.
bool test_grid_world_inverse() {
  const CoordinateCalculator calculator;
  for (const GridPosition& cell : pontoon::core::cells_in_box({0, 0, 0}, {9, 2, 9})) {
    if (!(calculator.WorldToGrid(calculator.GridToWorld(cell, kTenByTen), kTenByTen) == cell)) {
      return false;
    }
  }
  return almost_equal(calculator.GridToWorld({0, 0, 0}, kTenByTen), {-2.25, 0.0, -2.25}) &&
         almost_equal(calculator.GridToWorld({9, 2, 9}, kTenByTen), {2.25, 0.8, 2.25}) &&
         almost_equal(calculator.GridIntersectionToWorld(0, 10, 1, kTenByTen), {-2.5, 0.4, 2.5}) &&
         almost_equal(calculator.FootprintCenter({0, 0, 0}, PontoonType::kDouble, kTenByTen), {-2.0, 0.0, -2.25}) &&
         calculator.IsInBounds({0.1, 0.0, 0.1}, kTenByTen) && !calculator.IsInBounds({2.6, 0.0, 0.0}, kTenByTen);
}

// Intent: Identical inputs hit the cache; a camera change invalidates it.
bool test_coordinate_cache() {
  CoordinateCalculator calculator;
  ViewContext view = top_down_view();
  const auto first = calculator.ScreenToGrid(pixel_of(3, 4), view.camera, view.viewport, kTenByTen, 0);
  const auto second = calculator.ScreenToGrid(pixel_of(3, 4), view.camera, view.viewport, kTenByTen, 0);
  const auto warm = calculator.cache_stats();

  view.camera.position.x += 0.5;
  view.camera.target.x += 0.5;
  const auto shifted = calculator.ScreenToGrid(pixel_of(3, 4), view.camera, view.viewport, kTenByTen, 0);
  const auto after = calculator.cache_stats();

  CoordinateCalculator fresh;
  ViewContext perspective;
  perspective.viewport = {800.0, 600.0};
  const auto p1 = fresh.ScreenToGrid({400.0, 300.0}, perspective.camera, perspective.viewport, kTenByTen, 0);
  const auto p2 = calculator.ScreenToGrid({400.0, 300.0}, perspective.camera, perspective.viewport, kTenByTen, 0);
  return first == GridPosition{3, 0, 4} && second == first && warm.hits == 1 && warm.misses == 1 &&
         warm.entries == 1 && shifted == GridPosition{4, 0, 4} && after.invalidations == 1 && after.entries == 1 &&
         p1.has_value() && p1 == p2;
}

// Intent: Hover preview and click commit agree on the same cell.
bool test_pipeline_hover_matches_click() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  if (place_id(editor, {1, 0, 1}) == 0) {
    return false;
  }
  const ToolSettings ground = tool_of(ToolKind::kPlace);
  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 1, 1), view, ground);
  const auto blocked_hover = editor.overlay().hover;
  const PipelineResult blocked = editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, ground);

  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 2, 2), view, ground);
  const auto free_hover = editor.overlay().hover;
  const PipelineResult placed = editor.ProcessInput(pointer_event(InputKind::kClick, 2, 2), view, ground);

  const ToolSettings deck = tool_of(ToolKind::kPlace, PontoonType::kSingle, 1);
  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 7, 7), view, deck);
  const auto floating_hover = editor.overlay().hover;
  const PipelineResult floating = editor.ProcessInput(pointer_event(InputKind::kClick, 7, 7), view, deck);

  return blocked_hover.has_value() && !blocked_hover->valid &&
         has_issue_code(blocked_hover->issues, ValidationCode::kOverlap) &&
         blocked.outcome == PipelineOutcome::kRejected && blocked.first_code() == ValidationCode::kOverlap &&
         free_hover.has_value() && free_hover->valid && placed.outcome == PipelineOutcome::kCommitted &&
         editor.PontoonAt({2, 0, 2}).has_value() && floating_hover.has_value() && !floating_hover->valid &&
         floating.first_code() == ValidationCode::kNoSupport && floating_hover->cell == GridPosition{7, 1, 7} &&
         editor.overlay().active_level == 1;
}

// Intent: Clicks that resolve to no cell are rejected with NO_CELL.
bool test_pipeline_click_outside_grid() {
  Configurator editor(kTenByTen);
  InputEvent click;
  click.kind = InputKind::kClick;
  click.pointer = {-5.0, -5.0};
  const PipelineResult result = editor.ProcessInput(click, top_down_view(), tool_of(ToolKind::kPlace));
  return result.outcome == PipelineOutcome::kRejected && result.first_code() == ValidationCode::kNoCell &&
         editor.grid().empty() && editor.history().size() == 0;
}

// Intent: Move tool goes idle->selected->idle on success and on failure.
bool test_move_tool_state_machine() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ToolSettings move = tool_of(ToolKind::kMove);
  const ObjectId a = place_id(editor, {1, 0, 1});
  const ObjectId b = place_id(editor, {3, 0, 3});
  if (a == 0 || b == 0) {
    return false;
  }

  const PipelineResult empty_pick = editor.ProcessInput(pointer_event(InputKind::kClick, 5, 5), view, move);
  if (empty_pick.first_code() != ValidationCode::kNotFound || editor.pipeline().move_state() != MoveToolState::kIdle) {
    return false;
  }

  editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, move);
  if (editor.pipeline().move_state() != MoveToolState::kSelected || editor.pipeline().move_source_id() != a ||
      editor.grid().size() != 2 || editor.history().size() != 2) {
    return false;
  }
  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 3, 3), view, move);
  const bool hover_blocked = editor.overlay().hover.has_value() && !editor.overlay().hover->valid;
  const PipelineResult bad = editor.ProcessInput(pointer_event(InputKind::kClick, 3, 3), view, move);
  if (bad.first_code() != ValidationCode::kOverlap || editor.pipeline().move_state() != MoveToolState::kIdle ||
      editor.pipeline().move_source_id() != pontoon::core::kInvalidObjectId) {
    return false;
  }

  editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, move);
  const PipelineResult good = editor.ProcessInput(pointer_event(InputKind::kClick, 6, 6), view, move);
  return hover_blocked && good.outcome == PipelineOutcome::kCommitted &&
         editor.pipeline().move_state() == MoveToolState::kIdle && editor.PontoonAt({6, 0, 6})->id == a &&
         !editor.PontoonAt({1, 0, 1}).has_value() && good.operations.front().kind == OperationKind::kMove;
}

// Intent: DOUBLE multi-drop places ceil(W/2) per row from the rectangle's min x.
bool test_multi_drop_double_coverage() {
  const auto cells = OperationPipeline::MultiDropCells({5, 0, 0}, {1, 0, 0}, 0, PontoonType::kDouble);
  if (cells.size() != 3 || !(cells[0] == GridPosition{1, 0, 0}) || !(cells[2] == GridPosition{5, 0, 0})) {
    return false;
  }

  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ToolSettings drop = tool_of(ToolKind::kMultiDrop, PontoonType::kDouble);
  editor.ProcessInput(pointer_event(InputKind::kPointerDown, 0, 0), view, drop);
  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 4, 1), view, drop);
  const auto preview = editor.overlay();
  const PipelineResult released = editor.ProcessInput(pointer_event(InputKind::kPointerUp, 4, 1), view, drop);
  if (released.outcome != PipelineOutcome::kCommitted || editor.grid().size() != 6) {
    return false;
  }
  for (const auto& pontoon : editor.grid().pontoons()) {
    if (pontoon.position.x % 2 != 0 || pontoon.type != PontoonType::kDouble) {
      return false;
    }
  }
  return preview.multi_drop_active && preview.multi_drop_cells.size() == 6 && editor.history().size() == 1 &&
         released.operations.back().kind == OperationKind::kBatchPlace && !editor.pipeline().multi_drop_active() &&
         editor.Statistics().occupied_cells == 12;
}

// Intent: Multi-drop skips cells that fail validation instead of aborting.
bool test_multi_drop_skips_invalid_cells() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  if (place_id(editor, {1, 0, 0}) == 0) {
    return false;
  }
  const ToolSettings drop = tool_of(ToolKind::kMultiDrop);
  editor.ProcessInput(pointer_event(InputKind::kPointerDown, 0, 0), view, drop);
  const PipelineResult released = editor.ProcessInput(pointer_event(InputKind::kPointerUp, 2, 0), view, drop);
  return released.ok && editor.grid().size() == 3 && has_issue_code(released.issues, ValidationCode::kOverlap) &&
         released.errors.empty();
}

// Intent: A cancelled drag discards its preview without touching the grid.
bool test_multi_drop_cancel() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ToolSettings drop = tool_of(ToolKind::kMultiDrop);
  editor.ProcessInput(pointer_event(InputKind::kPointerDown, 0, 0), view, drop);
  editor.ProcessInput(pointer_event(InputKind::kPointerMove, 3, 3), view, drop);
  const std::size_t preview_cells = editor.overlay().multi_drop_cells.size();
  InputEvent leave;
  leave.kind = InputKind::kPointerLeave;
  const PipelineResult left = editor.ProcessInput(leave, view, drop);
  const PipelineResult late_up = editor.ProcessInput(pointer_event(InputKind::kPointerUp, 3, 3), view, drop);

  editor.ProcessInput(pointer_event(InputKind::kPointerDown, 5, 5), view, drop);
  InputEvent cancel;
  cancel.kind = InputKind::kCancel;
  editor.ProcessInput(cancel, view, drop);
  return preview_cells == 16 && left.outcome == PipelineOutcome::kStateChanged &&
         late_up.outcome == PipelineOutcome::kIgnored && !editor.pipeline().multi_drop_active() &&
         editor.grid().empty() && editor.history().size() == 0;
}

// Intent: Input arriving mid-processing is dropped and reported PIPELINE_BUSY.
bool test_pipeline_reentrancy_guard() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ToolSettings place = tool_of(ToolKind::kPlace);
  PipelineResult nested;
  pontoon::core::EditResult<Grid> nested_edit;
  int calls = 0;
  editor.pipeline().set_commit_listener([&](const Grid&, const std::vector<pontoon::core::Operation>&) {
    ++calls;
    nested = editor.ProcessInput(pointer_event(InputKind::kClick, 5, 5), view, place);
    nested_edit = editor.PlacePontoon({6, 0, 6}, PontoonType::kSingle);
  });
  const PipelineResult outer = editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, place);
  return outer.outcome == PipelineOutcome::kCommitted && calls == 1 &&
         nested.outcome == PipelineOutcome::kDropped && nested.first_code() == ValidationCode::kPipelineBusy &&
         !nested_edit.ok && nested_edit.first_code() == ValidationCode::kPipelineBusy &&
         editor.grid().size() == 1 && editor.pipeline().stats().dropped == 2 &&
         editor.event_log().count_of(EditorEventKind::kInputDropped) == 2 && !editor.pipeline().busy();
}

// Intent: Select, delete, rotate and paint tools act on the clicked pontoon.
bool test_single_click_tools() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ObjectId a = place_id(editor, {1, 0, 1});
  const ObjectId b = place_id(editor, {2, 0, 2});
  const ObjectId c = place_id(editor, {3, 0, 3});
  if (a == 0 || b == 0 || c == 0) {
    return false;
  }

  const ToolSettings select = tool_of(ToolKind::kSelect);
  editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, select);
  InputEvent shift_click = pointer_event(InputKind::kClick, 2, 2);
  shift_click.modifiers.shift = true;
  editor.ProcessInput(shift_click, view, select);
  const bool two_selected = editor.pipeline().selection() == std::vector<ObjectId>{a, b};
  editor.ProcessInput(shift_click, view, select);
  const bool toggled = editor.pipeline().selection() == std::vector<ObjectId>{a};
  editor.ProcessInput(pointer_event(InputKind::kClick, 8, 8), view, select);
  const bool cleared = editor.pipeline().selection().empty();

  ToolSettings rotate = tool_of(ToolKind::kRotate);
  const PipelineResult rotated = editor.ProcessInput(pointer_event(InputKind::kClick, 2, 2), view, rotate);
  ToolSettings paint = tool_of(ToolKind::kPaint);
  const PipelineResult same_paint = editor.ProcessInput(pointer_event(InputKind::kClick, 3, 3), view, paint);
  paint.color = PontoonColor::kYellow;
  const PipelineResult painted = editor.ProcessInput(pointer_event(InputKind::kClick, 3, 3), view, paint);
  const ToolSettings erase = tool_of(ToolKind::kDelete);
  const PipelineResult erase_empty = editor.ProcessInput(pointer_event(InputKind::kClick, 8, 8), view, erase);
  const PipelineResult erased = editor.ProcessInput(pointer_event(InputKind::kClick, 1, 1), view, erase);

  return two_selected && toggled && cleared && rotated.ok && editor.grid().find(b)->rotation == Rotation::kEast &&
         same_paint.first_code() == ValidationCode::kSameValue && painted.ok &&
         editor.grid().find(c)->color == PontoonColor::kYellow &&
         erase_empty.first_code() == ValidationCode::kNotFound && erased.ok && !editor.grid().contains(a) &&
         editor.pipeline().stats().committed == 6 && editor.pipeline().stats().rejected == 2;
}

// Intent: Keyboard shortcuts undo, redo, delete and cancel through the pipeline.
bool test_keyboard_shortcuts() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ToolSettings place = tool_of(ToolKind::kPlace);
  editor.ProcessInput(pointer_event(InputKind::kClick, 2, 2), view, place);
  editor.ProcessInput(pointer_event(InputKind::kClick, 4, 4), view, place);
  if (editor.grid().size() != 2) {
    return false;
  }

  const PipelineResult undone = editor.ProcessInput(key_event(Key::kZ, true), view, place);
  const bool after_undo = editor.grid().size() == 1;
  editor.ProcessInput(key_event(Key::kY, true), view, place);
  const bool after_redo = editor.grid().size() == 2;
  editor.ProcessInput(key_event(Key::kZ, true), view, place);
  editor.ProcessInput(key_event(Key::kZ, true, true), view, place);
  const bool after_shift_redo = editor.grid().size() == 2;
  const PipelineResult plain_z = editor.ProcessInput(key_event(Key::kZ), view, place);

  InputEvent del = key_event(Key::kDelete);
  del.pointer = pixel_of(4, 4);
  const PipelineResult deleted = editor.ProcessInput(del, view, place);
  const bool one_left = editor.grid().size() == 1 && !editor.PontoonAt({4, 0, 4}).has_value();

  editor.ProcessInput(pointer_event(InputKind::kClick, 2, 2), view, tool_of(ToolKind::kMove));
  editor.ProcessInput(key_event(Key::kEscape), view, tool_of(ToolKind::kMove));
  return undone.outcome == PipelineOutcome::kStateChanged && after_undo && after_redo && after_shift_redo &&
         plain_z.outcome == PipelineOutcome::kIgnored && deleted.outcome == PipelineOutcome::kCommitted &&
         one_left && editor.pipeline().move_state() == MoveToolState::kIdle &&
         editor.event_log().count_of(EditorEventKind::kHistoryUndo) == 2 &&
         editor.event_log().count_of(EditorEventKind::kHistoryRedo) == 2;
}

// Intent: Delete key removes a multi-selection top level first.
bool test_delete_selection_batch() {
  Configurator editor(kTenByTen);
  const ViewContext view = top_down_view();
  const ObjectId base = place_id(editor, {2, 0, 2});
  const ObjectId top = place_id(editor, {2, 1, 2});
  if (base == 0 || top == 0) {
    return false;
  }
  const ToolSettings select_base = tool_of(ToolKind::kSelect);
  const ToolSettings select_top = tool_of(ToolKind::kSelect, PontoonType::kSingle, 1);
  editor.ProcessInput(pointer_event(InputKind::kClick, 2, 2), view, select_base);
  InputEvent add_top = pointer_event(InputKind::kClick, 2, 2);
  add_top.modifiers.shift = true;
  editor.ProcessInput(add_top, view, select_top);
  if (editor.pipeline().selection() != std::vector<ObjectId>{base, top}) {
    return false;
  }
  const PipelineResult removed = editor.ProcessInput(key_event(Key::kDelete), view, select_top);
  return removed.outcome == PipelineOutcome::kCommitted && editor.grid().empty() &&
         editor.pipeline().selection().empty() && editor.history().size() == 3;
}

// Intent: Settings are validated before they reach history or coordinates.
bool test_update_settings() {
  Configurator editor(kTenByTen);
  EditorSettings bad = editor.settings();
  bad.cell_size_m = 0.0;
  bad.event_log_capacity = 0;
  const auto rejected = editor.UpdateSettings(bad);
  if (rejected.ok || rejected.first_code() != ValidationCode::kInvalidArgument || rejected.errors.size() != 2 ||
      !almost_equal(editor.settings().cell_size_m, 0.5)) {
    return false;
  }

  EditorSettings good = editor.settings();
  good.history_max_entries = 2;
  good.cell_size_m = 1.0;
  if (!editor.UpdateSettings(good).ok) {
    return false;
  }
  for (int i = 0; i < 3; ++i) {
    if (place_id(editor, {i, 0, 0}) == 0) {
      return false;
    }
  }
  return editor.history().size() == 2 &&
         almost_equal(editor.coordinates().GridToWorld({0, 0, 0}, kTenByTen).x, -4.5) &&
         editor.event_log().count_of(EditorEventKind::kSettingsChanged) == 1;
}

// Intent: Loading or starting a grid replaces state and clears history.
bool test_load_portable_and_new_grid() {
  Configurator editor(kTenByTen);
  if (place_id(editor, {0, 0, 0}) == 0) {
    return false;
  }

  PortableGrid portable;
  portable.dimensions = kTenByTen;
  portable.pontoons.push_back({7, {1, 0, 1}, "single", "blue", 0});
  portable.pontoons.push_back({3, {1, 1, 1}, "single", "yellow", 180});
  const auto loaded = editor.LoadPortable(portable);
  if (!loaded.ok || editor.grid().size() != 2 || editor.history().size() != 0 ||
      editor.PontoonAt({1, 1, 1})->color != PontoonColor::kYellow ||
      !editor.index().IsConsistentWith(editor.grid())) {
    return false;
  }
  const ObjectId next = place_id(editor, {1, 0, 2});

  PortableGrid broken = portable;
  broken.pontoons.push_back({8, {1, 0, 1}, "single", "blue", 0});
  const auto refused = editor.LoadPortable(broken);
  const bool unchanged = editor.grid().size() == 3;

  const auto fresh = editor.NewGrid(GridDimensions{4, 4, 2, 0});
  const auto invalid = editor.NewGrid(GridDimensions{0, 4, 2, 0});
  return next == 8 && !refused.ok && unchanged && fresh.ok && editor.grid().empty() &&
         editor.grid().dimensions().width == 4 && invalid.first_code() == ValidationCode::kInvalidArgument &&
         editor.event_log().count_of(EditorEventKind::kGridLoaded) == 2;
}

// Intent: The event log keeps the newest events up to its capacity.
bool test_event_log_capacity() {
  EventLog log(3);
  for (int i = 0; i < 5; ++i) {
    log.Record(EditorEventKind::kCommitted, "edit " + std::to_string(i), {static_cast<ObjectId>(i + 1)});
  }
  log.Record(EditorEventKind::kRejected, "bad edit");
  return log.size() == 3 && log.total_recorded() == 6 && log.events().front().sequence == 4 &&
         log.count_of(EditorEventKind::kRejected) == 1 && log.last() != nullptr &&
         log.last()->message == "bad edit";
}

// Intent: Scenario on a 10x10x3 grid covers overlap, support and move.
bool test_end_to_end_scenario() {
  Configurator editor(kTenByTen);
  const auto first = editor.PlacePontoon({0, 0, 0}, PontoonType::kSingle);
  if (!first.ok) {
    return false;
  }
  const ObjectId id = first.change_set.created_ids.front();
  const auto again = editor.PlacePontoon({0, 0, 0}, PontoonType::kSingle);
  const auto floating = editor.PlacePontoon({3, 1, 3}, PontoonType::kSingle);
  const auto moved = editor.MovePontoon(id, {9, 0, 9});
  return again.first_code() == ValidationCode::kOverlap && floating.first_code() == ValidationCode::kNoSupport &&
         moved.ok && editor.grid().find(id) != nullptr && editor.grid().find(id)->position == GridPosition{9, 0, 9} &&
         !editor.PontoonAt({0, 0, 0}).has_value() && editor.PontoonAt({9, 0, 9})->id == id &&
         editor.grid().size() == 1 && editor.index().IsConsistentWith(editor.grid());
}

}  // namespace

int main() {
  pontoon::core::set_log_level(spdlog::level::warn);

  const std::vector<TestCase> tests = {
      {"Model_Footprint_AnchorAndType", "DOUBLE covers x and x+1 regardless of rotation", test_footprint_is_function_of_anchor_and_type},
      {"Model_Catalogue_RotationCycle", "Catalogue names, colours and rotation successor", test_catalogue_and_rotation_cycle},
      {"Model_Parse_Helpers", "Position/type/colour/rotation parsers", test_parse_helpers},
      {"Model_CellsInBox_Order", "Inclusive box ordered by y, z, x", test_cells_in_box_order},
      {"Model_Grid_Immutable", "Operations return a new grid value", test_grid_is_immutable_value},
      {"Model_Grid_Statistics", "Statistics by level, type and colour", test_grid_statistics},
      {"Index_AtomicUpdates", "Insert/MoveElement are all-or-nothing", test_spatial_index_atomic_updates},
      {"Index_RebuildFromGrid", "Desync detected and rebuilt from entity table", test_spatial_index_rebuild_from_grid},
      {"Validation_CanPlace_Idempotent", "Repeated canPlace returns equal results", test_can_place_idempotent},
      {"Validation_PreviewMatchesPlace_Random", "canPlace agrees with place over random grids", test_preview_matches_placement_randomized},
      {"Validation_Double_Exclusive", "Both DOUBLE cells block placement", test_double_footprint_exclusivity},
      {"Validation_SupportChain", "Level 1 needs level 0 below", test_support_chain},
      {"Validation_OrderedRules", "Bounds reported before support", test_validation_reports_ordered_rules},
      {"Validation_UnderwaterLevels", "min_level below zero is the foundation", test_underwater_foundation_levels},
      {"Validation_RemoveSupporter", "Supporter removal blocked; batch clears top first", test_remove_supporter_blocked},
      {"Validation_MoveRules", "Move exclusion, dependants and not-found", test_move_rules},
      {"Validation_SameValue", "Rotate/recolor SAME_VALUE", test_rotate_and_recolor_same_value},
      {"Validation_Connectivity_TwoPlatforms", "Disjoint platforms fail until joined", test_connectivity_two_platforms},
      {"Validation_Connectivity_Vertical", "Stacked cells share a component", test_connectivity_includes_vertical_faces},
      {"Validation_Connectivity_Enforced", "Splitting edits rejected when enforced", test_enforced_connectivity},
      {"Validation_NearbyPositions", "Chebyshev ring search order", test_find_nearby_valid_positions},
      {"Portable_RoundTrip", "Portable form round-trips the grid", test_portable_round_trip},
      {"Portable_RejectsInvalid", "Bad portable data never half-loads", test_portable_rejects_invalid_input},
      {"Portable_DisconnectedWarning", "Disconnected layout loads with warning", test_portable_disconnected_is_warning},
      {"Operations_BatchSkipAndAbort", "Batch skip_invalid vs abort", test_batch_place_skip_and_abort},
      {"History_UndoRedoSymmetry_Random", "n undos/redos restore first/last grid", test_undo_redo_symmetry_randomized},
      {"History_TruncateRedo", "New edit drops redo branch", test_history_truncates_redo_branch},
      {"History_EvictionCursorShift", "Eviction shifts the cursor, clamped at zero", test_history_eviction_and_cursor_shift},
      {"History_CheckpointRollback", "Rollback by id; undo skips markers", test_checkpoint_rollback},
      {"History_Queries", "EntriesAffecting and JumpTo", test_history_queries},
      {"History_Search", "Kind filter, text search and recent tail", test_history_search},
      {"Coordinates_WorkedExample", "Orthographic pixels map to expected cells", test_screen_to_grid_worked_example},
      {"Coordinates_Misses", "Off-grid and degenerate rays give no cell", test_screen_to_grid_misses},
      {"Coordinates_Inverse", "gridToWorld/worldToGrid exact inverse", test_grid_world_inverse},
      {"Coordinates_Cache", "Cache hits and camera invalidation", test_coordinate_cache},
      {"Pipeline_HoverMatchesClick", "Hover validity equals click outcome", test_pipeline_hover_matches_click},
      {"Pipeline_ClickOutsideGrid", "Unresolvable click rejected NO_CELL", test_pipeline_click_outside_grid},
      {"Pipeline_StaleIndexRebuilt", "Missed change set rebuilds the index", test_pipeline_rebuilds_stale_index},
      {"Pipeline_InvalidTransform", "Execute rejects grids failing the audit", test_pipeline_rejects_invalid_transform},
      {"Pipeline_MoveToolStates", "Move tool always returns to idle", test_move_tool_state_machine},
      {"Pipeline_MultiDropDouble", "DOUBLE drag places ceil(W/2) per row", test_multi_drop_double_coverage},
      {"Pipeline_MultiDropSkips", "Drag skips failing cells", test_multi_drop_skips_invalid_cells},
      {"Pipeline_MultiDropCancel", "Leave/cancel discard the drag", test_multi_drop_cancel},
      {"Pipeline_ReentrancyGuard", "Nested input dropped with PIPELINE_BUSY", test_pipeline_reentrancy_guard},
      {"Pipeline_SingleClickTools", "Select/rotate/paint/delete tools", test_single_click_tools},
      {"Pipeline_KeyboardShortcuts", "Ctrl+Z/Ctrl+Y/Delete/Escape", test_keyboard_shortcuts},
      {"Pipeline_DeleteSelection", "Delete key removes stacked selection", test_delete_selection_batch},
      {"Facade_UpdateSettings", "Invalid settings rejected; valid ones applied", test_update_settings},
      {"Facade_LoadAndNewGrid", "Load/new grid replace state and clear history", test_load_portable_and_new_grid},
      {"Events_Capacity", "Event log trims oldest events", test_event_log_capacity},
      {"Scenario_EndToEnd", "Place, overlap, support and move on 10x10x3", test_end_to_end_scenario},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
