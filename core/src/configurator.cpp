#include "pontoon/core/configurator.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "pontoon/core/log.hpp"

namespace pontoon::core {

namespace {

ValidationIssue settings_issue(std::string message) {
  return {ValidationSeverity::kError, ValidationCode::kInvalidArgument, std::move(message), std::nullopt,
          kInvalidObjectId};
}

EditorSettings usable_settings(const EditorSettings& settings) {
  const ValidationResult check = ValidateSettings(settings);
  if (check.ok()) {
    return settings;
  }
  for (const std::string& message : check.messages()) {
    logger()->warn("editor settings rejected: {}", message);
  }
  return EditorSettings{};
}

GridDimensions usable_dimensions(const GridDimensions& dimensions) {
  if (dimensions.valid()) {
    return dimensions;
  }
  logger()->warn("grid dimensions {}x{}x{} are invalid; using {}x{}x{}", dimensions.width, dimensions.height,
                 dimensions.levels, kDefaultGridDimensions.width, kDefaultGridDimensions.height,
                 kDefaultGridDimensions.levels);
  return kDefaultGridDimensions;
}

// Carries a batch through a Grid-valued commit while keeping its per-item outcome.
EditResult<BatchOutcome> with_outcome(const EditResult<Grid>& committed, BatchOutcome outcome) {
  EditResult<BatchOutcome> result;
  result.ok = committed.ok;
  outcome.grid = committed.value;
  result.value = std::move(outcome);
  result.errors = committed.errors;
  result.issues = committed.issues;
  result.operations = committed.operations;
  result.change_set = committed.change_set;
  return result;
}

} // namespace

ValidationResult ValidateSettings(const EditorSettings& settings) {
  ValidationResult result;
  if (!std::isfinite(settings.cell_size_m) || settings.cell_size_m <= 0.0) {
    result.issues.push_back(settings_issue("cell size must be a positive length"));
  }
  if (!std::isfinite(settings.level_height_m) || settings.level_height_m <= 0.0) {
    result.issues.push_back(settings_issue("level height must be a positive length"));
  }
  if (settings.history_max_entries == 0) {
    result.issues.push_back(settings_issue("history must keep at least one entry"));
  }
  if (settings.coordinate_cache_capacity == 0) {
    result.issues.push_back(settings_issue("coordinate cache capacity must be at least 1"));
  }
  if (settings.nearby_search_distance < 0) {
    result.issues.push_back(settings_issue("nearby search distance must not be negative"));
  }
  if (settings.event_log_capacity == 0) {
    result.issues.push_back(settings_issue("event log capacity must be at least 1"));
  }
  return result;
}

Configurator::Configurator(const GridDimensions& dimensions, const EditorSettings& settings)
    : settings_(usable_settings(settings)),
      history_(settings_.history_max_entries),
      calculator_(coordinate_settings(settings_)),
      events_(settings_.event_log_capacity),
      pipeline_(Grid(usable_dimensions(dimensions)), history_, calculator_, events_, pipeline_options(settings_)) {
  logger()->info("editor ready: {}x{}x{} grid, levels {}..{}", grid().dimensions().width,
                 grid().dimensions().height, grid().dimensions().levels, grid().dimensions().min_level,
                 grid().dimensions().max_level());
}

EditResult<Grid> Configurator::PlacePontoon(const GridPosition& position, PontoonType type, PontoonColor color,
                                            Rotation rotation) {
  const OperationOptions options = operation_options();
  return pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex& index) {
    return GridOperations::Place(grid, index, position, type, color, rotation, options);
  });
}

EditResult<Grid> Configurator::RemovePontoon(ObjectId id) {
  const OperationOptions options = operation_options();
  return pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex& index) {
    return GridOperations::Remove(grid, index, id, options);
  });
}

EditResult<Grid> Configurator::RemovePontoonAt(const GridPosition& position) {
  const ObjectId id = index().OccupantAt(position);
  if (id == kInvalidObjectId) {
    EditResult<Grid> result;
    result.value = grid();
    result.fail(ValidationCode::kNotFound, "no pontoon at " + to_string(position), kInvalidObjectId, position);
    return result;
  }
  return RemovePontoon(id);
}

EditResult<Grid> Configurator::MovePontoon(ObjectId id, const GridPosition& new_position) {
  const OperationOptions options = operation_options();
  return pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex& index) {
    return GridOperations::Move(grid, index, id, new_position, options);
  });
}

EditResult<Grid> Configurator::RotatePontoon(ObjectId id) {
  const Pontoon* pontoon = grid().find(id);
  if (pontoon == nullptr) {
    EditResult<Grid> result;
    result.value = grid();
    result.fail(ValidationCode::kNotFound, "pontoon " + pontoon_display_id(id) + " not found", id);
    return result;
  }
  return RotatePontoon(id, next_rotation(pontoon->rotation));
}

EditResult<Grid> Configurator::RotatePontoon(ObjectId id, Rotation rotation) {
  return pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex&) {
    return GridOperations::Rotate(grid, id, rotation);
  });
}

EditResult<Grid> Configurator::RecolorPontoon(ObjectId id, PontoonColor color) {
  return pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex&) {
    return GridOperations::Recolor(grid, id, color);
  });
}

EditResult<BatchOutcome> Configurator::PlacePontoonsBatch(const std::vector<GridPosition>& positions,
                                                          PontoonType type, PontoonColor color, Rotation rotation,
                                                          bool skip_invalid) {
  const OperationOptions options = operation_options();
  BatchOutcome outcome;
  const EditResult<Grid> committed = pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex& index) {
    EditResult<BatchOutcome> batch =
        GridOperations::PlaceBatch(grid, index, positions, type, color, rotation, skip_invalid, options);
    outcome = batch.value;
    return as_grid_result(batch);
  });
  return with_outcome(committed, std::move(outcome));
}

EditResult<BatchOutcome> Configurator::RemovePontoonsBatch(const std::vector<ObjectId>& ids, bool skip_invalid) {
  const OperationOptions options = operation_options();
  BatchOutcome outcome;
  const EditResult<Grid> committed = pipeline_.Execute({}, [&](const Grid& grid, const SpatialIndex& index) {
    EditResult<BatchOutcome> batch = GridOperations::RemoveBatch(grid, index, ids, skip_invalid, options);
    outcome = batch.value;
    return as_grid_result(batch);
  });
  return with_outcome(committed, std::move(outcome));
}

PipelineResult Configurator::ProcessInput(const InputEvent& event, const ViewContext& view,
                                          const ToolSettings& tool) {
  return pipeline_.ProcessInput(event, view, tool);
}

bool Configurator::Undo() { return pipeline_.Undo().ok; }

bool Configurator::Redo() { return pipeline_.Redo().ok; }

EditResult<HistoryEntryId> Configurator::CreateCheckpoint(std::string label) {
  return pipeline_.CreateCheckpoint(std::move(label));
}

EditResult<Grid> Configurator::RollbackToCheckpoint(HistoryEntryId checkpoint_id) {
  return pipeline_.RollbackToCheckpoint(checkpoint_id);
}

EditResult<bool> Configurator::UpdateSettings(const EditorSettings& settings) {
  EditResult<bool> result;
  const ValidationResult check = ValidateSettings(settings);
  if (!check.ok()) {
    result.add_issues(check);
    return result;
  }

  settings_ = settings;
  history_.SetMaxEntries(settings_.history_max_entries);
  calculator_.UpdateSettings(coordinate_settings(settings_));
  events_.SetCapacity(settings_.event_log_capacity);
  pipeline_.set_options(pipeline_options(settings_));
  events_.Record(EditorEventKind::kSettingsChanged,
                 "settings updated: cell " + std::to_string(settings_.cell_size_m) + " m, history " +
                     std::to_string(settings_.history_max_entries) + ", connectivity " +
                     (settings_.enforce_connectivity ? "enforced" : "advisory"));
  result.ok = true;
  result.value = true;
  return result;
}

EditResult<Grid> Configurator::NewGrid(const GridDimensions& dimensions) {
  if (!dimensions.valid()) {
    EditResult<Grid> result;
    result.value = grid();
    result.fail(ValidationCode::kInvalidArgument, "grid dimensions must be positive");
    return result;
  }
  return pipeline_.ReplaceGrid(Grid(dimensions), "new grid");
}

EditResult<Grid> Configurator::LoadPortable(const PortableGrid& portable) {
  EditResult<Grid> loaded = FromPortable(portable);
  if (!loaded.ok) {
    loaded.value = grid();
    return loaded;
  }
  EditResult<Grid> result = pipeline_.ReplaceGrid(loaded.value, "loaded portable grid");
  for (const ValidationIssue& issue : loaded.issues) {
    result.add_issue(issue);
  }
  return result;
}

PortableGrid Configurator::ToPortable() const { return core::ToPortable(grid()); }

std::optional<Pontoon> Configurator::PontoonAt(const GridPosition& position) const {
  const Pontoon* pontoon = grid().find(index().OccupantAt(position));
  if (pontoon == nullptr) {
    return std::nullopt;
  }
  return *pontoon;
}

std::vector<Pontoon> Configurator::PontoonsAtLevel(int level) const { return grid().pontoons_at_level(level); }

ValidationResult Configurator::ValidateConnectivity() const {
  return PlacementValidator(grid(), index()).ValidateConnectivity();
}

ValidationResult Configurator::CanPlace(const GridPosition& position, PontoonType type) const {
  return PlacementValidator(grid(), index()).CanPlace(position, type);
}

ValidationResult Configurator::CanMove(ObjectId id, const GridPosition& new_position) const {
  return PlacementValidator(grid(), index()).CanMove(id, new_position);
}

std::vector<GridPosition> Configurator::FindNearbyValidPositions(const GridPosition& target,
                                                                 PontoonType type) const {
  return FindNearbyValidPositions(target, type, settings_.nearby_search_distance);
}

std::vector<GridPosition> Configurator::FindNearbyValidPositions(const GridPosition& target, PontoonType type,
                                                                 int max_distance) const {
  return PlacementValidator(grid(), index()).FindNearbyValidPositions(target, type, max_distance);
}

OperationOptions Configurator::operation_options() const {
  OperationOptions options;
  options.enforce_connectivity = settings_.enforce_connectivity;
  return options;
}

PipelineOptions Configurator::pipeline_options(const EditorSettings& settings) {
  PipelineOptions options;
  options.operation_options.enforce_connectivity = settings.enforce_connectivity;
  options.verify_index_after_commit = settings.verify_index_after_commit;
  return options;
}

CoordinateSettings Configurator::coordinate_settings(const EditorSettings& settings) {
  CoordinateSettings coordinate;
  coordinate.cell_size_m = settings.cell_size_m;
  coordinate.level_height_m = settings.level_height_m;
  coordinate.cache_capacity = settings.coordinate_cache_capacity;
  return coordinate;
}

} // namespace pontoon::core
