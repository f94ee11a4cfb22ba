#include "pontoon/core/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

#include "pontoon/core/log.hpp"
#include "pontoon/core/placement_validator.hpp"

namespace pontoon::core {

namespace {

std::vector<ObjectId> touched_ids(const ChangeSet& change_set) {
  std::vector<ObjectId> ids;
  ids.insert(ids.end(), change_set.created_ids.begin(), change_set.created_ids.end());
  ids.insert(ids.end(), change_set.updated_ids.begin(), change_set.updated_ids.end());
  ids.insert(ids.end(), change_set.deleted_ids.begin(), change_set.deleted_ids.end());
  return ids;
}

// Entity-level difference between two snapshots, used when history restores a grid.
ChangeSet diff_grids(const Grid& before, const Grid& after) {
  ChangeSet change_set;
  for (const Pontoon& pontoon : after.sorted_pontoons()) {
    const Pontoon* old = before.find(pontoon.id);
    if (old == nullptr) {
      change_set.created_ids.push_back(pontoon.id);
    } else if (!(*old == pontoon)) {
      change_set.updated_ids.push_back(pontoon.id);
    }
  }
  for (const Pontoon& pontoon : before.sorted_pontoons()) {
    if (!after.contains(pontoon.id)) {
      change_set.deleted_ids.push_back(pontoon.id);
    }
  }
  return change_set;
}

std::string no_pontoon_message(const GridPosition& cell) { return "no pontoon at " + to_string(cell); }

} // namespace

std::string_view to_string(PipelineOutcome outcome) {
  switch (outcome) {
  case PipelineOutcome::kIgnored:
    return "ignored";
  case PipelineOutcome::kPreviewUpdated:
    return "preview_updated";
  case PipelineOutcome::kStateChanged:
    return "state_changed";
  case PipelineOutcome::kCommitted:
    return "committed";
  case PipelineOutcome::kRejected:
    return "rejected";
  case PipelineOutcome::kDropped:
    return "dropped";
  default:
    return "unknown";
  }
}

std::optional<ValidationCode> PipelineResult::first_code() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return issue.code;
    }
  }
  return std::nullopt;
}

OperationPipeline::OperationPipeline(Grid initial, HistoryLedger& history, CoordinateCalculator& calculator,
                                     EventLog& events, const PipelineOptions& options)
    : grid_(std::move(initial)), history_(history), calculator_(calculator), events_(events), options_(options) {
  if (!index_.Rebuild(grid_)) {
    logger()->error("initial grid has conflicting footprints; spatial index is incomplete");
  }
}

PipelineResult OperationPipeline::ProcessInput(const InputEvent& event, const ViewContext& view,
                                               const ToolSettings& tool) {
  ++stats_.processed;
  if (busy_) {
    PipelineResult dropped;
    dropped.outcome = PipelineOutcome::kDropped;
    dropped.issues.push_back({ValidationSeverity::kError, ValidationCode::kPipelineBusy,
                              "pipeline is busy; input dropped", std::nullopt, kInvalidObjectId});
    dropped.errors.push_back(dropped.issues.back().message);
    note_dropped("input dropped while another input was in flight");
    return dropped;
  }

  BusyScope scope(busy_);
  current_timestamp_ms_ = event.timestamp_ms;
  active_level_ = tool.active_level;
  PipelineResult result = dispatch(event, view, tool);
  switch (result.outcome) {
  case PipelineOutcome::kCommitted:
    ++stats_.committed;
    break;
  case PipelineOutcome::kRejected:
    ++stats_.rejected;
    break;
  case PipelineOutcome::kIgnored:
    ++stats_.ignored;
    break;
  default:
    break;
  }
  return result;
}

EditResult<Grid> OperationPipeline::Execute(std::string_view description, const GridTransform& transform,
                                            std::int64_t timestamp_ms) {
  if (busy_) {
    EditResult<Grid> dropped;
    dropped.value = grid_;
    dropped.fail(ValidationCode::kPipelineBusy, "pipeline is busy; edit dropped");
    note_dropped("edit '" + std::string(description) + "' dropped while another input was in flight");
    return dropped;
  }

  BusyScope scope(busy_);
  current_timestamp_ms_ = timestamp_ms;
  EditResult<Grid> result = commit(transform(grid_, index_), description, timestamp_ms);
  if (result.ok) {
    ++stats_.committed;
  } else {
    ++stats_.rejected;
  }
  return result;
}

EditResult<Grid> OperationPipeline::Undo() {
  if (busy_) {
    return busy_grid_result("undo");
  }
  BusyScope scope(busy_);
  return restore(history_.Undo(), EditorEventKind::kHistoryUndo, "undo");
}

EditResult<Grid> OperationPipeline::Redo() {
  if (busy_) {
    return busy_grid_result("redo");
  }
  BusyScope scope(busy_);
  return restore(history_.Redo(), EditorEventKind::kHistoryRedo, "redo");
}

EditResult<HistoryEntryId> OperationPipeline::CreateCheckpoint(std::string label) {
  EditResult<HistoryEntryId> result;
  if (busy_) {
    result.fail(ValidationCode::kPipelineBusy, "pipeline is busy; checkpoint dropped");
    note_dropped("checkpoint '" + label + "' dropped while another input was in flight");
    return result;
  }
  if (label.empty()) {
    result.fail(ValidationCode::kInvalidArgument, "checkpoint label must not be empty");
    return result;
  }

  BusyScope scope(busy_);
  const std::int64_t timestamp = now_ms();
  result.ok = true;
  result.value = history_.CreateCheckpoint(grid_, label, timestamp);
  events_.Record(EditorEventKind::kCheckpointCreated, "checkpoint #" + std::to_string(result.value) + " '" +
                                                          label + "'",
                 {}, timestamp);
  return result;
}

EditResult<Grid> OperationPipeline::RollbackToCheckpoint(HistoryEntryId checkpoint_id) {
  if (busy_) {
    return busy_grid_result("rollback");
  }
  BusyScope scope(busy_);
  std::optional<Grid> restored = history_.RollbackToCheckpoint(checkpoint_id);
  if (!restored.has_value()) {
    EditResult<Grid> result;
    result.value = grid_;
    result.fail(ValidationCode::kNotFound, "checkpoint #" + std::to_string(checkpoint_id) + " not found");
    return result;
  }
  return restore(std::move(restored), EditorEventKind::kCheckpointRollback,
                 "rollback to checkpoint #" + std::to_string(checkpoint_id));
}

EditResult<Grid> OperationPipeline::ReplaceGrid(const Grid& grid, std::string_view reason) {
  if (busy_) {
    return busy_grid_result("grid replacement");
  }
  BusyScope scope(busy_);
  EditResult<Grid> result;
  result.value = grid_;
  const ValidationResult audit = grid.Validate();
  if (audit.has_errors()) {
    result.add_issues(audit);
    return result;
  }

  replace_state(grid);
  history_.Clear();
  result.ok = true;
  result.value = grid_;
  for (const Pontoon& pontoon : grid_.sorted_pontoons()) {
    result.change_set.created_ids.push_back(pontoon.id);
  }
  events_.Record(EditorEventKind::kGridLoaded,
                 std::string(reason) + ": " + std::to_string(grid_.size()) + " pontoons on " +
                     std::to_string(grid_.dimensions().width) + "x" + std::to_string(grid_.dimensions().height) +
                     "x" + std::to_string(grid_.dimensions().levels),
                 result.change_set.created_ids, now_ms());
  return result;
}

void OperationPipeline::CancelInteraction() {
  multi_drop_anchor_.reset();
  multi_drop_current_.reset();
  move_state_ = MoveToolState::kIdle;
  move_source_id_ = kInvalidObjectId;
  hover_.reset();
}

PipelineOverlay OperationPipeline::overlay() const {
  PipelineOverlay overlay;
  overlay.active_level = active_level_;
  overlay.hover = hover_;
  overlay.selection = selection_;
  overlay.move_state = move_state_;
  overlay.move_source_id = move_source_id_;
  if (multi_drop_anchor_.has_value()) {
    overlay.multi_drop_active = true;
    overlay.multi_drop_anchor = multi_drop_anchor_;
    overlay.multi_drop_cells = MultiDropCells(*multi_drop_anchor_, multi_drop_current_.value_or(*multi_drop_anchor_),
                                              multi_drop_level_, multi_drop_type_);
  }
  return overlay;
}

std::vector<GridPosition> OperationPipeline::MultiDropCells(const GridPosition& anchor, const GridPosition& current,
                                                            int level, PontoonType type) {
  std::vector<GridPosition> cells = cells_in_box(anchor.with_level(level), current.with_level(level));
  if (type == PontoonType::kDouble) {
    const int min_x = std::min(anchor.x, current.x);
    cells.erase(std::remove_if(cells.begin(), cells.end(),
                               [min_x](const GridPosition& cell) { return (cell.x - min_x) % 2 != 0; }),
                cells.end());
  }
  return cells;
}

PipelineResult OperationPipeline::dispatch(const InputEvent& event, const ViewContext& view,
                                           const ToolSettings& tool) {
  // Switching tools abandons any half-finished gesture of the previous one.
  if (tool.tool != ToolKind::kMove && move_state_ == MoveToolState::kSelected) {
    move_state_ = MoveToolState::kIdle;
    move_source_id_ = kInvalidObjectId;
  }
  if (tool.tool != ToolKind::kMultiDrop && multi_drop_anchor_.has_value()) {
    multi_drop_anchor_.reset();
    multi_drop_current_.reset();
  }

  const std::optional<GridPosition> cell = resolve_cell(event, view, tool);
  switch (event.kind) {
  case InputKind::kPointerMove:
    if (multi_drop_anchor_.has_value()) {
      if (cell.has_value()) {
        multi_drop_current_ = cell;
      }
      PipelineResult result;
      result.outcome = PipelineOutcome::kPreviewUpdated;
      result.ok = true;
      result.cell = cell;
      return result;
    }
    return handle_pointer_move(cell, tool);
  case InputKind::kPointerDown:
    if (event.button != PointerButton::kLeft || tool.tool != ToolKind::kMultiDrop) {
      return {};
    }
    return handle_pointer_down(cell, tool);
  case InputKind::kPointerUp:
    if (tool.tool != ToolKind::kMultiDrop || !multi_drop_anchor_.has_value()) {
      return {};
    }
    return handle_pointer_up(cell, tool);
  case InputKind::kClick:
    if (event.button != PointerButton::kLeft || tool.tool == ToolKind::kMultiDrop) {
      return {};
    }
    return handle_click(cell, event, tool);
  case InputKind::kPointerLeave: {
    PipelineResult result;
    result.ok = true;
    result.outcome = multi_drop_anchor_.has_value() ? PipelineOutcome::kStateChanged
                                                    : PipelineOutcome::kPreviewUpdated;
    if (multi_drop_anchor_.has_value()) {
      logger()->debug("multi-drop gesture discarded on pointer leave");
    }
    multi_drop_anchor_.reset();
    multi_drop_current_.reset();
    hover_.reset();
    return result;
  }
  case InputKind::kCancel: {
    CancelInteraction();
    PipelineResult result;
    result.ok = true;
    result.outcome = PipelineOutcome::kStateChanged;
    return result;
  }
  case InputKind::kKey:
    return handle_key(event, cell);
  default:
    return {};
  }
}

PipelineResult OperationPipeline::handle_pointer_move(const std::optional<GridPosition>& cell,
                                                      const ToolSettings& tool) {
  PipelineResult result;
  result.outcome = PipelineOutcome::kPreviewUpdated;
  result.ok = true;
  result.cell = cell;
  if (!cell.has_value()) {
    hover_.reset();
    return result;
  }

  PlacementPreview preview = make_preview(*cell, tool);
  result.issues = preview.issues;
  hover_ = std::move(preview);
  return result;
}

PipelineResult OperationPipeline::handle_click(const std::optional<GridPosition>& cell, const InputEvent& event,
                                               const ToolSettings& tool) {
  if (tool.tool == ToolKind::kMove) {
    return handle_move_tool(cell);
  }
  if (!cell.has_value()) {
    return reject(std::nullopt, ValidationCode::kNoCell, "no grid cell under the pointer");
  }

  const OperationOptions& ops = options_.operation_options;
  switch (tool.tool) {
  case ToolKind::kSelect:
    return handle_select(cell, event);
  case ToolKind::kPlace:
    return run_transform(cell, [&](const Grid& grid, const SpatialIndex& index) {
      return GridOperations::Place(grid, index, *cell, tool.type, tool.color, tool.rotation, ops);
    });
  case ToolKind::kDelete: {
    const ObjectId id = index_.OccupantAt(*cell);
    if (id == kInvalidObjectId) {
      return reject(cell, ValidationCode::kNotFound, no_pontoon_message(*cell));
    }
    return run_transform(cell, [&](const Grid& grid, const SpatialIndex& index) {
      return GridOperations::Remove(grid, index, id, ops);
    });
  }
  case ToolKind::kRotate: {
    const Pontoon* pontoon = grid_.find(index_.OccupantAt(*cell));
    if (pontoon == nullptr) {
      return reject(cell, ValidationCode::kNotFound, no_pontoon_message(*cell));
    }
    const ObjectId id = pontoon->id;
    const Rotation rotation = next_rotation(pontoon->rotation);
    return run_transform(cell, [id, rotation](const Grid& grid, const SpatialIndex&) {
      return GridOperations::Rotate(grid, id, rotation);
    });
  }
  case ToolKind::kPaint: {
    const ObjectId id = index_.OccupantAt(*cell);
    if (id == kInvalidObjectId) {
      return reject(cell, ValidationCode::kNotFound, no_pontoon_message(*cell));
    }
    const PontoonColor color = tool.color;
    return run_transform(cell, [id, color](const Grid& grid, const SpatialIndex&) {
      return GridOperations::Recolor(grid, id, color);
    });
  }
  default:
    return {};
  }
}

PipelineResult OperationPipeline::handle_pointer_down(const std::optional<GridPosition>& cell,
                                                      const ToolSettings& tool) {
  if (!cell.has_value()) {
    return reject(std::nullopt, ValidationCode::kNoCell, "no grid cell under the pointer");
  }
  multi_drop_anchor_ = cell;
  multi_drop_current_ = cell;
  multi_drop_level_ = tool.active_level;
  multi_drop_type_ = tool.type;
  hover_.reset();

  PipelineResult result;
  result.outcome = PipelineOutcome::kStateChanged;
  result.ok = true;
  result.cell = cell;
  return result;
}

PipelineResult OperationPipeline::handle_pointer_up(const std::optional<GridPosition>& cell,
                                                    const ToolSettings& tool) {
  if (cell.has_value()) {
    multi_drop_current_ = cell;
  }
  const GridPosition anchor = *multi_drop_anchor_;
  const std::vector<GridPosition> cells =
      MultiDropCells(anchor, multi_drop_current_.value_or(anchor), multi_drop_level_, multi_drop_type_);
  const PontoonType type = multi_drop_type_;
  multi_drop_anchor_.reset();
  multi_drop_current_.reset();

  const OperationOptions& ops = options_.operation_options;
  return run_transform(anchor, [&](const Grid& grid, const SpatialIndex& index) {
    return as_grid_result(
        GridOperations::PlaceBatch(grid, index, cells, type, tool.color, tool.rotation, true, ops));
  });
}

PipelineResult OperationPipeline::handle_key(const InputEvent& event, const std::optional<GridPosition>& cell) {
  PipelineResult result;
  result.cell = cell;
  switch (event.key) {
  case Key::kEscape:
    CancelInteraction();
    selection_.clear();
    result.ok = true;
    result.outcome = PipelineOutcome::kStateChanged;
    return result;
  case Key::kDelete: {
    std::vector<ObjectId> ids = selection_;
    if (ids.empty() && cell.has_value()) {
      const ObjectId id = index_.OccupantAt(*cell);
      if (id != kInvalidObjectId) {
        ids.push_back(id);
      }
    }
    if (ids.empty()) {
      return reject(cell, ValidationCode::kNotFound, "nothing selected to delete");
    }
    const OperationOptions& ops = options_.operation_options;
    if (ids.size() == 1) {
      const ObjectId id = ids.front();
      return run_transform(cell, [&](const Grid& grid, const SpatialIndex& index) {
        return GridOperations::Remove(grid, index, id, ops);
      });
    }
    return run_transform(cell, [&](const Grid& grid, const SpatialIndex& index) {
      return as_grid_result(GridOperations::RemoveBatch(grid, index, ids, true, ops));
    });
  }
  case Key::kZ:
  case Key::kY: {
    if (!event.modifiers.ctrl) {
      return result;
    }
    const bool redo = event.key == Key::kY || event.modifiers.shift;
    EditResult<Grid> restored = redo ? restore(history_.Redo(), EditorEventKind::kHistoryRedo, "redo")
                                     : restore(history_.Undo(), EditorEventKind::kHistoryUndo, "undo");
    result.ok = restored.ok;
    result.outcome = restored.ok ? PipelineOutcome::kStateChanged : PipelineOutcome::kIgnored;
    result.errors = std::move(restored.errors);
    return result;
  }
  default:
    return result;
  }
}

PipelineResult OperationPipeline::handle_select(const std::optional<GridPosition>& cell, const InputEvent& event) {
  PipelineResult result;
  result.outcome = PipelineOutcome::kStateChanged;
  result.ok = true;
  result.cell = cell;

  const ObjectId id = index_.OccupantAt(*cell);
  if (id == kInvalidObjectId) {
    selection_.clear();
    return result;
  }
  if (event.modifiers.shift) {
    auto it = std::find(selection_.begin(), selection_.end(), id);
    if (it != selection_.end()) {
      selection_.erase(it);
    } else {
      selection_.push_back(id);
    }
  } else {
    selection_.assign(1, id);
  }

  Operation operation;
  operation.kind = OperationKind::kSelect;
  operation.timestamp_ms = current_timestamp_ms_;
  operation.affected_ids = selection_;
  operation.description = "Select " + std::to_string(selection_.size()) + " pontoon(s)";
  result.operations.push_back(std::move(operation));
  return result;
}

PipelineResult OperationPipeline::handle_move_tool(const std::optional<GridPosition>& cell) {
  if (move_state_ == MoveToolState::kIdle) {
    if (!cell.has_value()) {
      return reject(std::nullopt, ValidationCode::kNoCell, "no grid cell under the pointer");
    }
    const ObjectId id = index_.OccupantAt(*cell);
    if (id == kInvalidObjectId) {
      return reject(cell, ValidationCode::kNotFound, no_pontoon_message(*cell));
    }
    move_state_ = MoveToolState::kSelected;
    move_source_id_ = id;
    hover_.reset();

    PipelineResult result;
    result.outcome = PipelineOutcome::kStateChanged;
    result.ok = true;
    result.cell = cell;
    return result;
  }

  // Second click: whatever happens, the tool returns to idle.
  const ObjectId source = move_source_id_;
  move_state_ = MoveToolState::kIdle;
  move_source_id_ = kInvalidObjectId;
  hover_.reset();
  if (!cell.has_value()) {
    return reject(std::nullopt, ValidationCode::kNoCell, "no grid cell under the pointer");
  }
  const GridPosition destination = *cell;
  const OperationOptions& ops = options_.operation_options;
  return run_transform(cell, [&](const Grid& grid, const SpatialIndex& index) {
    return GridOperations::Move(grid, index, source, destination, ops);
  });
}

PipelineResult OperationPipeline::run_transform(std::optional<GridPosition> cell, const GridTransform& transform) {
  EditResult<Grid> edit = commit(transform(grid_, index_), {}, current_timestamp_ms_);
  PipelineResult result;
  result.outcome = edit.ok ? PipelineOutcome::kCommitted : PipelineOutcome::kRejected;
  result.ok = edit.ok;
  result.cell = std::move(cell);
  result.errors = std::move(edit.errors);
  result.issues = std::move(edit.issues);
  result.operations = std::move(edit.operations);
  return result;
}

EditResult<Grid> OperationPipeline::commit(EditResult<Grid> result, std::string_view description,
                                           std::int64_t timestamp_ms) {
  const std::int64_t timestamp = (timestamp_ms != 0) ? timestamp_ms : now_ms();
  if (result.ok) {
    // Transforms passed to Execute must still leave a grid that passes the audit.
    const ValidationResult audit = result.value.Validate();
    if (!audit.ok()) {
      result.ok = false;
      result.operations.clear();
      result.change_set = {};
      result.add_issues(audit);
      logger()->debug("edit '{}' rejected: resulting grid fails audit ({})", description, result.error());
    }
  }
  if (!result.ok) {
    result.value = grid_;
    events_.Record(EditorEventKind::kRejected, result.errors.empty() ? std::string("edit rejected") : result.error(),
                   {}, timestamp);
    return result;
  }

  for (Operation& operation : result.operations) {
    operation.sequence = next_operation_sequence_++;
    operation.timestamp_ms = timestamp;
  }
  std::string text{description};
  if (text.empty()) {
    text = result.operations.empty() ? std::string("edit") : result.operations.back().description;
  }

  const Grid before = grid_;
  grid_ = result.value;
  sync_index(before, result.change_set);
  history_.Append(before, grid_, result.operations, text, timestamp);
  prune_selection();
  hover_.reset();
  events_.Record(EditorEventKind::kCommitted, text, touched_ids(result.change_set), timestamp);

  if (commit_listener_) {
    commit_listener_(grid_, result.operations);
  }
  return result;
}

EditResult<Grid> OperationPipeline::restore(std::optional<Grid> restored, EditorEventKind kind,
                                            const std::string& label) {
  EditResult<Grid> result;
  result.value = grid_;
  if (!restored.has_value()) {
    result.errors.push_back("nothing to " + label);
    logger()->debug("nothing to {}", label);
    return result;
  }

  const Grid before = grid_;
  replace_state(*restored);
  result.ok = true;
  result.value = grid_;
  result.change_set = diff_grids(before, grid_);
  events_.Record(kind, label + ": " + std::to_string(grid_.size()) + " pontoons", touched_ids(result.change_set),
                 now_ms());
  return result;
}

EditResult<Grid> OperationPipeline::busy_grid_result(std::string_view what) {
  EditResult<Grid> result;
  result.value = grid_;
  result.fail(ValidationCode::kPipelineBusy, "pipeline is busy; " + std::string(what) + " dropped");
  note_dropped(std::string(what) + " dropped while another input was in flight");
  return result;
}

void OperationPipeline::note_dropped(std::string message) {
  ++stats_.dropped;
  events_.Record(EditorEventKind::kInputDropped, std::move(message), {}, current_timestamp_ms_);
}

void OperationPipeline::sync_index(const Grid& before, const ChangeSet& change_set) {
  bool complete = true;
  for (ObjectId id : change_set.deleted_ids) {
    complete = index_.Remove(id) && complete;
  }
  for (ObjectId id : change_set.updated_ids) {
    const Pontoon* now = grid_.find(id);
    const Pontoon* old = before.find(id);
    if (now == nullptr || old == nullptr) {
      complete = false;
      continue;
    }
    if (now->position != old->position) {
      complete = index_.MoveElement(id, now->position) && complete;
    }
  }
  for (ObjectId id : change_set.created_ids) {
    const Pontoon* pontoon = grid_.find(id);
    complete = pontoon != nullptr && index_.Insert(id, pontoon->position, footprint_extent(pontoon->type)) &&
               complete;
  }
  if (complete && options_.verify_index_after_commit) {
    complete = index_.IsConsistentWith(grid_);
  }
  if (complete) {
    return;
  }

  ++stats_.index_rebuilds;
  if (!index_.Rebuild(grid_)) {
    logger()->error("spatial index rebuild found conflicting footprints");
  }
  events_.Record(EditorEventKind::kIndexRebuilt,
                 "spatial index out of sync; rebuilt from " + std::to_string(grid_.size()) + " pontoons", {},
                 current_timestamp_ms_);
}

void OperationPipeline::replace_state(const Grid& grid) {
  grid_ = grid;
  if (!index_.Rebuild(grid_)) {
    logger()->error("restored grid has conflicting footprints; spatial index is incomplete");
  }
  CancelInteraction();
  prune_selection();
}

std::optional<GridPosition> OperationPipeline::resolve_cell(const InputEvent& event, const ViewContext& view,
                                                            const ToolSettings& tool) {
  if (!grid_.dimensions().contains_level(tool.active_level)) {
    return std::nullopt;
  }
  return calculator_.ScreenToGrid(event.pointer, view.camera, view.viewport, grid_.dimensions(), tool.active_level);
}

PlacementPreview OperationPipeline::make_preview(const GridPosition& cell, const ToolSettings& tool) const {
  PlacementPreview preview;
  preview.cell = cell;
  const OperationOptions& ops = options_.operation_options;

  // Previews dry-run the same transform a click would commit.
  if (tool.tool == ToolKind::kMove && move_state_ == MoveToolState::kSelected) {
    const Pontoon* source = grid_.find(move_source_id_);
    preview.footprint = footprint_of(cell, source == nullptr ? tool.type : source->type);
    const EditResult<Grid> dry = GridOperations::Move(grid_, index_, move_source_id_, cell, ops);
    preview.valid = dry.ok;
    preview.issues = dry.issues;
    return preview;
  }
  if (tool.tool == ToolKind::kPlace || tool.tool == ToolKind::kMultiDrop) {
    preview.footprint = footprint_of(cell, tool.type);
    const EditResult<Grid> dry =
        GridOperations::Place(grid_, index_, cell, tool.type, tool.color, tool.rotation, ops);
    preview.valid = dry.ok;
    preview.issues = dry.issues;
    return preview;
  }

  const ObjectId occupant = index_.OccupantAt(cell);
  if (occupant == kInvalidObjectId) {
    preview.footprint.push_back(cell);
    preview.valid = false;
    return preview;
  }
  preview.footprint = index_.CellsOf(occupant);
  preview.valid = true;
  return preview;
}

std::int64_t OperationPipeline::now_ms() const {
  if (clock_) {
    return clock_();
  }
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

PipelineResult OperationPipeline::reject(std::optional<GridPosition> cell, ValidationCode code,
                                         std::string message) {
  PipelineResult result;
  result.outcome = PipelineOutcome::kRejected;
  result.ok = false;
  result.cell = cell;
  result.issues.push_back({ValidationSeverity::kError, code, message, cell, kInvalidObjectId});
  result.errors.push_back(message);
  events_.Record(EditorEventKind::kRejected, std::move(message), {}, current_timestamp_ms_);
  return result;
}

void OperationPipeline::prune_selection() {
  selection_.erase(std::remove_if(selection_.begin(), selection_.end(),
                                  [this](ObjectId id) { return !grid_.contains(id); }),
                   selection_.end());
}

} // namespace pontoon::core
