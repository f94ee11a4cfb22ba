#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pontoon/core/coordinate_calculator.hpp"
#include "pontoon/core/entities.hpp"
#include "pontoon/core/event_log.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/history.hpp"
#include "pontoon/core/operations.hpp"
#include "pontoon/core/result.hpp"
#include "pontoon/core/spatial_index.hpp"
#include "pontoon/core/types.hpp"

namespace pontoon::core {

enum class ToolKind : std::uint8_t {
  kSelect = 0,
  kPlace = 1,
  kDelete = 2,
  kRotate = 3,
  kPaint = 4,
  kMove = 5,
  kMultiDrop = 6,
};

enum class InputKind : std::uint8_t {
  kPointerMove = 0,
  kPointerDown = 1,
  kPointerUp = 2,
  kClick = 3,
  kPointerLeave = 4,
  kCancel = 5,
  kKey = 6,
};

enum class PointerButton : std::uint8_t {
  kNone = 0,
  kLeft = 1,
  kMiddle = 2,
  kRight = 3,
};

enum class Key : std::uint8_t {
  kNone = 0,
  kDelete = 1,
  kZ = 2,
  kY = 3,
  kEscape = 4,
};

struct InputModifiers {
  bool shift = false;
  bool ctrl = false;
  bool alt = false;
};

// Produced by the pointer/input adapter; the core never reads a display surface.
struct InputEvent {
  InputKind kind = InputKind::kPointerMove;
  ScreenPoint pointer{};
  PointerButton button = PointerButton::kLeft;
  InputModifiers modifiers{};
  std::int64_t timestamp_ms = 0;
  Key key = Key::kNone;
};

struct ViewContext {
  Camera camera{};
  Viewport viewport{};
};

struct ToolSettings {
  ToolKind tool = ToolKind::kPlace;
  PontoonType type = PontoonType::kSingle;
  PontoonColor color = PontoonColor::kBlue;
  Rotation rotation = Rotation::kNorth;
  int active_level = 0;
};

enum class MoveToolState : std::uint8_t {
  kIdle = 0,
  kSelected = 1,
};

struct PlacementPreview {
  GridPosition cell{};
  std::vector<GridPosition> footprint{};
  bool valid = false;
  std::vector<ValidationIssue> issues{};
};

// Transient state handed to the rendering collaborator with the grid.
struct PipelineOverlay {
  int active_level = 0;
  std::optional<PlacementPreview> hover{};
  bool multi_drop_active = false;
  std::optional<GridPosition> multi_drop_anchor{};
  std::vector<GridPosition> multi_drop_cells{};
  std::vector<ObjectId> selection{};
  MoveToolState move_state = MoveToolState::kIdle;
  ObjectId move_source_id = kInvalidObjectId;
};

enum class PipelineOutcome : std::uint8_t {
  kIgnored = 0,
  kPreviewUpdated = 1,
  kStateChanged = 2,
  kCommitted = 3,
  kRejected = 4,
  kDropped = 5,
};

[[nodiscard]] std::string_view to_string(PipelineOutcome outcome);

struct PipelineResult {
  PipelineOutcome outcome = PipelineOutcome::kIgnored;
  bool ok = false;
  std::optional<GridPosition> cell{};
  std::vector<std::string> errors{};
  std::vector<ValidationIssue> issues{};
  std::vector<Operation> operations{};

  [[nodiscard]] std::optional<ValidationCode> first_code() const;
};

struct PipelineStats {
  std::size_t processed = 0;
  std::size_t committed = 0;
  std::size_t rejected = 0;
  std::size_t dropped = 0;
  std::size_t ignored = 0;
  std::size_t index_rebuilds = 0;
};

struct PipelineOptions {
  OperationOptions operation_options{};
  bool verify_index_after_commit = true;
};

// Single-flight state machine: one input becomes one validated mutation, one
// reported failure, or a preview/state update. Owns the current Grid and is
// the only writer of the SpatialIndex. An input that arrives while another is
// being processed is dropped with PIPELINE_BUSY.
class OperationPipeline {
 public:
  using GridTransform = std::function<EditResult<Grid>(const Grid&, const SpatialIndex&)>;
  using CommitListener = std::function<void(const Grid&, const std::vector<Operation>&)>;
  using Clock = std::function<std::int64_t()>;

  OperationPipeline(Grid initial, HistoryLedger& history, CoordinateCalculator& calculator, EventLog& events,
                    const PipelineOptions& options = {});

  PipelineResult ProcessInput(const InputEvent& event, const ViewContext& view, const ToolSettings& tool);

  // Runs a transform through the same commit path as tool input. A result
  // whose grid fails Grid::Validate() is rejected instead of committed.
  EditResult<Grid> Execute(std::string_view description, const GridTransform& transform,
                           std::int64_t timestamp_ms = 0);

  EditResult<Grid> Undo();
  EditResult<Grid> Redo();
  EditResult<HistoryEntryId> CreateCheckpoint(std::string label);
  EditResult<Grid> RollbackToCheckpoint(HistoryEntryId checkpoint_id);
  // Replaces the grid wholesale and clears history (load / new layout).
  EditResult<Grid> ReplaceGrid(const Grid& grid, std::string_view reason);

  void CancelInteraction();
  void ClearSelection() { selection_.clear(); }

  [[nodiscard]] const Grid& grid() const { return grid_; }
  [[nodiscard]] const SpatialIndex& index() const { return index_; }
  [[nodiscard]] bool busy() const { return busy_; }
  [[nodiscard]] MoveToolState move_state() const { return move_state_; }
  [[nodiscard]] ObjectId move_source_id() const { return move_source_id_; }
  [[nodiscard]] const std::vector<ObjectId>& selection() const { return selection_; }
  [[nodiscard]] bool multi_drop_active() const { return multi_drop_anchor_.has_value(); }
  [[nodiscard]] PipelineOverlay overlay() const;
  [[nodiscard]] const PipelineStats& stats() const { return stats_; }
  [[nodiscard]] const PipelineOptions& options() const { return options_; }

  void set_options(const PipelineOptions& options) { options_ = options; }
  void set_commit_listener(CommitListener listener) { commit_listener_ = std::move(listener); }
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  // Rectangle cells for a multi-drop gesture on one level. DOUBLE keeps every
  // second column counted from the rectangle's own minimum x.
  [[nodiscard]] static std::vector<GridPosition> MultiDropCells(const GridPosition& anchor,
                                                                const GridPosition& current, int level,
                                                                PontoonType type);

 private:
  class BusyScope {
   public:
    explicit BusyScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~BusyScope() { flag_ = false; }
    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

   private:
    bool& flag_;
  };

  PipelineResult dispatch(const InputEvent& event, const ViewContext& view, const ToolSettings& tool);
  PipelineResult handle_pointer_move(const std::optional<GridPosition>& cell, const ToolSettings& tool);
  PipelineResult handle_click(const std::optional<GridPosition>& cell, const InputEvent& event,
                              const ToolSettings& tool);
  PipelineResult handle_pointer_down(const std::optional<GridPosition>& cell, const ToolSettings& tool);
  PipelineResult handle_pointer_up(const std::optional<GridPosition>& cell, const ToolSettings& tool);
  PipelineResult handle_key(const InputEvent& event, const std::optional<GridPosition>& cell);
  PipelineResult handle_select(const std::optional<GridPosition>& cell, const InputEvent& event);
  PipelineResult handle_move_tool(const std::optional<GridPosition>& cell);

  PipelineResult run_transform(std::optional<GridPosition> cell, const GridTransform& transform);
  EditResult<Grid> commit(EditResult<Grid> result, std::string_view description, std::int64_t timestamp_ms);
  EditResult<Grid> restore(std::optional<Grid> restored, EditorEventKind kind, const std::string& label);
  EditResult<Grid> busy_grid_result(std::string_view what);
  void note_dropped(std::string message);
  void sync_index(const Grid& before, const ChangeSet& change_set);
  void replace_state(const Grid& grid);
  [[nodiscard]] std::optional<GridPosition> resolve_cell(const InputEvent& event, const ViewContext& view,
                                                         const ToolSettings& tool);
  [[nodiscard]] PlacementPreview make_preview(const GridPosition& cell, const ToolSettings& tool) const;
  [[nodiscard]] std::int64_t now_ms() const;
  [[nodiscard]] PipelineResult reject(std::optional<GridPosition> cell, ValidationCode code, std::string message);
  void prune_selection();

  Grid grid_{};
  SpatialIndex index_{};
  HistoryLedger& history_;
  CoordinateCalculator& calculator_;
  EventLog& events_;
  PipelineOptions options_{};
  bool busy_ = false;
  std::int64_t current_timestamp_ms_ = 0;
  std::uint64_t next_operation_sequence_ = 1;

  // Tool interaction state.
  MoveToolState move_state_ = MoveToolState::kIdle;
  ObjectId move_source_id_ = kInvalidObjectId;
  std::optional<GridPosition> multi_drop_anchor_{};
  std::optional<GridPosition> multi_drop_current_{};
  int multi_drop_level_ = 0;
  PontoonType multi_drop_type_ = PontoonType::kSingle;
  std::optional<PlacementPreview> hover_{};
  int active_level_ = 0;
  std::vector<ObjectId> selection_{};

  PipelineStats stats_{};
  CommitListener commit_listener_{};
  Clock clock_{};
};

}  // namespace pontoon::core
