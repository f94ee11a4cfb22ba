#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pontoon/core/coordinate_calculator.hpp"
#include "pontoon/core/entities.hpp"
#include "pontoon/core/event_log.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/history.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/operations.hpp"
#include "pontoon/core/pipeline.hpp"
#include "pontoon/core/placement_validator.hpp"
#include "pontoon/core/portable.hpp"
#include "pontoon/core/result.hpp"
#include "pontoon/core/spatial_index.hpp"

namespace pontoon::core {

struct EditorSettings {
  // World scale used for every screen/world/cell conversion.
  double cell_size_m = 0.5;
  double level_height_m = 0.4;
  std::size_t history_max_entries = kDefaultHistoryMaxEntries;
  std::size_t coordinate_cache_capacity = 1024;
  int nearby_search_distance = 5;
  bool enforce_connectivity = false;
  bool verify_index_after_commit = true;
  std::size_t event_log_capacity = 256;
};

constexpr GridDimensions kDefaultGridDimensions{50, 50, 3, 0};

// Problems with a settings value, empty when it is usable.
[[nodiscard]] ValidationResult ValidateSettings(const EditorSettings& settings);

// Editor session: one grid, its index, history and event log behind the
// request/result calls a UI makes. Every mutation goes through the operation
// pipeline, so programmatic edits and tool input share one commit path.
class Configurator {
 public:
  explicit Configurator(const GridDimensions& dimensions = kDefaultGridDimensions,
                        const EditorSettings& settings = {});

  Configurator(const Configurator&) = delete;
  Configurator& operator=(const Configurator&) = delete;

  EditResult<Grid> PlacePontoon(const GridPosition& position, PontoonType type,
                                PontoonColor color = PontoonColor::kBlue, Rotation rotation = Rotation::kNorth);
  EditResult<Grid> RemovePontoon(ObjectId id);
  EditResult<Grid> RemovePontoonAt(const GridPosition& position);
  EditResult<Grid> MovePontoon(ObjectId id, const GridPosition& new_position);
  // Advances to the next orientation.
  EditResult<Grid> RotatePontoon(ObjectId id);
  EditResult<Grid> RotatePontoon(ObjectId id, Rotation rotation);
  EditResult<Grid> RecolorPontoon(ObjectId id, PontoonColor color);
  EditResult<BatchOutcome> PlacePontoonsBatch(const std::vector<GridPosition>& positions, PontoonType type,
                                              PontoonColor color = PontoonColor::kBlue,
                                              Rotation rotation = Rotation::kNorth, bool skip_invalid = true);
  EditResult<BatchOutcome> RemovePontoonsBatch(const std::vector<ObjectId>& ids, bool skip_invalid = true);

  PipelineResult ProcessInput(const InputEvent& event, const ViewContext& view, const ToolSettings& tool);

  bool Undo();
  bool Redo();
  EditResult<HistoryEntryId> CreateCheckpoint(std::string label);
  EditResult<Grid> RollbackToCheckpoint(HistoryEntryId checkpoint_id);

  EditResult<bool> UpdateSettings(const EditorSettings& settings);
  EditResult<Grid> NewGrid(const GridDimensions& dimensions);
  EditResult<Grid> LoadPortable(const PortableGrid& portable);
  [[nodiscard]] PortableGrid ToPortable() const;

  [[nodiscard]] const Grid& grid() const { return pipeline_.grid(); }
  [[nodiscard]] const SpatialIndex& index() const { return pipeline_.index(); }
  [[nodiscard]] std::optional<Pontoon> PontoonAt(const GridPosition& position) const;
  [[nodiscard]] std::vector<Pontoon> PontoonsAtLevel(int level) const;
  [[nodiscard]] GridStatistics Statistics() const { return grid().Statistics(); }
  [[nodiscard]] ValidationResult ValidateConnectivity() const;
  [[nodiscard]] ValidationResult CanPlace(const GridPosition& position, PontoonType type) const;
  [[nodiscard]] ValidationResult CanMove(ObjectId id, const GridPosition& new_position) const;
  [[nodiscard]] std::vector<GridPosition> FindNearbyValidPositions(const GridPosition& target, PontoonType type) const;
  [[nodiscard]] std::vector<GridPosition> FindNearbyValidPositions(const GridPosition& target, PontoonType type,
                                                                   int max_distance) const;

  [[nodiscard]] PipelineOverlay overlay() const { return pipeline_.overlay(); }
  [[nodiscard]] const EditorSettings& settings() const { return settings_; }
  [[nodiscard]] const HistoryLedger& history() const { return history_; }
  [[nodiscard]] const EventLog& event_log() const { return events_; }
  [[nodiscard]] CoordinateCalculator& coordinates() { return calculator_; }
  [[nodiscard]] const CoordinateCalculator& coordinates() const { return calculator_; }
  [[nodiscard]] OperationPipeline& pipeline() { return pipeline_; }
  [[nodiscard]] const OperationPipeline& pipeline() const { return pipeline_; }

 private:
  [[nodiscard]] OperationOptions operation_options() const;
  [[nodiscard]] static PipelineOptions pipeline_options(const EditorSettings& settings);
  [[nodiscard]] static CoordinateSettings coordinate_settings(const EditorSettings& settings);

  EditorSettings settings_{};
  HistoryLedger history_;
  CoordinateCalculator calculator_;
  EventLog events_;
  OperationPipeline pipeline_;
};

}  // namespace pontoon::core
