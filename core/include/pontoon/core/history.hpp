#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pontoon/core/grid.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/result.hpp"

namespace pontoon::core {

using HistoryEntryId = std::uint64_t;
constexpr HistoryEntryId kInvalidHistoryEntryId = 0;
constexpr std::size_t kDefaultHistoryMaxEntries = 50;

struct HistoryEntry {
  HistoryEntryId id = kInvalidHistoryEntryId;
  std::int64_t timestamp_ms = 0;
  std::string description{};
  Grid before{};
  Grid after{};
  std::vector<Operation> operations{};
  bool is_checkpoint = false;
};

struct HistoryStats {
  std::size_t entry_count = 0;
  std::size_t applied_count = 0;
  std::size_t checkpoint_count = 0;
  std::size_t evicted_total = 0;
  std::size_t max_entries = 0;
  bool can_undo = false;
  bool can_redo = false;
};

// Linear undo/redo over whole-grid snapshots. applied_count() entries are in
// effect; entries past it form the redo branch, dropped on the next append.
// Checkpoints are zero-delta markers that undo/redo step over.
class HistoryLedger {
 public:
  explicit HistoryLedger(std::size_t max_entries = kDefaultHistoryMaxEntries);

  HistoryEntryId Append(const Grid& before, const Grid& after, std::vector<Operation> operations,
                        std::string description, std::int64_t timestamp_ms = 0);
  HistoryEntryId CreateCheckpoint(const Grid& grid, std::string label, std::int64_t timestamp_ms = 0);

  // Grid to restore, or nullopt at the respective end (no state change).
  std::optional<Grid> Undo();
  std::optional<Grid> Redo();
  // Restores the checkpoint's grid and moves the cursor just past it.
  std::optional<Grid> RollbackToCheckpoint(HistoryEntryId checkpoint_id);
  // applied_count in [0, size()]; returns the grid in effect at that point.
  std::optional<Grid> JumpTo(std::size_t applied_count);

  void Clear();
  void SetMaxEntries(std::size_t max_entries);

  [[nodiscard]] bool can_undo() const;
  [[nodiscard]] bool can_redo() const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t applied_count() const { return applied_count_; }
  [[nodiscard]] std::size_t max_entries() const { return max_entries_; }
  [[nodiscard]] const std::vector<HistoryEntry>& entries() const { return entries_; }
  [[nodiscard]] const HistoryEntry* find(HistoryEntryId id) const;
  [[nodiscard]] std::vector<const HistoryEntry*> EntriesAffecting(ObjectId pontoon_id) const;
  [[nodiscard]] std::vector<const HistoryEntry*> Checkpoints() const;
  // Entries holding at least one operation of the given kind.
  [[nodiscard]] std::vector<const HistoryEntry*> EntriesOfKind(OperationKind kind) const;
  // Case-insensitive substring match on the description.
  [[nodiscard]] std::vector<const HistoryEntry*> SearchEntries(std::string_view query) const;
  // The last count entries, oldest first.
  [[nodiscard]] std::vector<const HistoryEntry*> RecentEntries(std::size_t count) const;
  [[nodiscard]] HistoryStats Stats() const;

 private:
  HistoryEntryId push_entry(HistoryEntry entry);
  void evict_overflow();

  std::vector<HistoryEntry> entries_{};
  std::size_t applied_count_ = 0;
  std::size_t max_entries_ = kDefaultHistoryMaxEntries;
  std::size_t evicted_total_ = 0;
  HistoryEntryId next_entry_id_ = 1;
};

}  // namespace pontoon::core
