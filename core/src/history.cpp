#include "pontoon/core/history.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

#include "pontoon/core/log.hpp"

namespace pontoon::core {

namespace {

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

HistoryLedger::HistoryLedger(std::size_t max_entries) : max_entries_(std::max<std::size_t>(1, max_entries)) {}

HistoryEntryId HistoryLedger::Append(const Grid& before, const Grid& after, std::vector<Operation> operations,
                                     std::string description, std::int64_t timestamp_ms) {
  HistoryEntry entry;
  entry.timestamp_ms = timestamp_ms;
  entry.description = std::move(description);
  entry.before = before;
  entry.after = after;
  entry.operations = std::move(operations);
  return push_entry(std::move(entry));
}

HistoryEntryId HistoryLedger::CreateCheckpoint(const Grid& grid, std::string label, std::int64_t timestamp_ms) {
  HistoryEntry entry;
  entry.timestamp_ms = timestamp_ms;
  entry.description = std::move(label);
  entry.before = grid;
  entry.after = grid;
  entry.is_checkpoint = true;

  Operation marker;
  marker.kind = OperationKind::kCheckpoint;
  marker.timestamp_ms = timestamp_ms;
  marker.description = entry.description;
  entry.operations.push_back(std::move(marker));

  const HistoryEntryId id = push_entry(std::move(entry));
  logger()->info("checkpoint #{} '{}' created", id, entries_.back().description);
  return id;
}

std::optional<Grid> HistoryLedger::Undo() {
  std::size_t cursor = applied_count_;
  while (cursor > 0 && entries_[cursor - 1].is_checkpoint) {
    --cursor;
  }
  if (cursor == 0) {
    return std::nullopt;
  }
  --cursor;
  applied_count_ = cursor;
  return entries_[cursor].before;
}

std::optional<Grid> HistoryLedger::Redo() {
  std::size_t cursor = applied_count_;
  while (cursor < entries_.size() && entries_[cursor].is_checkpoint) {
    ++cursor;
  }
  if (cursor >= entries_.size()) {
    return std::nullopt;
  }
  applied_count_ = cursor + 1;
  return entries_[cursor].after;
}

std::optional<Grid> HistoryLedger::RollbackToCheckpoint(HistoryEntryId checkpoint_id) {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].id != checkpoint_id) {
      continue;
    }
    if (!entries_[i].is_checkpoint) {
      return std::nullopt;
    }
    applied_count_ = i + 1;
    logger()->info("rolled back to checkpoint #{} '{}'", checkpoint_id, entries_[i].description);
    return entries_[i].after;
  }
  logger()->debug("checkpoint #{} is not in history", checkpoint_id);
  return std::nullopt;
}

std::optional<Grid> HistoryLedger::JumpTo(std::size_t applied_count) {
  if (entries_.empty() || applied_count > entries_.size()) {
    return std::nullopt;
  }
  applied_count_ = applied_count;
  if (applied_count == 0) {
    return entries_.front().before;
  }
  return entries_[applied_count - 1].after;
}

void HistoryLedger::Clear() {
  entries_.clear();
  applied_count_ = 0;
}

void HistoryLedger::SetMaxEntries(std::size_t max_entries) {
  max_entries_ = std::max<std::size_t>(1, max_entries);
  evict_overflow();
}

bool HistoryLedger::can_undo() const {
  for (std::size_t i = applied_count_; i > 0; --i) {
    if (!entries_[i - 1].is_checkpoint) {
      return true;
    }
  }
  return false;
}

bool HistoryLedger::can_redo() const {
  for (std::size_t i = applied_count_; i < entries_.size(); ++i) {
    if (!entries_[i].is_checkpoint) {
      return true;
    }
  }
  return false;
}

const HistoryEntry* HistoryLedger::find(HistoryEntryId id) const {
  for (const HistoryEntry& entry : entries_) {
    if (entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<const HistoryEntry*> HistoryLedger::EntriesAffecting(ObjectId pontoon_id) const {
  std::vector<const HistoryEntry*> out;
  for (const HistoryEntry& entry : entries_) {
    const bool touches = std::any_of(entry.operations.begin(), entry.operations.end(), [pontoon_id](const Operation& op) {
      return std::find(op.affected_ids.begin(), op.affected_ids.end(), pontoon_id) != op.affected_ids.end();
    });
    if (touches) {
      out.push_back(&entry);
    }
  }
  return out;
}

std::vector<const HistoryEntry*> HistoryLedger::Checkpoints() const {
  std::vector<const HistoryEntry*> out;
  for (const HistoryEntry& entry : entries_) {
    if (entry.is_checkpoint) {
      out.push_back(&entry);
    }
  }
  return out;
}

std::vector<const HistoryEntry*> HistoryLedger::EntriesOfKind(OperationKind kind) const {
  std::vector<const HistoryEntry*> out;
  for (const HistoryEntry& entry : entries_) {
    const bool matches = std::any_of(entry.operations.begin(), entry.operations.end(),
                                     [kind](const Operation& op) { return op.kind == kind; });
    if (matches || (kind == OperationKind::kCheckpoint && entry.is_checkpoint)) {
      out.push_back(&entry);
    }
  }
  return out;
}

std::vector<const HistoryEntry*> HistoryLedger::SearchEntries(std::string_view query) const {
  std::vector<const HistoryEntry*> out;
  const std::string needle = lowercase(query);
  for (const HistoryEntry& entry : entries_) {
    if (lowercase(entry.description).find(needle) != std::string::npos) {
      out.push_back(&entry);
    }
  }
  return out;
}

std::vector<const HistoryEntry*> HistoryLedger::RecentEntries(std::size_t count) const {
  std::vector<const HistoryEntry*> out;
  const std::size_t first = entries_.size() > count ? entries_.size() - count : 0;
  for (std::size_t i = first; i < entries_.size(); ++i) {
    out.push_back(&entries_[i]);
  }
  return out;
}

HistoryStats HistoryLedger::Stats() const {
  HistoryStats stats;
  stats.entry_count = entries_.size();
  stats.applied_count = applied_count_;
  stats.checkpoint_count = Checkpoints().size();
  stats.evicted_total = evicted_total_;
  stats.max_entries = max_entries_;
  stats.can_undo = can_undo();
  stats.can_redo = can_redo();
  return stats;
}

HistoryEntryId HistoryLedger::push_entry(HistoryEntry entry) {
  if (applied_count_ < entries_.size()) {
    logger()->debug("dropping {} redo entries", entries_.size() - applied_count_);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(applied_count_), entries_.end());
  }
  entry.id = next_entry_id_++;
  const HistoryEntryId id = entry.id;
  entries_.push_back(std::move(entry));
  applied_count_ = entries_.size();
  evict_overflow();
  return id;
}

void HistoryLedger::evict_overflow() {
  if (entries_.size() <= max_entries_) {
    return;
  }
  const std::size_t excess = entries_.size() - max_entries_;
  entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(excess));
  applied_count_ = (applied_count_ > excess) ? applied_count_ - excess : 0;
  evicted_total_ += excess;
  logger()->debug("evicted {} oldest history entries", excess);
}

} // namespace pontoon::core
