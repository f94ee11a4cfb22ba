#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "pontoon/core/id.hpp"

namespace pontoon::core {

enum class EditorEventKind : std::uint8_t {
  kCommitted = 0,
  kRejected = 1,
  kInputDropped = 2,
  kIndexRebuilt = 3,
  kHistoryUndo = 4,
  kHistoryRedo = 5,
  kCheckpointCreated = 6,
  kCheckpointRollback = 7,
  kGridLoaded = 8,
  kSettingsChanged = 9,
};

[[nodiscard]] std::string_view to_string(EditorEventKind kind);

struct EditorEvent {
  std::uint64_t sequence = 0;
  EditorEventKind kind = EditorEventKind::kCommitted;
  std::int64_t timestamp_ms = 0;
  std::string message{};
  std::vector<ObjectId> ids{};
};

// Bounded session record of what the editor did. Oldest events are dropped
// first. Each event is mirrored to the "pontoon" logger.
class EventLog {
 public:
  explicit EventLog(std::size_t capacity = 256);

  const EditorEvent& Record(EditorEventKind kind, std::string message, std::vector<ObjectId> ids = {},
                            std::int64_t timestamp_ms = 0);

  void Clear();
  void SetCapacity(std::size_t capacity);

  [[nodiscard]] const std::deque<EditorEvent>& events() const { return events_; }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t size() const { return events_.size(); }
  [[nodiscard]] std::uint64_t total_recorded() const { return next_sequence_ - 1; }
  [[nodiscard]] std::size_t count_of(EditorEventKind kind) const;
  [[nodiscard]] const EditorEvent* last() const { return events_.empty() ? nullptr : &events_.back(); }

 private:
  void trim();

  std::deque<EditorEvent> events_{};
  std::size_t capacity_ = 256;
  std::uint64_t next_sequence_ = 1;
};

}  // namespace pontoon::core
