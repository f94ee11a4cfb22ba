#include "pontoon/core/event_log.hpp"

#include <algorithm>
#include <utility>

#include "pontoon/core/log.hpp"

namespace pontoon::core {

std::string_view to_string(EditorEventKind kind) {
  switch (kind) {
  case EditorEventKind::kCommitted:
    return "committed";
  case EditorEventKind::kRejected:
    return "rejected";
  case EditorEventKind::kInputDropped:
    return "input_dropped";
  case EditorEventKind::kIndexRebuilt:
    return "index_rebuilt";
  case EditorEventKind::kHistoryUndo:
    return "undo";
  case EditorEventKind::kHistoryRedo:
    return "redo";
  case EditorEventKind::kCheckpointCreated:
    return "checkpoint_created";
  case EditorEventKind::kCheckpointRollback:
    return "checkpoint_rollback";
  case EditorEventKind::kGridLoaded:
    return "grid_loaded";
  case EditorEventKind::kSettingsChanged:
    return "settings_changed";
  default:
    return "unknown";
  }
}

EventLog::EventLog(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

const EditorEvent& EventLog::Record(EditorEventKind kind, std::string message, std::vector<ObjectId> ids,
                                    std::int64_t timestamp_ms) {
  EditorEvent event;
  event.sequence = next_sequence_++;
  event.kind = kind;
  event.timestamp_ms = timestamp_ms;
  event.message = std::move(message);
  event.ids = std::move(ids);

  switch (kind) {
  case EditorEventKind::kInputDropped:
  case EditorEventKind::kIndexRebuilt:
    logger()->warn("[{}] {}", to_string(kind), event.message);
    break;
  case EditorEventKind::kRejected:
    logger()->debug("[{}] {}", to_string(kind), event.message);
    break;
  default:
    logger()->info("[{}] {}", to_string(kind), event.message);
    break;
  }

  events_.push_back(std::move(event));
  trim();
  return events_.back();
}

void EventLog::Clear() { events_.clear(); }

void EventLog::SetCapacity(std::size_t capacity) {
  capacity_ = std::max<std::size_t>(1, capacity);
  trim();
}

std::size_t EventLog::count_of(EditorEventKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(events_.begin(), events_.end(), [kind](const EditorEvent& event) { return event.kind == kind; }));
}

void EventLog::trim() {
  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

} // namespace pontoon::core
