#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

#include "pontoon/core/id.hpp"

namespace pontoon::core {

template <typename T>
concept HasObjectId = requires(T value) {
  { value.id } -> std::convertible_to<ObjectId>;
};

// Entity table kept sorted by id. Lookups are binary searches and iteration
// order is ascending id, so two stores with the same entities compare equal
// element by element. Copies are cheap enough for whole-grid snapshots.
template <HasObjectId T>
class ObjectStore {
 public:
  ObjectStore() = default;

  [[nodiscard]] std::size_t size() const { return items_.size(); }
  [[nodiscard]] bool empty() const { return items_.empty(); }
  [[nodiscard]] bool contains(ObjectId id) const { return find(id) != nullptr; }

  [[nodiscard]] const T* find(ObjectId id) const {
    const auto it = lower_bound(id);
    if (it == items_.end() || it->id != id) {
      return nullptr;
    }
    return &*it;
  }

  // Inserts or overwrites. Returns true when the id was new.
  bool upsert(T value) {
    auto it = lower_bound(value.id);
    if (it != items_.end() && it->id == value.id) {
      *it = std::move(value);
      return false;
    }
    items_.insert(it, std::move(value));
    return true;
  }

  bool remove(ObjectId id) {
    const auto it = lower_bound(id);
    if (it == items_.end() || it->id != id) {
      return false;
    }
    items_.erase(it);
    return true;
  }

  void clear() { items_.clear(); }

  [[nodiscard]] std::vector<ObjectId> sorted_ids() const {
    std::vector<ObjectId> ids;
    ids.reserve(items_.size());
    for (const T& item : items_) {
      ids.push_back(item.id);
    }
    return ids;
  }

  [[nodiscard]] bool same_contents(const ObjectStore& other) const { return items_ == other.items_; }

  // Ascending id order.
  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  [[nodiscard]] typename std::vector<T>::const_iterator lower_bound(ObjectId id) const {
    return std::lower_bound(items_.begin(), items_.end(), id,
                            [](const T& item, ObjectId key) { return item.id < key; });
  }

  [[nodiscard]] typename std::vector<T>::iterator lower_bound(ObjectId id) {
    return std::lower_bound(items_.begin(), items_.end(), id,
                            [](const T& item, ObjectId key) { return item.id < key; });
  }

  std::vector<T> items_;
};

}  // namespace pontoon::core
