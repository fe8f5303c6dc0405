// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// managed_map.ipp - Implementation details for managed_map
// This file is included at the end of managed_map.hpp
// DO NOT include this file directly

namespace kressler::managed_containers {

// Every operation visits the active alternative. Branches on is_bounded_v are
// resolved at compile time, so the heap branch is only instantiated for
// HeapMap.

// ============================================================================
// Lookup
// ============================================================================

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
Value* managed_map<Key, Value, Compare, HeapMap, SearchModeT>::lookup(
    const K& key) {
  return std::visit(
      [&key](auto& map) -> Value* {
        if constexpr (is_bounded_v<decltype(map)>) {
          return map.get(key);
        } else {
          const auto it = map.find(key);
          return it == map.end() ? nullptr : &it->second;
        }
      },
      storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
const Value* managed_map<Key, Value, Compare, HeapMap, SearchModeT>::lookup(
    const K& key) const {
  return std::visit(
      [&key](const auto& map) -> const Value* {
        if constexpr (is_bounded_v<decltype(map)>) {
          return map.get(key);
        } else {
          const auto it = map.find(key);
          return it == map.end() ? nullptr : &it->second;
        }
      },
      storage_);
}

// ============================================================================
// Insert and Remove Operations
// ============================================================================

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
insert_result<Key, Value>
managed_map<Key, Value, Compare, HeapMap, SearchModeT>::insert(Key key,
                                                               Value value) {
  return std::visit(
      [&key, &value](auto& map) -> insert_result<Key, Value> {
        if constexpr (is_bounded_v<decltype(map)>) {
          return map.insert(std::move(key), std::move(value));
        } else {
          // Heap maps grow, so this never fails
          const auto it = map.find(key);
          if (it != map.end()) {
            Value previous = std::exchange(it->second, std::move(value));
            return std::optional<Value>(std::move(previous));
          }
          map.emplace(std::move(key), std::move(value));
          return std::optional<Value>{};
        }
      },
      storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
std::optional<Value>
managed_map<Key, Value, Compare, HeapMap, SearchModeT>::take(const K& key) {
  return std::visit(
      [&key](auto& map) -> std::optional<Value> {
        if constexpr (is_bounded_v<decltype(map)>) {
          return map.remove(key);
        } else {
          const auto it = map.find(key);
          if (it == map.end()) {
            return std::nullopt;
          }
          std::optional<Value> removed(std::move(it->second));
          map.erase(it);
          return removed;
        }
      },
      storage_);
}

// ============================================================================
// Capacity and Traversal
// ============================================================================

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
void managed_map<Key, Value, Compare, HeapMap, SearchModeT>::clear() {
  std::visit([](auto& map) { map.clear(); }, storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
typename managed_map<Key, Value, Compare, HeapMap, SearchModeT>::size_type
managed_map<Key, Value, Compare, HeapMap, SearchModeT>::size() const {
  return std::visit(
      [](const auto& map) -> size_type { return map.size(); }, storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
bool managed_map<Key, Value, Compare, HeapMap, SearchModeT>::empty() const {
  return std::visit([](const auto& map) -> bool { return map.empty(); },
                    storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
std::optional<
    typename managed_map<Key, Value, Compare, HeapMap, SearchModeT>::size_type>
managed_map<Key, Value, Compare, HeapMap, SearchModeT>::capacity() const {
  return std::visit(
      [](const auto& map) -> std::optional<size_type> {
        if constexpr (is_bounded_v<decltype(map)>) {
          return map.capacity();
        } else {
          return std::nullopt;
        }
      },
      storage_);
}

template <typename Key, typename Value, typename Compare, typename HeapMap,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
template <typename F>
void managed_map<Key, Value, Compare, HeapMap, SearchModeT>::for_each(
    F&& f) const {
  std::visit(
      [&f](const auto& map) {
        if constexpr (is_bounded_v<decltype(map)>) {
          for (const slot_type& slot : map.entries()) {
            f(slot->first, slot->second);
          }
        } else {
          for (const auto& [key, value] : map) {
            f(key, value);
          }
        }
      },
      storage_);
}

}  // namespace kressler::managed_containers
