// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// slot_map.ipp - Implementation details for slot_map
// This file is included at the end of slot_map.hpp
// DO NOT include this file directly

namespace kressler::managed_containers {

// ============================================================================
// Constructors and Assignment Operators
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
slot_map<Key, Value, Compare, SearchModeT>::slot_map(
    std::span<slot_type> slots)
    : slots_(slots) {
  assert(well_formed() &&
         "Slot region must hold ascending unique keys before empty slots");
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
slot_map<Key, Value, Compare, SearchModeT>::slot_map(slot_map&& other) noexcept
    : slots_(std::exchange(other.slots_, std::span<slot_type>{})),
      less_(std::move(other.less_)) {}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
slot_map<Key, Value, Compare, SearchModeT>&
slot_map<Key, Value, Compare, SearchModeT>::operator=(
    slot_map&& other) noexcept {
  if (this != &other) {
    slots_ = std::exchange(other.slots_, std::span<slot_type>{});
    less_ = std::move(other.less_);
  }
  return *this;
}

// ============================================================================
// Lookup
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
Value* slot_map<Key, Value, Compare, SearchModeT>::lookup(const K& key) {
  const slot_position pos = find_position(key);
  if (!pos.found) {
    return nullptr;
  }
  return &slots_[pos.index]->second;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
const Value* slot_map<Key, Value, Compare, SearchModeT>::lookup(
    const K& key) const {
  const slot_position pos = find_position(key);
  if (!pos.found) {
    return nullptr;
  }
  return &slots_[pos.index]->second;
}

// ============================================================================
// Insert and Remove Operations
// ============================================================================

/**
 * Insert or replace.
 *
 * For a new key at insertion index i, the sub-span [i, e] where e is the
 * first empty slot is rotated right by one. That moves the empty slot to i
 * and every entry in [i, e) one slot back, keeping their relative order.
 */
template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
insert_result<Key, Value> slot_map<Key, Value, Compare, SearchModeT>::insert(
    Key key, Value value) {
  const slot_position pos = find_position(key);

  // Existing key: swap in the new value, keep the stored key
  if (pos.found) {
    Value previous =
        std::exchange(slots_[pos.index]->second, std::move(value));
    return std::optional<Value>(std::move(previous));
  }

  if (full()) {
    return std::unexpected(
        capacity_exhausted<Key, Value>{std::move(key), std::move(value)});
  }

  const size_type empty_idx =
      first_empty_slot<SearchModeT, Key, Value>(const_slots());
  assert(empty_idx < slots_.size() && "Non-full region has no empty slot");
  assert(pos.index <= empty_idx && "Insert position past the occupied run");

  rotate_right(slots_.subspan(pos.index, empty_idx - pos.index + 1), 1);

  assert(!slots_[pos.index].has_value() &&
         "Insert target slot is occupied after rotation");
  slots_[pos.index].emplace(std::move(key), std::move(value));

  return std::optional<Value>{};
}

/**
 * Remove by key.
 *
 * The removed slot is emptied and then rotated to the end of the occupied
 * run, i.e. [i, e) is rotated left by one where e is the first empty slot.
 */
template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires LookupKey<K, Key, Compare>
std::optional<Value> slot_map<Key, Value, Compare, SearchModeT>::take(
    const K& key) {
  const slot_position pos = find_position(key);
  if (!pos.found) {
    return std::nullopt;
  }

  const size_type end_idx =
      first_empty_slot<SearchModeT, Key, Value>(const_slots());

  slot_type& slot = slots_[pos.index];
  assert(slot.has_value() && "Remove target slot is unexpectedly empty");
  std::optional<Value> removed(std::move(slot->second));
  slot.reset();

  rotate_left(slots_.subspan(pos.index, end_idx - pos.index), 1);

  return removed;
}

// ============================================================================
// Capacity and Inspection
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
void slot_map<Key, Value, Compare, SearchModeT>::clear() {
  for (slot_type& slot : slots_) {
    slot.reset();
  }
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
typename slot_map<Key, Value, Compare, SearchModeT>::size_type
slot_map<Key, Value, Compare, SearchModeT>::size() const {
  return static_cast<size_type>(
      std::count_if(slots_.begin(), slots_.end(),
                    [](const slot_type& slot) { return slot.has_value(); }));
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
bool slot_map<Key, Value, Compare, SearchModeT>::empty() const {
  return std::none_of(slots_.begin(), slots_.end(),
                      [](const slot_type& slot) { return slot.has_value(); });
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
std::span<const typename slot_map<Key, Value, Compare, SearchModeT>::slot_type>
slot_map<Key, Value, Compare, SearchModeT>::entries() const {
  return const_slots().first(
      first_empty_slot<SearchModeT, Key, Value>(const_slots()));
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT>
  requires ComparatorCompatible<Key, Compare>
bool slot_map<Key, Value, Compare, SearchModeT>::well_formed() const {
  for (size_type i = 1; i < slots_.size(); ++i) {
    const slot_type& prev = slots_[i - 1];
    const slot_type& cur = slots_[i];
    if (!cur.has_value()) {
      continue;
    }
    // Occupied after empty, or not strictly ascending (covers duplicates)
    if (!prev.has_value() || !less_.comp(prev->first, cur->first)) {
      return false;
    }
  }
  return true;
}

}  // namespace kressler::managed_containers
