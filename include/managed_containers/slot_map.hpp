// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <utility>

#include "slot_rotate.hpp"
#include "slot_search.hpp"

namespace kressler::managed_containers {

/**
 * Error returned by a bounded insert that found no empty slot. Hands the
 * caller's key and value back untouched.
 */
template <typename Key, typename Value>
struct capacity_exhausted {
  Key key;
  Value value;
};

/**
 * Result of an insert: the previous value when the key was already present,
 * std::nullopt when a new entry was added, or capacity_exhausted when a
 * bounded map had no room.
 */
template <typename Key, typename Value>
using insert_result =
    std::expected<std::optional<Value>, capacity_exhausted<Key, Value>>;

/**
 * An ordered map over a caller-owned, fixed-size region of slots.
 *
 * Each slot is either empty or holds one key-value pair. The map keeps all
 * occupied slots at the front of the region in strictly ascending key order,
 * followed by all empty slots. The map has no state beyond its view of the
 * region: size and occupancy are derived from the slots themselves, so the
 * region can be inspected (or reused) by the caller after the map is gone.
 *
 * The map never allocates. Lookup is O(log n) (SearchMode::Binary), insert
 * and remove are O(n) moves within the region.
 *
 * The map borrows the region exclusively for its lifetime: the caller must
 * not read or write the region through any other path while the map exists.
 * The map is move-only to keep a single owner of that borrow.
 *
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Compare The comparison function object type (must be
 * default-constructible)
 * @tparam SearchModeT The search mode (Binary or Linear)
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          SearchMode SearchModeT = SearchMode::Binary>
  requires ComparatorCompatible<Key, Compare>
class slot_map {
 public:
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using slot_type = std::optional<value_type>;
  using size_type = std::size_t;
  using key_compare = Compare;

  /**
   * Default constructor - a map over an empty region (capacity 0)
   */
  slot_map() = default;

  /**
   * Borrow a region of slots.
   *
   * The region may already hold entries, provided occupied slots form an
   * ascending prefix with unique keys (checked in debug builds).
   *
   * @param slots The region to borrow; its length is the map's capacity
   */
  explicit slot_map(std::span<slot_type> slots);

  slot_map(const slot_map&) = delete;
  slot_map& operator=(const slot_map&) = delete;

  /**
   * Move constructor - transfers the borrow. The moved-from map views an
   * empty region.
   */
  slot_map(slot_map&& other) noexcept;

  /**
   * Move assignment - transfers the borrow. The moved-from map views an
   * empty region.
   */
  slot_map& operator=(slot_map&& other) noexcept;

  /**
   * Look up a key.
   *
   * Arguments convert to Key as for std::map::find; other key types are
   * accepted without conversion only when Compare is transparent.
   *
   * @param key The key to search for
   * @return Pointer to the mapped value, or nullptr if the key is absent
   */
  Value* get(const Key& key) { return lookup(key); }
  const Value* get(const Key& key) const { return lookup(key); }

  template <typename K>
    requires TransparentCompare<Compare>
  Value* get(const K& key) {
    return lookup(key);
  }

  template <typename K>
    requires TransparentCompare<Compare>
  const Value* get(const K& key) const {
    return lookup(key);
  }

  bool contains(const Key& key) const { return lookup(key) != nullptr; }

  template <typename K>
    requires TransparentCompare<Compare>
  bool contains(const K& key) const {
    return lookup(key) != nullptr;
  }

  /**
   * Insert a key-value pair, or replace the value of an existing key.
   *
   * When the key is present its value is replaced in place and the previous
   * value returned. Otherwise the entries not less than the key shift one
   * slot towards the back to open a slot for the new pair.
   *
   * @param key The key to insert
   * @param value The value to insert
   * @return The previous value (or std::nullopt for a new key), or
   * capacity_exhausted carrying key and value back when every slot is
   * occupied. A rejected insert leaves the region untouched.
   */
  insert_result<Key, Value> insert(Key key, Value value);

  /**
   * Remove a key.
   *
   * The entries after the removed one shift one slot towards the front, and
   * the freed slot ends up as the first empty slot.
   *
   * @param key The key to remove
   * @return The removed value, or std::nullopt if the key was absent
   */
  std::optional<Value> remove(const Key& key) { return take(key); }

  template <typename K>
    requires TransparentCompare<Compare>
  std::optional<Value> remove(const K& key) {
    return take(key);
  }

  /**
   * Empty every slot. Complexity: O(capacity)
   */
  void clear();

  /**
   * Number of occupied slots. Complexity: O(capacity)
   */
  size_type size() const;

  /**
   * True if no slot is occupied. Stops at the first occupied slot.
   */
  bool empty() const;

  size_type capacity() const { return slots_.size(); }

  /**
   * True if no slot is empty. Occupied slots never follow an empty one, so
   * the region is full exactly when its last slot is occupied.
   */
  bool full() const { return slots_.empty() || slots_.back().has_value(); }

  // The whole borrowed region, empty slots included
  std::span<const slot_type> slots() const { return slots_; }

  // The occupied prefix of the region, in ascending key order
  std::span<const slot_type> entries() const;

  /**
   * Check the region's ordering invariant: every occupied slot precedes every
   * empty slot, and occupied keys are strictly ascending.
   */
  bool well_formed() const;

  key_compare key_comp() const { return less_.comp; }

 private:
  std::span<const slot_type> const_slots() const { return slots_; }

  template <typename K>
    requires LookupKey<K, Key, Compare>
  Value* lookup(const K& key);

  template <typename K>
    requires LookupKey<K, Key, Compare>
  const Value* lookup(const K& key) const;

  template <typename K>
    requires LookupKey<K, Key, Compare>
  std::optional<Value> take(const K& key);

  template <typename K>
  slot_position find_position(const K& key) const {
    return search_slots<SearchModeT>(const_slots(), key, less_);
  }

  std::span<slot_type> slots_;
  [[no_unique_address]] absent_last_less<Key, Value, Compare> less_;
};

}  // namespace kressler::managed_containers

// Include implementation
#include "slot_map.ipp"
