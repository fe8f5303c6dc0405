// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

namespace kressler::managed_containers {

// Enum to control search strategy
enum class SearchMode {
  Binary,  // Binary search using std::lower_bound (O(log n))
  Linear   // Linear search for small regions (better cache behavior)
};

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

// Comparators that accept mixed argument types (std::less<>, etc.)
template <typename Compare>
concept TransparentCompare = requires { typename Compare::is_transparent; };

// Keys usable for lookup: the key type itself, or anything when the
// comparator is transparent (same rule as std::map::find).
template <typename K, typename Key, typename Compare>
concept LookupKey = std::same_as<std::remove_cvref_t<K>, Key> ||
                    TransparentCompare<Compare>;

/**
 * Strict weak ordering over slots where an occupied slot always sorts before
 * an empty one.
 *
 * Occupied slots compare by key using Compare. An empty slot compares greater
 * than every key and every occupied slot; two empty slots are equivalent.
 * A region whose occupied slots form an ascending prefix is therefore sorted
 * under this ordering as a whole, empty tail included.
 */
template <typename Key, typename Value, typename Compare = std::less<Key>>
struct absent_last_less {
  using slot_type = std::optional<std::pair<Key, Value>>;

  [[no_unique_address]] Compare comp;

  bool operator()(const slot_type& a, const slot_type& b) const {
    if (!a.has_value()) {
      return false;
    }
    if (!b.has_value()) {
      return true;
    }
    return comp(a->first, b->first);
  }

  template <typename K>
    requires LookupKey<K, Key, Compare>
  bool operator()(const slot_type& slot, const K& key) const {
    return slot.has_value() && comp(slot->first, key);
  }

  template <typename K>
    requires LookupKey<K, Key, Compare>
  bool operator()(const K& key, const slot_type& slot) const {
    return !slot.has_value() || comp(key, slot->first);
  }
};

// Result of searching a slot region for a key
struct slot_position {
  // Index of the matching slot if found, otherwise the index the key would
  // occupy to keep the region ascending.
  std::size_t index;
  bool found;
};

/**
 * Search a slot region for a key.
 *
 * Precondition: occupied slots form a strictly ascending prefix of the
 * region (empty slots only after all occupied ones).
 *
 * @return Position of the key, or its insertion position
 */
template <SearchMode SearchModeT, typename Key, typename Value,
          typename Compare, typename K>
slot_position search_slots(
    std::span<const std::optional<std::pair<Key, Value>>> slots, const K& key,
    const absent_last_less<Key, Value, Compare>& less) {
  std::size_t idx = 0;
  if constexpr (SearchModeT == SearchMode::Binary) {
    idx = std::lower_bound(slots.begin(), slots.end(), key, less) -
          slots.begin();
  } else {
    // Stops at the first empty slot as well, since empty is never less
    while (idx < slots.size() && less(slots[idx], key)) {
      ++idx;
    }
  }

  const bool found = idx < slots.size() && slots[idx].has_value() &&
                     !less.comp(key, slots[idx]->first);
  return {idx, found};
}

/**
 * Index of the first empty slot, or slots.size() if every slot is occupied.
 * Equal to the number of occupied slots under the same precondition as
 * search_slots.
 */
template <SearchMode SearchModeT, typename Key, typename Value>
std::size_t first_empty_slot(
    std::span<const std::optional<std::pair<Key, Value>>> slots) {
  const auto occupied = [](const auto& slot) { return slot.has_value(); };
  if constexpr (SearchModeT == SearchMode::Binary) {
    return std::partition_point(slots.begin(), slots.end(), occupied) -
           slots.begin();
  } else {
    return std::find_if_not(slots.begin(), slots.end(), occupied) -
           slots.begin();
  }
}

}  // namespace kressler::managed_containers
