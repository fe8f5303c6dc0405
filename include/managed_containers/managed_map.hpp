// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

#include "config.hpp"
#include "slot_map.hpp"

#if MANAGED_CONTAINERS_HAS_ALLOC
#include <map>
#endif

namespace kressler::managed_containers {

// Placeholder heap map type: managed_map has no heap alternative
struct no_heap_map {};

#if MANAGED_CONTAINERS_HAS_ALLOC
template <typename Key, typename Value, typename Compare>
using default_heap_map = std::map<Key, Value, Compare>;
#else
template <typename Key, typename Value, typename Compare>
using default_heap_map = no_heap_map;
#endif

// Surface required from the heap-backed alternative. std::map and
// absl::btree_map both qualify. The heap map must order keys with the same
// comparator as the bounded alternative.
template <typename Map, typename Key, typename Value, typename Compare>
concept HeapMapCompatible =
    std::same_as<Map, no_heap_map> ||
    (std::same_as<typename Map::key_type, Key> &&
     std::same_as<typename Map::mapped_type, Value> &&
     std::same_as<typename Map::key_compare, Compare> &&
     requires(Map m, const Map cm, Key k, Value v) {
       { m.find(k) } -> std::same_as<typename Map::iterator>;
       { m.find(k)->second } -> std::same_as<Value&>;
       m.emplace(std::move(k), std::move(v));
       m.erase(m.find(k));
       m.clear();
       { cm.size() } -> std::convertible_to<std::size_t>;
       { cm.empty() } -> std::convertible_to<bool>;
     });

/**
 * An ordered map that either borrows a fixed region of slots (slot_map) or
 * owns a heap-backed map, chosen at construction.
 *
 * Functions that need a map take a managed_map and callers pass whichever
 * storage they have: a span/array of slots on targets without a heap, or
 * an owned std::map (or other HeapMap) where allocation is available. Every
 * operation forwards to the active alternative; the alternative never
 * changes after construction.
 *
 * Complexity follows the active alternative: slot_map is O(log n) lookup and
 * O(n) insert/remove, the heap map is whatever HeapMap provides.
 *
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Compare The comparison function object type, shared by both
 * alternatives
 * @tparam HeapMap The heap-backed map type (no_heap_map when allocation is
 * disabled)
 * @tparam SearchModeT The search mode of the bounded alternative
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          typename HeapMap = default_heap_map<Key, Value, Compare>,
          SearchMode SearchModeT = SearchMode::Binary>
  requires ComparatorCompatible<Key, Compare> &&
           HeapMapCompatible<HeapMap, Key, Value, Compare>
class managed_map {
 public:
  using key_type = Key;
  using mapped_type = Value;
  using size_type = std::size_t;
  using key_compare = Compare;
  using bounded_type = slot_map<Key, Value, Compare, SearchModeT>;
  using heap_type = HeapMap;
  using slot_type = typename bounded_type::slot_type;

  static constexpr bool has_heap = !std::is_same_v<HeapMap, no_heap_map>;

  // Construction is implicit so call sites can pass storage directly.

  /**
   * Bounded alternative over a caller-owned region of slots. The region is
   * borrowed exclusively for the lifetime of this map.
   */
  managed_map(std::span<slot_type> slots)
      : storage_(std::in_place_type<bounded_type>, slots) {}

  template <std::size_t N>
  managed_map(std::array<slot_type, N>& slots)
      : managed_map(std::span<slot_type>(slots)) {}

  template <std::size_t N>
  managed_map(slot_type (&slots)[N])
      : managed_map(std::span<slot_type>(slots)) {}

  /**
   * Heap alternative owning the given map.
   */
  managed_map(HeapMap&& map)
    requires has_heap
      : storage_(std::in_place_type<HeapMap>, std::move(map)) {}

  managed_map(managed_map&&) noexcept = default;
  managed_map& operator=(managed_map&&) noexcept = default;

  /**
   * Look up a key. Other key types than Key are accepted without conversion
   * only when Compare is transparent.
   *
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
   * Only the bounded alternative can fail (capacity_exhausted).
   *
   * @return The previous value, std::nullopt for a new key, or
   * capacity_exhausted carrying the key and value back
   */
  insert_result<Key, Value> insert(Key key, Value value);

  /**
   * Remove a key.
   *
   * @return The removed value, or std::nullopt if the key was absent
   */
  std::optional<Value> remove(const Key& key) { return take(key); }

  template <typename K>
    requires TransparentCompare<Compare>
  std::optional<Value> remove(const K& key) {
    return take(key);
  }

  void clear();
  size_type size() const;
  bool empty() const;

  /**
   * Maximum number of entries for the bounded alternative, std::nullopt for
   * the heap alternative.
   */
  std::optional<size_type> capacity() const;

  bool is_bounded() const {
    return std::holds_alternative<bounded_type>(storage_);
  }

  /**
   * Visit every entry in ascending key order as f(key, value).
   */
  template <typename F>
  void for_each(F&& f) const;

 private:
  using storage_type =
      std::conditional_t<has_heap, std::variant<bounded_type, HeapMap>,
                         std::variant<bounded_type>>;

  template <typename K>
    requires LookupKey<K, Key, Compare>
  Value* lookup(const K& key);

  template <typename K>
    requires LookupKey<K, Key, Compare>
  const Value* lookup(const K& key) const;

  template <typename K>
    requires LookupKey<K, Key, Compare>
  std::optional<Value> take(const K& key);

  template <typename M>
  static constexpr bool is_bounded_v =
      std::is_same_v<std::remove_cvref_t<M>, bounded_type>;

  storage_type storage_;
};

}  // namespace kressler::managed_containers

// Include implementation
#include "managed_map.ipp"
