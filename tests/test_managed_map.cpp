// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>

#include <array>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <managed_containers/managed_map.hpp>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

using namespace kressler::managed_containers;

// Helper types for testing different heap-backed maps
struct StdMapHeap {
  template <typename K, typename V, typename C>
  using type = std::map<K, V, C>;
};
struct AbslBtreeHeap {
  template <typename K, typename V, typename C>
  using type = absl::btree_map<K, V, C>;
};

namespace {

// Generic code written once against managed_map, whatever the storage
template <typename Map>
void fill_squares(Map& map, int count) {
  for (int i = count - 1; i >= 0; --i) {
    (void)map.insert(i, i * i);
  }
}

template <typename Map>
std::vector<std::pair<int, int>> collect(const Map& map) {
  std::vector<std::pair<int, int>> entries;
  map.for_each([&entries](const int& key, const int& value) {
    entries.emplace_back(key, value);
  });
  return entries;
}

}  // namespace

static_assert(!std::is_copy_constructible_v<managed_map<int, int>>);
static_assert(std::is_move_constructible_v<managed_map<int, int>>);
static_assert(HeapMapCompatible<std::map<int, int>, int, int, std::less<int>>);
static_assert(
    HeapMapCompatible<absl::btree_map<int, int>, int, int, std::less<int>>);
static_assert(!HeapMapCompatible<std::vector<int>, int, int, std::less<int>>);
static_assert(
    !HeapMapCompatible<std::map<int, long>, int, int, std::less<int>>);
// Heap map ordered differently from the bounded alternative
static_assert(
    !HeapMapCompatible<std::map<int, int>, int, int, std::greater<int>>);
static_assert(HeapMapCompatible<std::map<int, int, std::greater<int>>, int,
                                int, std::greater<int>>);

TEST_CASE("managed_map construction selects the alternative",
          "[managed_map]") {
  using Map = managed_map<int, int>;

  SECTION("From a span of slots") {
    std::array<Map::slot_type, 4> slots{};
    Map map{std::span<Map::slot_type>(slots)};
    REQUIRE(map.is_bounded());
    REQUIRE(map.capacity() == 4);
  }

  SECTION("From a std::array of slots") {
    std::array<Map::slot_type, 3> slots{};
    Map map = slots;
    REQUIRE(map.is_bounded());
    REQUIRE(map.capacity() == 3);
  }

  SECTION("From a C array of slots") {
    Map::slot_type slots[5] = {};
    Map map = slots;
    REQUIRE(map.is_bounded());
    REQUIRE(map.capacity() == 5);
  }

  SECTION("From an owned std::map") {
    Map map = std::map<int, int>{{1, 10}, {2, 20}};
    REQUIRE_FALSE(map.is_bounded());
    REQUIRE(map.capacity() == std::nullopt);
    REQUIRE(map.size() == 2);
    REQUIRE(*map.get(2) == 20);
  }
}

TEST_CASE("managed_map bounded alternative", "[managed_map]") {
  using Map = managed_map<std::string, int>;
  std::array<Map::slot_type, 4> slots = {Map::slot_type{{"a", 1}},
                                         std::nullopt, std::nullopt,
                                         std::nullopt};
  Map map = slots;

  SECTION("Operations reach the borrowed region") {
    REQUIRE(map.insert("c", 3).has_value());
    REQUIRE(map.insert("b", 2).has_value());
    REQUIRE(slots[1]->first == "b");
    REQUIRE(slots[2]->first == "c");

    REQUIRE(map.remove("a") == 1);
    REQUIRE(slots[0]->first == "b");
    REQUIRE(slots[1]->first == "c");
    REQUIRE_FALSE(slots[2].has_value());

    REQUIRE(map.get("q") == nullptr);
    REQUIRE_FALSE(map.contains("q"));
    REQUIRE(*map.get("b") == 2);
    REQUIRE(map.size() == 2);
  }

  SECTION("Full region rejects new keys") {
    REQUIRE(map.insert("b", 2).has_value());
    REQUIRE(map.insert("c", 3).has_value());
    REQUIRE(map.insert("d", 4).has_value());
    const auto snapshot = slots;

    auto r = map.insert("e", 5);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().key == "e");
    REQUIRE(r.error().value == 5);
    REQUIRE(slots == snapshot);
    REQUIRE(map.is_bounded());
  }

  SECTION("Clear empties the region") {
    map.clear();
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);
    for (const auto& slot : slots) {
      REQUIRE_FALSE(slot.has_value());
    }
  }
}

TEMPLATE_TEST_CASE("managed_map heap alternative", "[managed_map]",
                   StdMapHeap, AbslBtreeHeap) {
  using Heap = typename TestType::template type<int, int, std::less<int>>;
  using Map = managed_map<int, int, std::less<int>, Heap>;
  Map map = Heap{};

  SECTION("Insert never fails") {
    for (int i = 0; i < 1000; ++i) {
      auto r = map.insert(i, i);
      REQUIRE(r.has_value());
      REQUIRE_FALSE(r->has_value());
    }
    REQUIRE(map.size() == 1000);
    REQUIRE_FALSE(map.is_bounded());
  }

  SECTION("Replace returns previous value") {
    REQUIRE(map.insert(7, 70).has_value());
    auto r = map.insert(7, 77);
    REQUIRE(r.has_value());
    REQUIRE(*r == 70);
    REQUIRE(*map.get(7) == 77);
    REQUIRE(map.size() == 1);
  }

  SECTION("Remove returns the removed value") {
    map.insert(1, 10);
    map.insert(2, 20);
    REQUIRE(map.remove(1) == 10);
    REQUIRE(map.remove(1) == std::nullopt);
    REQUIRE(map.size() == 1);
  }

  SECTION("get gives mutable access") {
    map.insert(3, 30);
    int* value = map.get(3);
    REQUIRE(value != nullptr);
    *value = 33;
    REQUIRE(*std::as_const(map).get(3) == 33);
    REQUIRE(map.get(4) == nullptr);
  }

  SECTION("Clear, size and empty") {
    REQUIRE(map.empty());
    map.insert(1, 1);
    REQUIRE_FALSE(map.empty());
    map.clear();
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);
  }
}

TEMPLATE_TEST_CASE("managed_map behaves the same on both alternatives",
                   "[managed_map]", StdMapHeap, AbslBtreeHeap) {
  using Heap = typename TestType::template type<int, int, std::less<int>>;
  using Map = managed_map<int, int, std::less<int>, Heap>;

  std::array<typename Map::slot_type, 16> slots{};
  Map bounded = slots;
  Map heap = Heap{};

  fill_squares(bounded, 10);
  fill_squares(heap, 10);

  REQUIRE(bounded.size() == heap.size());
  REQUIRE(collect(bounded) == collect(heap));

  for (int k : {0, 3, 9, 42}) {
    REQUIRE(bounded.remove(k) == heap.remove(k));
  }
  REQUIRE(collect(bounded) == collect(heap));

  const auto entries = collect(heap);
  for (std::size_t i = 1; i < entries.size(); ++i) {
    REQUIRE(entries[i - 1].first < entries[i].first);
  }
}

TEST_CASE("managed_map heterogeneous lookup", "[managed_map]") {
  using Map = managed_map<std::string, int, std::less<>>;

  SECTION("Bounded") {
    std::array<Map::slot_type, 4> slots{};
    Map map = slots;
    map.insert("key", 1);
    REQUIRE(*map.get(std::string_view("key")) == 1);
    REQUIRE(map.contains(std::string_view("key")));
    REQUIRE(map.remove(std::string_view("key")) == 1);
  }

  SECTION("Heap") {
    Map map = std::map<std::string, int, std::less<>>{};
    map.insert("key", 1);
    REQUIRE(*map.get(std::string_view("key")) == 1);
    REQUIRE(map.contains(std::string_view("key")));
    REQUIRE(map.remove(std::string_view("key")) == 1);
  }
}

TEST_CASE("managed_map converts lookup arguments to the key type",
          "[managed_map]") {
  using Map = managed_map<std::string, int>;
  std::array<Map::slot_type, 4> slots{};
  Map bounded = slots;
  Map heap = std::map<std::string, int>{};

  for (Map* map : {&bounded, &heap}) {
    REQUIRE(map->insert("p", 1).has_value());
    REQUIRE(map->insert("q", 2).has_value());
    REQUIRE(*map->get("q") == 2);
    *map->get("q") = 20;
    REQUIRE(std::as_const(*map).get("q") != nullptr);
    REQUIRE(*std::as_const(*map).get("q") == 20);
    REQUIRE(map->contains("p"));
    REQUIRE_FALSE(map->contains("r"));
    REQUIRE(map->remove("p") == 1);
    REQUIRE(map->remove("p") == std::nullopt);
    REQUIRE(map->size() == 1);
  }
}

TEST_CASE("managed_map alternatives share the comparator order",
          "[managed_map]") {
  using Map = managed_map<int, int, std::greater<int>>;
  static_assert(
      std::is_same_v<Map::heap_type, std::map<int, int, std::greater<int>>>);

  std::array<Map::slot_type, 4> slots{};
  Map bounded = slots;
  Map heap = Map::heap_type{};

  for (Map* map : {&bounded, &heap}) {
    for (int key : {2, 1, 3}) {
      REQUIRE(map->insert(key, key * 10).has_value());
    }
  }

  auto keys_of = [](const Map& map) {
    std::vector<int> keys;
    map.for_each([&keys](const int& key, const int&) { keys.push_back(key); });
    return keys;
  };
  REQUIRE(keys_of(bounded) == std::vector<int>{3, 2, 1});
  REQUIRE(keys_of(heap) == std::vector<int>{3, 2, 1});
}

TEST_CASE("managed_map move keeps the alternative", "[managed_map]") {
  using Map = managed_map<int, int>;
  std::array<Map::slot_type, 2> slots{};
  Map bounded = slots;
  bounded.insert(1, 1);

  Map moved(std::move(bounded));
  REQUIRE(moved.is_bounded());
  REQUIRE(*moved.get(1) == 1);

  Map heap = std::map<int, int>{{5, 5}};
  moved = std::move(heap);
  REQUIRE_FALSE(moved.is_bounded());
  REQUIRE(*moved.get(5) == 5);
  // The region was handed back untouched
  REQUIRE(slots[0]->first == 1);
}
