// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <array>
#include <functional>
#include <managed_containers/managed_map.hpp>
#include <managed_containers/slot_map.hpp>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace kressler::managed_containers;

// Generate unique random keys for benchmarking
template <std::size_t Size>
std::vector<int> GenerateUniqueKeys() {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 1000000);
  std::unordered_set<int> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < Size) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

// Region storage lives on the heap so large sizes do not blow the stack;
// the map itself still never allocates.
template <std::size_t Size>
using SlotRegion = std::array<std::optional<std::pair<int, int>>, Size>;

// Benchmark remove + insert cycle on a nearly-full region.
// Pre-populates to Size-1 elements, then repeatedly removes and re-inserts
// the last key.
template <std::size_t Size, SearchMode search_mode>
static void BM_SlotMap_RemoveInsert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  auto region = std::make_unique<SlotRegion<Size>>();
  slot_map<int, int, std::less<int>, search_mode> map(*region);
  for (std::size_t i = 0; i < Size - 1; ++i) {
    (void)map.insert(keys[i], static_cast<int>(i));
  }

  for (auto _ : state) {
    (void)map.remove(keys[Size - 1]);
    auto result = map.insert(keys[Size - 1], static_cast<int>(Size - 1));
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations());
}

template <std::size_t Size, SearchMode search_mode>
static void BM_SlotMap_Get(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  auto region = std::make_unique<SlotRegion<Size>>();
  slot_map<int, int, std::less<int>, search_mode> map(*region);
  for (std::size_t i = 0; i < Size; ++i) {
    (void)map.insert(keys[i], static_cast<int>(i));
  }

  std::size_t idx = 0;
  for (auto _ : state) {
    auto* value = map.get(keys[idx % Size]);
    benchmark::DoNotOptimize(value);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Same cycles through managed_map on either alternative, and on the heap
// maps directly, for comparison.
template <std::size_t Size>
static void BM_ManagedMap_Bounded_RemoveInsert(benchmark::State& state) {
  using Map = managed_map<int, int>;
  auto keys = GenerateUniqueKeys<Size>();
  auto region = std::make_unique<std::array<Map::slot_type, Size>>();
  Map map = *region;
  for (std::size_t i = 0; i < Size - 1; ++i) {
    (void)map.insert(keys[i], static_cast<int>(i));
  }

  for (auto _ : state) {
    (void)map.remove(keys[Size - 1]);
    auto result = map.insert(keys[Size - 1], static_cast<int>(Size - 1));
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename HeapMap, std::size_t Size>
static void BM_ManagedMap_Heap_RemoveInsert(benchmark::State& state) {
  using Map = managed_map<int, int, std::less<int>, HeapMap>;
  auto keys = GenerateUniqueKeys<Size>();
  Map map = HeapMap{};
  for (std::size_t i = 0; i < Size - 1; ++i) {
    (void)map.insert(keys[i], static_cast<int>(i));
  }

  for (auto _ : state) {
    (void)map.remove(keys[Size - 1]);
    auto result = map.insert(keys[Size - 1], static_cast<int>(Size - 1));
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename HeapMap, std::size_t Size>
static void BM_HeapMap_Get(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  HeapMap map;
  for (std::size_t i = 0; i < Size; ++i) {
    map.emplace(keys[i], static_cast<int>(i));
  }

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = map.find(keys[idx % Size]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Register remove+insert benchmarks (cycle on nearly-full regions)
BENCHMARK(BM_SlotMap_RemoveInsert<8, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_RemoveInsert<8, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_RemoveInsert<32, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_RemoveInsert<32, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_RemoveInsert<128, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_RemoveInsert<128, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_RemoveInsert<1024, SearchMode::Binary>);

// Register lookup benchmarks
BENCHMARK(BM_SlotMap_Get<8, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_Get<8, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_Get<32, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_Get<32, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_Get<128, SearchMode::Binary>);
BENCHMARK(BM_SlotMap_Get<128, SearchMode::Linear>);
BENCHMARK(BM_SlotMap_Get<1024, SearchMode::Binary>);
BENCHMARK(BM_HeapMap_Get<std::map<int, int>, 128>);
BENCHMARK(BM_HeapMap_Get<absl::btree_map<int, int>, 128>);
BENCHMARK(BM_HeapMap_Get<std::map<int, int>, 1024>);
BENCHMARK(BM_HeapMap_Get<absl::btree_map<int, int>, 1024>);

// Register managed_map dispatch benchmarks
BENCHMARK(BM_ManagedMap_Bounded_RemoveInsert<32>);
BENCHMARK(BM_ManagedMap_Bounded_RemoveInsert<128>);
BENCHMARK(BM_ManagedMap_Heap_RemoveInsert<std::map<int, int>, 32>);
BENCHMARK(BM_ManagedMap_Heap_RemoveInsert<std::map<int, int>, 128>);
BENCHMARK(BM_ManagedMap_Heap_RemoveInsert<absl::btree_map<int, int>, 32>);
BENCHMARK(BM_ManagedMap_Heap_RemoveInsert<absl::btree_map<int, int>, 128>);

BENCHMARK_MAIN();
