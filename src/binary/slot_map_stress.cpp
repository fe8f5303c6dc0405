// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <managed_containers/managed_map.hpp>
#include <map>
#include <random>

using namespace kressler::managed_containers;

namespace {

struct StressOptions {
  uint64_t seed;
  size_t iterations;
  size_t operations;
  int key_range;
};

// Runs randomized insert/remove/get against a bounded managed_map and a
// std::map reference, validating contents after every batch.
template <std::size_t Capacity, SearchMode Mode>
void run_stress(const StressOptions& options) {
  using Map = managed_map<int, int, std::less<int>,
                          default_heap_map<int, int, std::less<int>>, Mode>;

  for (size_t iter = 0; iter < options.iterations; ++iter) {
    std::mt19937_64 rng(options.seed + iter);
    std::uniform_int_distribution<int> key_dist(0, options.key_range - 1);
    std::uniform_int_distribution<int> val_dist(
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    std::uniform_int_distribution<int> op_dist(0, 99);

    std::array<typename Map::slot_type, Capacity> slots{};
    Map map = slots;
    std::map<int, int> reference;
    size_t rejected = 0;

    auto fail = [&](const char* what, int key) {
      std::cout << "Mismatch (" << what << ") at key " << key
                << ", capacity " << Capacity << ", seed "
                << options.seed + iter << std::endl;
      std::exit(1);
    };

    auto validate = [&]() -> void {
      if (map.size() != reference.size()) {
        std::cout << "Size mismatch: " << map.size()
                  << " != " << reference.size() << std::endl;
        std::exit(1);
      }
      auto it = reference.begin();
      bool first = true;
      int prev = 0;
      map.for_each([&](const int& key, const int& value) {
        if (!first && !(prev < key)) {
          fail("order", key);
        }
        if (it == reference.end() || it->first != key ||
            it->second != value) {
          fail("contents", key);
        }
        first = false;
        prev = key;
        ++it;
      });
      if (it != reference.end()) {
        std::cout << "Bounded map ended early!" << std::endl;
        std::exit(1);
      }
    };

    for (size_t op = 0; op < options.operations; ++op) {
      const int key = key_dist(rng);
      const int choice = op_dist(rng);

      if (choice < 50) {
        const int value = val_dist(rng);
        auto result = map.insert(key, value);
        const auto ref = reference.find(key);
        if (!result.has_value()) {
          if (ref != reference.end() || reference.size() < Capacity ||
              result.error().key != key || result.error().value != value) {
            fail("rejected insert", key);
          }
          ++rejected;
        } else if (ref != reference.end()) {
          if (*result != ref->second) {
            fail("replaced value", key);
          }
          ref->second = value;
        } else {
          if (result->has_value()) {
            fail("new key reported previous value", key);
          }
          reference.emplace(key, value);
        }
      } else if (choice < 85) {
        const auto removed = map.remove(key);
        const auto ref = reference.find(key);
        if (removed.has_value() != (ref != reference.end())) {
          fail("remove presence", key);
        }
        if (removed.has_value()) {
          if (*removed != ref->second) {
            fail("removed value", key);
          }
          reference.erase(ref);
        }
      } else if (choice < 99) {
        const int* found = map.get(key);
        const auto ref = reference.find(key);
        if ((found != nullptr) != (ref != reference.end()) ||
            (found != nullptr && *found != ref->second)) {
          fail("get", key);
        }
      } else {
        validate();
        map.clear();
        reference.clear();
      }

      if (op % 1000 == 0) {
        validate();
      }
    }
    validate();

    std::cout << "Iteration " << iter << " capacity " << Capacity << ": "
              << reference.size() << " entries, " << rejected
              << " rejected inserts, seed " << options.seed + iter
              << std::endl;
  }
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  StressOptions options{
      static_cast<uint64_t>(
          std::chrono::system_clock::now().time_since_epoch().count()),
      100, 100000, 512};

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(options.seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(options.iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(options.operations, "operations")["-o"]["--operations"](
          "Random operations per iteration") |
      lyra::opt(options.key_range, "key_range")["-k"]["--key-range"](
          "Keys are drawn from [0, key_range)");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (options.key_range <= 0) {
    std::cerr << "--key-range must be positive" << std::endl;
    return 1;
  }

  run_stress<16, SearchMode::Linear>(options);
  run_stress<16, SearchMode::Binary>(options);
  run_stress<256, SearchMode::Binary>(options);
  return 0;
}
