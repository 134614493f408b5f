// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chain_containers/sorted_chain.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <lyra/lyra.hpp>
#include <random>
#include <set>

using namespace kressler::chain_containers;

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::steady_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t min_keys = 1000;
  size_t max_keys = 100000;
  int key_range = 10000;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_keys,
                "min_keys")["--min-keys"]("Minimum inserts per iteration") |
      lyra::opt(max_keys,
                "max_keys")["--max-keys"]("Maximum inserts per iteration") |
      lyra::opt(key_range, "key_range")["-k"]["--key-range"](
          "Keys are drawn from [-key_range, key_range]; small ranges force "
          "duplicates");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys > max_keys || key_range < 0) {
    std::cerr << "Invalid options: need min_keys <= max_keys and "
                 "key_range >= 0"
              << std::endl;
    return 1;
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> dist(-key_range, key_range);

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    std::multiset<int> reference;
    sorted_chain<int, 32> chain;

    auto validate = [&]() -> void {
      if (chain.size() != reference.size()) {
        std::cout << "Size mismatch: " << chain.size()
                  << " != " << reference.size() << std::endl;
        exit(1);
      }

      auto it = reference.begin();
      size_t node_index = 0;
      const int* prev_max = nullptr;
      chain.for_each_node([&](const auto& items) {
        if (items.size() > chain.node_capacity()) {
          std::cout << "Node " << node_index << " over capacity" << std::endl;
          exit(1);
        }
        if (prev_max != nullptr && items.min() < *prev_max) {
          std::cout << "Node " << node_index << " starts at " << items.min()
                    << " below previous max " << *prev_max << std::endl;
          exit(1);
        }
        for (int value : items) {
          if (it == reference.end()) {
            std::cout << "Reference ended early!" << std::endl;
            exit(1);
          }
          if (*it != value) {
            std::cout << "Mismatch at key " << *it << " != " << value
                      << std::endl;
            exit(1);
          }
          ++it;
        }
        prev_max = &items.max();
        ++node_index;
      });

      if (it != reference.end()) {
        std::cout << "Chain ended early!" << std::endl;
        exit(1);
      }
    };

    auto check_lookup = [&]() -> void {
      int key = dist(rng);
      auto pos = chain.find(key);
      auto it = reference.lower_bound(key);
      bool present = it != reference.end() && *it == key;
      if (pos.has_value() != present) {
        std::cout << "Lookup mismatch for key " << key << std::endl;
        exit(1);
      }
      if (present &&
          *pos != static_cast<size_t>(std::distance(reference.begin(), it))) {
        std::cout << "Position mismatch for key " << key << ": " << *pos
                  << std::endl;
        exit(1);
      }
    };

    for (size_t i = 0; i < num_keys; ++i) {
      int key = dist(rng);
      chain.insert(key);
      reference.insert(key);
      if (i % 1024 == 0) {
        check_lookup();
      }
    }
    validate();

    for (size_t i = 0; i < 1000; ++i) {
      check_lookup();
    }
  }
  return 0;
}
