// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <algorithm>
#include <chain_containers/sorted_chain.hpp>
#include <random>
#include <set>
#include <vector>

using namespace kressler::chain_containers;

namespace {

enum class KeyOrder { Ascending, Descending, Random };

std::vector<int> GenerateKeys(std::size_t count, KeyOrder order) {
  std::vector<int> keys(count);
  for (std::size_t i = 0; i < count; ++i) {
    keys[i] = static_cast<int>(i);
  }
  if (order == KeyOrder::Descending) {
    std::reverse(keys.begin(), keys.end());
  } else if (order == KeyOrder::Random) {
    std::mt19937 rng(42);
    std::shuffle(keys.begin(), keys.end(), rng);
  }
  return keys;
}

}  // namespace

// Build a chain from scratch; measures the cascading insert for each order
template <std::size_t NodeCapacity, KeyOrder order>
static void BM_SortedChain_Insert(benchmark::State& state) {
  auto keys = GenerateKeys(state.range(0), order);

  for (auto _ : state) {
    sorted_chain<int, NodeCapacity> chain;
    for (int key : keys) {
      chain.insert(key);
    }
    benchmark::DoNotOptimize(chain.size());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

template <KeyOrder order>
static void BM_Multiset_Insert(benchmark::State& state) {
  auto keys = GenerateKeys(state.range(0), order);

  for (auto _ : state) {
    std::multiset<int> set;
    for (int key : keys) {
      set.insert(key);
    }
    benchmark::DoNotOptimize(set.size());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

template <std::size_t NodeCapacity>
static void BM_SortedChain_Find(benchmark::State& state) {
  auto keys = GenerateKeys(state.range(0), KeyOrder::Random);

  sorted_chain<int, NodeCapacity> chain;
  for (int key : keys) {
    chain.insert(key);
  }

  std::size_t idx = 0;
  for (auto _ : state) {
    auto pos = chain.find(keys[idx % keys.size()]);
    benchmark::DoNotOptimize(pos);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Multiset_Find(benchmark::State& state) {
  auto keys = GenerateKeys(state.range(0), KeyOrder::Random);
  std::multiset<int> set(keys.begin(), keys.end());

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = set.find(keys[idx % keys.size()]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Insert into a full array, exercising the evict path. The array stays full
// so every iteration does the same amount of shifting.
template <std::size_t Length>
static void BM_BoundedSortedArray_InsertEvict(benchmark::State& state) {
  bounded_sorted_array<int, Length> arr(0);
  for (std::size_t i = 1; i < Length; ++i) {
    arr.insert(static_cast<int>(i * 2));
  }

  for (auto _ : state) {
    auto result = arr.insert(1);
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SortedChain_Insert<16, KeyOrder::Ascending>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Insert<16, KeyOrder::Descending>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Insert<16, KeyOrder::Random>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Insert<128, KeyOrder::Ascending>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Insert<128, KeyOrder::Descending>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Insert<128, KeyOrder::Random>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_Multiset_Insert<KeyOrder::Ascending>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_Multiset_Insert<KeyOrder::Random>)->Range(1 << 10, 1 << 14);

BENCHMARK(BM_SortedChain_Find<16>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_SortedChain_Find<128>)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_Multiset_Find)->Range(1 << 10, 1 << 14);

BENCHMARK(BM_BoundedSortedArray_InsertEvict<8>);
BENCHMARK(BM_BoundedSortedArray_InsertEvict<32>);
BENCHMARK(BM_BoundedSortedArray_InsertEvict<128>);
BENCHMARK(BM_BoundedSortedArray_InsertEvict<255>);

BENCHMARK_MAIN();
