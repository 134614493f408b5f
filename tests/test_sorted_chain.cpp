// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chain_containers/sorted_chain.hpp>
#include <cstddef>
#include <functional>
#include <new>
#include <numeric>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kressler::chain_containers;

namespace {

template <typename Chain>
std::vector<typename Chain::value_type> flatten(const Chain& chain) {
  std::vector<typename Chain::value_type> out;
  chain.for_each_node([&](const auto& items) {
    out.insert(out.end(), items.begin(), items.end());
  });
  return out;
}

template <typename Chain>
std::vector<std::vector<typename Chain::value_type>> node_contents(
    const Chain& chain) {
  std::vector<std::vector<typename Chain::value_type>> out;
  chain.for_each_node([&](const auto& items) {
    out.emplace_back(items.begin(), items.end());
  });
  return out;
}

// Structural checks that must hold after any sequence of inserts
template <typename Chain>
void check_invariants(const Chain& chain) {
  typename Chain::value_compare comp;
  std::size_t total = 0;
  std::size_t nodes = 0;
  const typename Chain::value_type* prev_max = nullptr;

  chain.for_each_node([&](const auto& items) {
    REQUIRE(items.size() >= 1);
    REQUIRE(items.size() <= Chain::node_capacity());
    REQUIRE(std::is_sorted(items.begin(), items.end(), comp));
    if (prev_max != nullptr) {
      // Node ranges never overlap; equal values may straddle a boundary
      REQUIRE(!comp(items.min(), *prev_max));
    }
    prev_max = &items.max();
    total += items.size();
    ++nodes;
  });

  REQUIRE(total == chain.size());
  REQUIRE(nodes == chain.node_count());
  REQUIRE(chain.empty() == (nodes == 0));
}

template <std::size_t N>
struct Capacity {
  static constexpr std::size_t value = N;
};

// Allocator that counts outstanding allocations
struct AllocationStats {
  std::size_t allocations = 0;
  std::size_t deallocations = 0;
};

template <typename T>
struct CountingAllocator {
  using value_type = T;

  AllocationStats* stats;

  explicit CountingAllocator(AllocationStats* s) : stats(s) {}

  template <typename U>
  CountingAllocator(const CountingAllocator<U>& other) : stats(other.stats) {}

  T* allocate(std::size_t n) {
    ++stats->allocations;
    return std::allocator<T>().allocate(n);
  }

  void deallocate(T* p, std::size_t n) {
    ++stats->deallocations;
    std::allocator<T>().deallocate(p, n);
  }

  template <typename U>
  bool operator==(const CountingAllocator<U>& other) const {
    return stats == other.stats;
  }
};

// Allocator that fails once its budget of allocations is spent
struct AllocationBudget {
  std::size_t remaining = 0;
  std::size_t allocations = 0;
  std::size_t deallocations = 0;
};

template <typename T>
struct BudgetAllocator {
  using value_type = T;

  AllocationBudget* budget;

  explicit BudgetAllocator(AllocationBudget* b) : budget(b) {}

  template <typename U>
  BudgetAllocator(const BudgetAllocator<U>& other) : budget(other.budget) {}

  T* allocate(std::size_t n) {
    if (budget->remaining == 0) {
      throw std::bad_alloc();
    }
    --budget->remaining;
    ++budget->allocations;
    return std::allocator<T>().allocate(n);
  }

  void deallocate(T* p, std::size_t n) {
    ++budget->deallocations;
    std::allocator<T>().deallocate(p, n);
  }

  template <typename U>
  bool operator==(const BudgetAllocator<U>& other) const {
    return budget == other.budget;
  }
};

}  // namespace

TEST_CASE("sorted_chain default constructor creates empty chain",
          "[sorted_chain][constructor]") {
  sorted_chain<int, 15> chain;

  REQUIRE(chain.empty());
  REQUIRE(chain.size() == 0);
  REQUIRE(chain.node_count() == 0);
  REQUIRE(!chain.find(1).has_value());
  REQUIRE(!chain.contains(1));
  REQUIRE_THROWS_AS(chain.at(0), std::out_of_range);
  check_invariants(chain);
}

TEST_CASE("sorted_chain first insert creates the head node",
          "[sorted_chain][insert]") {
  sorted_chain<int, 15> chain;
  chain.insert(42);

  REQUIRE(chain.size() == 1);
  REQUIRE(chain.node_count() == 1);
  REQUIRE(chain.contains(42));
  REQUIRE(chain.find(42) == std::size_t{0});
  REQUIRE(chain.at(0) == 42);
  check_invariants(chain);
}

TEST_CASE("sorted_chain demo workload", "[sorted_chain][insert]") {
  sorted_chain<int, 15> chain;

  for (int i = -50; i < 50; ++i) {
    chain.insert(i);
  }
  for (int i = -5; i < 15; ++i) {
    chain.insert(i);
  }
  for (int i = 0; i < 50; ++i) {
    chain.insert(2);
  }

  REQUIRE(chain.size() == 170);
  check_invariants(chain);

  auto values = flatten(chain);
  REQUIRE(std::is_sorted(values.begin(), values.end()));
  REQUIRE(std::count(values.begin(), values.end(), 2) == 52);
  REQUIRE(std::count(values.begin(), values.end(), 0) == 2);
  REQUIRE(std::count(values.begin(), values.end(), -50) == 1);

  // Head holds the smallest values
  auto nodes = node_contents(chain);
  REQUIRE(nodes.front().front() == -50);
  REQUIRE(nodes.back().back() == 49);

  // Values below 2: 52 from the first range, 7 from the second
  REQUIRE(chain.find(2) == 59);
  REQUIRE(chain.at(58) == 1);
  REQUIRE(chain.at(59) == 2);
  REQUIRE(chain.at(59 + 51) == 2);
  REQUIRE(chain.at(59 + 52) == 3);
  REQUIRE_THROWS_AS(chain.at(170), std::out_of_range);

  for (int i = -50; i < 50; ++i) {
    REQUIRE(chain.contains(i));
  }
  REQUIRE(!chain.contains(-51));
  REQUIRE(!chain.contains(50));
}

TEST_CASE("sorted_chain splices a new head for a smaller element",
          "[sorted_chain][insert]") {
  sorted_chain<int, 2> chain;
  chain.insert(5);
  chain.insert(6);
  REQUIRE(chain.node_count() == 1);

  chain.insert(1);
  REQUIRE(node_contents(chain) ==
          std::vector<std::vector<int>>{{1}, {5, 6}});

  SECTION("Larger element skips the spliced head") {
    chain.insert(10);
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{1}, {5, 6}, {10}});
    check_invariants(chain);
  }

  SECTION("Element between the head and its successor stays in the head") {
    chain.insert(3);
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{1, 3}, {5, 6}});
    check_invariants(chain);
  }

  SECTION("Element equal to the successor's minimum goes to the successor") {
    chain.insert(5);
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{1}, {5, 5}, {6}});
    check_invariants(chain);
  }
}

TEST_CASE("sorted_chain eviction cascades to the next node",
          "[sorted_chain][insert]") {
  sorted_chain<int, 3> chain;
  for (int v : {10, 20, 30, 40, 50, 60}) {
    chain.insert(v);
  }
  REQUIRE(node_contents(chain) ==
          std::vector<std::vector<int>>{{10, 20, 30}, {40, 50, 60}});

  // 25 evicts 30, which is below the full second node and gets its own node
  chain.insert(25);
  REQUIRE(node_contents(chain) ==
          std::vector<std::vector<int>>{{10, 20, 25}, {30}, {40, 50, 60}});

  // 45 evicts 60 off the tail
  chain.insert(45);
  REQUIRE(node_contents(chain) == std::vector<std::vector<int>>{
                                      {10, 20, 25}, {30}, {40, 45, 50}, {60}});
  REQUIRE(chain.size() == 8);
  check_invariants(chain);
}

TEST_CASE("sorted_chain strictly decreasing inserts",
          "[sorted_chain][insert]") {
  // Every head fill ends in a splice; the long chain must tear down without
  // recursion
  sorted_chain<int, 1> chain;
  constexpr int count = 200000;
  for (int i = count; i > 0; --i) {
    chain.insert(i);
  }

  REQUIRE(chain.size() == count);
  REQUIRE(chain.node_count() == count);
  REQUIRE(chain.at(0) == 1);
  REQUIRE(chain.at(count - 1) == count);
  REQUIRE(chain.find(count) == count - 1);
  REQUIRE(!chain.contains(0));
}

TEST_CASE("sorted_chain repeated value", "[sorted_chain][insert]") {
  sorted_chain<int, 4> chain;
  for (int i = 0; i < 30; ++i) {
    chain.insert(7);
  }
  chain.insert(1);
  chain.insert(9);

  REQUIRE(chain.size() == 32);
  check_invariants(chain);

  auto values = flatten(chain);
  REQUIRE(std::count(values.begin(), values.end(), 7) == 30);
  REQUIRE(values.front() == 1);
  REQUIRE(values.back() == 9);
  REQUIRE(chain.find(7) == 1);
  REQUIRE(chain.find(9) == 31);
}

TEMPLATE_TEST_CASE("sorted_chain matches std::multiset on random input",
                   "[sorted_chain][random]", Capacity<1>, Capacity<2>,
                   Capacity<3>, Capacity<15>, Capacity<64>, Capacity<255>) {
  constexpr std::size_t N = TestType::value;

  for (unsigned seed = 1; seed <= 5; ++seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(-500, 500);

    sorted_chain<int, N> chain;
    std::multiset<int> reference;

    for (int i = 0; i < 2000; ++i) {
      int value = dist(rng);
      chain.insert(value);
      reference.insert(value);
      REQUIRE(chain.size() == reference.size());
    }

    check_invariants(chain);
    REQUIRE(flatten(chain) ==
            std::vector<int>(reference.begin(), reference.end()));

    for (int key = -510; key <= 510; ++key) {
      auto pos = chain.find(key);
      auto it = reference.lower_bound(key);
      if (it != reference.end() && *it == key) {
        REQUIRE(pos.has_value());
        REQUIRE(*pos == static_cast<std::size_t>(
                            std::distance(reference.begin(), it)));
        REQUIRE(chain.at(*pos) == key);
      } else {
        REQUIRE(!pos.has_value());
      }
    }
  }
}

TEST_CASE("sorted_chain is insensitive to insertion order",
          "[sorted_chain][random]") {
  std::vector<int> values(300);
  std::iota(values.begin(), values.end(), 0);
  for (int i = 0; i < 100; ++i) {
    values.push_back(i % 17);
  }

  std::vector<int> expected = values;
  std::sort(expected.begin(), expected.end());

  std::mt19937 rng(7);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(values.begin(), values.end(), rng);
    sorted_chain<int, 8> chain;
    for (int v : values) {
      chain.insert(v);
    }
    check_invariants(chain);
    REQUIRE(flatten(chain) == expected);
  }
}

TEST_CASE("sorted_chain lookup", "[sorted_chain][find]") {
  sorted_chain<int, 6> chain;
  for (int i = 0; i < 200; i += 2) {
    chain.insert(i);
  }

  for (int i = 0; i < 200; ++i) {
    INFO("value " << i);
    REQUIRE(chain.contains(i) == (i % 2 == 0));
  }
  REQUIRE(!chain.contains(-1));
  REQUIRE(!chain.contains(200));
  REQUIRE(chain.find(100) == 50);
}

TEST_CASE("sorted_chain with std::string", "[sorted_chain]") {
  sorted_chain<std::string, 3> chain;
  for (const char* word :
       {"pear", "apple", "fig", "kiwi", "banana", "apple", "cherry"}) {
    chain.insert(std::string(word));
  }
  const std::string lvalue = "date";
  chain.insert(lvalue);

  check_invariants(chain);
  REQUIRE(flatten(chain) ==
          std::vector<std::string>{"apple", "apple", "banana", "cherry",
                                   "date", "fig", "kiwi", "pear"});
  REQUIRE(chain.find("banana") == 2);
  REQUIRE(!chain.contains("grape"));
}

TEST_CASE("sorted_chain with a custom comparator", "[sorted_chain]") {
  sorted_chain<int, 4, std::greater<int>> chain;
  for (int i = 0; i < 20; ++i) {
    chain.insert(i);
  }

  check_invariants(chain);
  auto values = flatten(chain);
  REQUIRE(values.front() == 19);
  REQUIRE(values.back() == 0);
  REQUIRE(std::is_sorted(values.begin(), values.end(), std::greater<int>()));
  REQUIRE(chain.find(19) == std::size_t{0});
}

TEST_CASE("sorted_chain copy and move", "[sorted_chain]") {
  sorted_chain<int, 4> chain;
  for (int i = 20; i > 0; --i) {
    chain.insert(i);
  }
  const auto shape = node_contents(chain);

  SECTION("Copy constructor preserves node layout") {
    sorted_chain<int, 4> copy(chain);
    REQUIRE(node_contents(copy) == shape);
    REQUIRE(copy.size() == chain.size());
    REQUIRE(copy.node_count() == chain.node_count());

    copy.insert(100);
    REQUIRE(copy.size() == chain.size() + 1);
    REQUIRE(!chain.contains(100));
  }

  SECTION("Copy assignment replaces contents") {
    sorted_chain<int, 4> other;
    other.insert(-1);
    other = chain;
    REQUIRE(node_contents(other) == shape);
    REQUIRE(!other.contains(-1));
  }

  SECTION("Move constructor leaves source empty") {
    sorted_chain<int, 4> moved(std::move(chain));
    REQUIRE(node_contents(moved) == shape);
    REQUIRE(chain.empty());
    REQUIRE(chain.node_count() == 0);

    // Source is still usable
    chain.insert(3);
    REQUIRE(chain.size() == 1);
  }

  SECTION("Move assignment") {
    sorted_chain<int, 4> other;
    other.insert(-1);
    other = std::move(chain);
    REQUIRE(node_contents(other) == shape);
    REQUIRE(chain.empty());
  }

  SECTION("swap") {
    sorted_chain<int, 4> other;
    other.insert(-1);
    swap(chain, other);
    REQUIRE(node_contents(other) == shape);
    REQUIRE(chain.size() == 1);
    REQUIRE(chain.contains(-1));
  }
}

TEST_CASE("sorted_chain allocates nodes through the allocator",
          "[sorted_chain][allocator]") {
  AllocationStats stats;
  {
    using Chain = sorted_chain<int, 4, std::less<int>, CountingAllocator<int>>;
    Chain chain{CountingAllocator<int>(&stats)};
    for (int i = 0; i < 100; ++i) {
      chain.insert(i * 7 % 100);
    }
    check_invariants(chain);
    REQUIRE(stats.allocations == chain.node_count());
    REQUIRE(stats.deallocations == 0);

    Chain copy(chain);
    REQUIRE(stats.allocations == 2 * chain.node_count());
  }
  REQUIRE(stats.deallocations == stats.allocations);
}

TEST_CASE("sorted_chain node layout", "[sorted_chain][layout]") {
  using Chain = sorted_chain<int, 15>;
  // The successor link is a single pointer; no separate presence flag
  STATIC_REQUIRE(sizeof(Chain::chain_node) ==
                 sizeof(Chain::node_array) + sizeof(void*));
}

TEST_CASE("sorted_chain default node capacity", "[sorted_chain]") {
  STATIC_REQUIRE(default_node_capacity<int>() == 128);
  STATIC_REQUIRE(default_node_capacity<char>() == 255);
  STATIC_REQUIRE(default_node_capacity<std::byte[1024]>() == 8);

  STATIC_REQUIRE(sorted_chain<long>::node_capacity() == 64);
}

TEST_CASE("sorted_chain debug output", "[sorted_chain]") {
  sorted_chain<int, 2> chain;
  for (int v : {5, 6, 1, 10}) {
    chain.insert(v);
  }

  std::ostringstream os;
  os << chain;
  REQUIRE(os.str() == "[[1], [5, 6], [10]]");

  std::ostringstream structure;
  print_structure(structure, chain);
  REQUIRE(structure.str().find("size=4 nodes=3") != std::string::npos);
  REQUIRE(structure.str().find("range=[5, 6]") != std::string::npos);

  std::ostringstream empty_os;
  empty_os << sorted_chain<int, 2>();
  REQUIRE(empty_os.str() == "[]");
}

TEST_CASE("sorted_chain insert is unchanged by a failed allocation",
          "[sorted_chain][allocator]") {
  using Chain = sorted_chain<int, 3, std::less<int>, BudgetAllocator<int>>;
  AllocationBudget budget;
  budget.remaining = 1;
  {
    Chain chain{BudgetAllocator<int>(&budget)};
    for (int v : {10, 20, 30}) {
      chain.insert(v);
    }
    REQUIRE(budget.remaining == 0);

    SECTION("Eviction from a full tail") {
      REQUIRE_THROWS_AS(chain.insert(15), std::bad_alloc);
      REQUIRE(node_contents(chain) ==
              std::vector<std::vector<int>>{{10, 20, 30}});
      REQUIRE(chain.size() == 3);
      REQUIRE(!chain.contains(15));
      REQUIRE(chain.contains(30));
    }

    SECTION("Splice in front of a full head") {
      REQUIRE_THROWS_AS(chain.insert(5), std::bad_alloc);
      REQUIRE(node_contents(chain) ==
              std::vector<std::vector<int>>{{10, 20, 30}});
      REQUIRE(chain.size() == 3);
    }

    SECTION("New tail past a full node") {
      REQUIRE_THROWS_AS(chain.insert(40), std::bad_alloc);
      REQUIRE(node_contents(chain) ==
              std::vector<std::vector<int>>{{10, 20, 30}});
      REQUIRE(chain.size() == 3);
    }

    SECTION("Insert succeeds once memory is available again") {
      REQUIRE_THROWS_AS(chain.insert(15), std::bad_alloc);
      budget.remaining = 1;
      chain.insert(15);
      REQUIRE(node_contents(chain) ==
              std::vector<std::vector<int>>{{10, 15, 20}, {30}});
      check_invariants(chain);
    }
  }
  REQUIRE(budget.deallocations == budget.allocations);
}

TEST_CASE("sorted_chain cascade is not started when allocation fails",
          "[sorted_chain][allocator]") {
  using Chain = sorted_chain<int, 3, std::less<int>, BudgetAllocator<int>>;
  AllocationBudget budget;
  budget.remaining = 2;
  {
    Chain chain{BudgetAllocator<int>(&budget)};
    for (int v : {10, 20, 30, 40, 50, 60}) {
      chain.insert(v);
    }
    REQUIRE(chain.node_count() == 2);

    // 25 would push 30 out of the head and need a node in front of 40
    REQUIRE_THROWS_AS(chain.insert(25), std::bad_alloc);
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{10, 20, 30}, {40, 50, 60}});
    REQUIRE(chain.size() == 6);
    check_invariants(chain);
  }
  REQUIRE(budget.deallocations == budget.allocations);
}

TEST_CASE("sorted_chain frees the reserved node when the cascade ends early",
          "[sorted_chain][allocator]") {
  AllocationStats stats;
  {
    using Chain = sorted_chain<int, 3, std::less<int>, CountingAllocator<int>>;
    Chain chain{CountingAllocator<int>(&stats)};
    for (int v : {10, 20, 30, 40}) {
      chain.insert(v);
    }
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{10, 20, 30}, {40}});

    // 30 is evicted and absorbed by the node holding 40
    chain.insert(25);
    REQUIRE(node_contents(chain) ==
            std::vector<std::vector<int>>{{10, 20, 25}, {30, 40}});
    REQUIRE(chain.node_count() == 2);
    REQUIRE(stats.allocations - stats.deallocations == chain.node_count());
  }
  REQUIRE(stats.deallocations == stats.allocations);
}

TEST_CASE("sorted_chain keeps non-propagating allocators",
          "[sorted_chain][allocator]") {
  using Chain = sorted_chain<int, 4, std::less<int>, CountingAllocator<int>>;
  AllocationStats first_stats;
  AllocationStats second_stats;
  {
    Chain first{CountingAllocator<int>(&first_stats)};
    Chain second{CountingAllocator<int>(&second_stats)};
    for (int i = 0; i < 20; ++i) {
      first.insert(i);
    }
    second.insert(-1);
    const auto shape = node_contents(first);

    SECTION("Move assignment between unequal allocators moves elements") {
      const std::size_t before = second_stats.allocations;
      second = std::move(first);
      REQUIRE(node_contents(second) == shape);
      REQUIRE(first.empty());
      REQUIRE(second.get_allocator().stats == &second_stats);
      REQUIRE(second_stats.allocations - before == second.node_count());
      REQUIRE(first_stats.deallocations == first_stats.allocations);
    }

    SECTION("Move assignment between equal allocators steals nodes") {
      Chain third{CountingAllocator<int>(&first_stats)};
      const std::size_t before = first_stats.allocations;
      third = std::move(first);
      REQUIRE(node_contents(third) == shape);
      REQUIRE(first.empty());
      REQUIRE(first_stats.allocations == before);
    }

    SECTION("Copy assignment keeps the target's allocator") {
      second = first;
      REQUIRE(node_contents(second) == shape);
      REQUIRE(second.get_allocator().stats == &second_stats);
      REQUIRE(second_stats.allocations - second_stats.deallocations ==
              second.node_count());
    }
  }
  REQUIRE(first_stats.deallocations == first_stats.allocations);
  REQUIRE(second_stats.deallocations == second_stats.allocations);
}
