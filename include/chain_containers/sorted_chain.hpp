// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "bounded_sorted_array.hpp"

namespace kressler::chain_containers {

/**
 * Heuristic to calculate a reasonable node capacity based on element size.
 * Targets ~512 bytes of element storage (8 cache lines) per node.
 *
 * @tparam T The element type
 * @return Number of elements per node
 *
 *   Rounded to multiple of 8
 *   Clamped to [8, 255]: the array keeps a one-byte length counter
 */
template <typename T>
constexpr std::size_t default_node_capacity() {
  constexpr std::size_t target_bytes = 512;
  constexpr std::size_t calculated = target_bytes / sizeof(T);

  // Round to nearest multiple of 8
  constexpr std::size_t rounded = ((calculated + 4) / 8) * 8;

  return std::clamp(rounded, static_cast<std::size_t>(8),
                    static_cast<std::size_t>(255));
}

/**
 * An ordered multiset stored as a singly linked chain of fixed-capacity
 * sorted arrays. Concatenating the nodes from head to tail yields every
 * inserted element in ascending order; duplicates are kept.
 *
 * Insertion cascades: an element is placed in the first node whose range
 * can take it. A full node either displaces its maximum onto the next node,
 * forwards an element larger than its range, or has a new single-element
 * node spliced in front of it when the element is smaller than its range.
 * Nodes are never split, merged or removed, and elements are never erased.
 *
 * All chain walks (insert, find, copy, teardown) are loops over a cursor,
 * so stack depth does not grow with chain length.
 *
 * @tparam T The element type
 * @tparam NodeCapacity Maximum elements per node, between 1 and 255
 *         (defaults to a heuristic targeting ~512 bytes per node)
 * @tparam Compare The comparison function object type (defaults to
 *         std::less<T>)
 * @tparam Allocator The allocator type; rebound to allocate chain nodes
 */
template <typename T, std::size_t NodeCapacity = default_node_capacity<T>(),
          typename Compare = std::less<T>,
          typename Allocator = std::allocator<T>>
  requires ComparatorCompatible<T, Compare>
class sorted_chain {
 public:
  // Type aliases
  using value_type = T;
  using size_type = std::size_t;
  using value_compare = Compare;
  using allocator_type = Allocator;
  using node_array = bounded_sorted_array<T, NodeCapacity, Compare>;

  /**
   * One link of the chain. Owns its array and, exclusively, the next node.
   * A missing successor is a null pointer, so it costs no more than a
   * present one.
   */
  struct chain_node {
    node_array items;
    chain_node* next;

    explicit chain_node(T&& item) : items(std::move(item)), next(nullptr) {}
    explicit chain_node(const node_array& source)
        : items(source), next(nullptr) {}
    explicit chain_node(node_array&& source)
        : items(std::move(source)), next(nullptr) {}

    // Nodes are managed in-place by sorted_chain
    chain_node(const chain_node&) = delete;
    chain_node& operator=(const chain_node&) = delete;
    chain_node(chain_node&&) = delete;
    chain_node& operator=(chain_node&&) = delete;
  };

  /**
   * Default constructor - creates an empty chain.
   *
   * @param alloc Allocator to use for node allocation
   */
  explicit sorted_chain(const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates every node, walking the chain iteratively.
   */
  ~sorted_chain();

  /**
   * Copy constructor - clones the chain node by node, preserving its shape.
   * Complexity: O(n)
   */
  sorted_chain(const sorted_chain& other);

  /**
   * Copy constructor using the given allocator for the cloned nodes.
   */
  sorted_chain(const sorted_chain& other, const Allocator& alloc);

  /**
   * Copy assignment operator - copy-and-swap. The allocator is replaced
   * only if it propagates on copy assignment.
   * Complexity: O(n + m)
   */
  sorted_chain& operator=(const sorted_chain& other);

  /**
   * Move constructor - takes ownership of another chain's nodes.
   * Leaves other empty.
   * Complexity: O(1)
   */
  sorted_chain(sorted_chain&& other) noexcept;

  /**
   * Move assignment operator - releases this chain's nodes and takes
   * ownership of other's. Leaves other empty.
   * If the allocator does not propagate and the two allocators differ, the
   * elements are moved into freshly allocated nodes instead.
   * Complexity: O(n) where n is this chain's node count
   */
  sorted_chain& operator=(sorted_chain&& other) noexcept(
      nothrow_move_assignable);

  /**
   * Inserts an element, keeping the chain globally sorted.
   * Equal elements are all stored; size() grows by exactly one.
   * If a node allocation throws, the chain is left unchanged.
   *
   * Complexity: O(k + NodeCapacity) where k is the number of nodes visited
   */
  void insert(const T& item) { insert_impl(T(item)); }
  void insert(T&& item) { insert_impl(std::move(item)); }

  /**
   * Finds the first element equal to item.
   * The position counts elements across all nodes, so it is the index
   * at() accepts, not an offset within a single node.
   *
   * @param item The element to search for
   * @return The element's position in sorted order, or std::nullopt
   */
  std::optional<size_type> find(const T& item) const;

  bool contains(const T& item) const { return find(item).has_value(); }

  /**
   * Element at a position in sorted order.
   * Complexity: O(number of nodes)
   *
   * @throws std::out_of_range if pos >= size()
   */
  const T& at(size_type pos) const;

  /**
   * Number of inserted elements (duplicates counted).
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  [[nodiscard]] bool empty() const { return size_ == 0; }

  [[nodiscard]] size_type node_count() const { return node_count_; }

  static constexpr size_type node_capacity() { return NodeCapacity; }

  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Calls fn(const node_array&) for each node from head to tail.
   */
  template <typename Fn>
  void for_each_node(Fn&& fn) const {
    for (const chain_node* node = head_; node != nullptr; node = node->next) {
      fn(node->items);
    }
  }

  void swap(sorted_chain& other) noexcept;

 private:
  using node_allocator_type = typename std::allocator_traits<
      Allocator>::template rebind_alloc<chain_node>;
  using node_alloc_traits = std::allocator_traits<node_allocator_type>;

  static constexpr bool nothrow_move_assignable =
      node_alloc_traits::propagate_on_container_move_assignment::value ||
      node_alloc_traits::is_always_equal::value;

  /**
   * Cascading insert. Walks a cursor over the owning links so that a new
   * node can be spliced in front of the current one by relinking.
   */
  void insert_impl(T item);

  template <typename... Args>
  chain_node* allocate_node(Args&&... args);

  template <typename... Args>
  chain_node* construct_node(chain_node* storage, Args&&... args);

  void deallocate_node(chain_node* node);

  // Deallocates all nodes and resets to the empty state
  void deallocate_chain();

  void swap_state(sorted_chain& other) noexcept;

  chain_node* head_;
  size_type size_;
  size_type node_count_;
  node_allocator_type node_alloc_;
  [[no_unique_address]] Compare comp_;
};

template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
void swap(sorted_chain<T, NodeCapacity, Compare, Allocator>& lhs,
          sorted_chain<T, NodeCapacity, Compare, Allocator>& rhs) noexcept {
  lhs.swap(rhs);
}

/**
 * Debug dump: one bracketed list per node, [[a, b], [c, d]].
 * Not a stable format.
 */
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
std::ostream& operator<<(
    std::ostream& os,
    const sorted_chain<T, NodeCapacity, Compare, Allocator>& chain) {
  os << '[';
  bool first = true;
  chain.for_each_node([&](const auto& items) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << items;
  });
  return os << ']';
}

/**
 * Multi-line debug dump: a summary line, then one line per node with its
 * index, fill level, range and contents.
 */
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
void print_structure(
    std::ostream& os,
    const sorted_chain<T, NodeCapacity, Compare, Allocator>& chain) {
  os << "sorted_chain size=" << chain.size()
     << " nodes=" << chain.node_count() << " capacity=" << NodeCapacity
     << '\n';
  std::size_t index = 0;
  chain.for_each_node([&](const auto& items) {
    os << "  node " << index++ << " (" << items.size() << '/'
       << items.capacity() << ") range=[" << items.min() << ", "
       << items.max() << "] " << items << '\n';
  });
}

}  // namespace kressler::chain_containers

// Include implementation
#include "sorted_chain.ipp"
