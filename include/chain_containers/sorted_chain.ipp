// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// Implementation file for sorted_chain.hpp
// This file contains all method implementations for the sorted_chain class.

namespace kressler::chain_containers {

// Constructor
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>::sorted_chain(
    const Allocator& alloc)
    : head_(nullptr), size_(0), node_count_(0), node_alloc_(alloc), comp_() {}

// Destructor
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>::~sorted_chain() {
  deallocate_chain();
}

// Copy constructor
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>::sorted_chain(
    const sorted_chain& other)
    : sorted_chain(other,
                   Allocator(node_alloc_traits::
                                 select_on_container_copy_construction(
                                     other.node_alloc_))) {}

// Allocator-extended copy constructor
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>::sorted_chain(
    const sorted_chain& other, const Allocator& alloc)
    : head_(nullptr),
      size_(0),
      node_count_(0),
      node_alloc_(alloc),
      comp_(other.comp_) {
  // Clone each node's array in order; the tail link is the cursor
  chain_node** tail = &head_;
  try {
    for (const chain_node* src = other.head_; src != nullptr;
         src = src->next) {
      chain_node* node = allocate_node(src->items);
      *tail = node;
      tail = &node->next;
      ++node_count_;
    }
  } catch (...) {
    deallocate_chain();
    throw;
  }
  size_ = other.size_;
}

// Copy assignment operator
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>&
sorted_chain<T, NodeCapacity, Compare, Allocator>::operator=(
    const sorted_chain& other) {
  if (this != &other) {
    // The copy is built with the allocator this chain ends up holding, so
    // exchanging every member hands the old nodes to the allocator that
    // made them
    if constexpr (node_alloc_traits::propagate_on_container_copy_assignment::
                      value) {
      sorted_chain copy(other, Allocator(other.node_alloc_));
      swap_state(copy);
    } else {
      sorted_chain copy(other, Allocator(node_alloc_));
      swap_state(copy);
    }
  }
  return *this;
}

// Move constructor
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>::sorted_chain(
    sorted_chain&& other) noexcept
    : head_(other.head_),
      size_(other.size_),
      node_count_(other.node_count_),
      node_alloc_(std::move(other.node_alloc_)),
      comp_(std::move(other.comp_)) {
  // Leave other in a valid empty state
  other.head_ = nullptr;
  other.size_ = 0;
  other.node_count_ = 0;
}

// Move assignment operator
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
sorted_chain<T, NodeCapacity, Compare, Allocator>&
sorted_chain<T, NodeCapacity, Compare, Allocator>::operator=(
    sorted_chain&& other) noexcept(nothrow_move_assignable) {
  if (this == &other) {
    return *this;
  }

  if constexpr (!node_alloc_traits::propagate_on_container_move_assignment::
                    value &&
                !node_alloc_traits::is_always_equal::value) {
    if (!(node_alloc_ == other.node_alloc_)) {
      // Other's nodes cannot be released by this allocator: move the
      // elements into nodes of our own
      sorted_chain moved{Allocator(node_alloc_)};
      moved.comp_ = other.comp_;
      chain_node** tail = &moved.head_;
      for (chain_node* src = other.head_; src != nullptr; src = src->next) {
        chain_node* node = moved.allocate_node(std::move(src->items));
        *tail = node;
        tail = &node->next;
        ++moved.node_count_;
      }
      moved.size_ = other.size_;
      swap_state(moved);
      other.deallocate_chain();
      return *this;
    }
  }

  deallocate_chain();

  head_ = other.head_;
  size_ = other.size_;
  node_count_ = other.node_count_;
  if constexpr (node_alloc_traits::propagate_on_container_move_assignment::
                    value) {
    node_alloc_ = std::move(other.node_alloc_);
  }
  comp_ = std::move(other.comp_);

  other.head_ = nullptr;
  other.size_ = 0;
  other.node_count_ = 0;
  return *this;
}

// swap - allocators are exchanged only when they propagate on swap;
// otherwise they must compare equal
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
void sorted_chain<T, NodeCapacity, Compare, Allocator>::swap(
    sorted_chain& other) noexcept {
  using std::swap;
  assert((node_alloc_traits::propagate_on_container_swap::value ||
          node_alloc_ == other.node_alloc_) &&
         "swap requires equal allocators unless they propagate");
  swap(head_, other.head_);
  swap(size_, other.size_);
  swap(node_count_, other.node_count_);
  if constexpr (node_alloc_traits::propagate_on_container_swap::value) {
    swap(node_alloc_, other.node_alloc_);
  }
  swap(comp_, other.comp_);
}

// swap_state - exchanges every member, allocator included
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
void sorted_chain<T, NodeCapacity, Compare, Allocator>::swap_state(
    sorted_chain& other) noexcept {
  using std::swap;
  swap(head_, other.head_);
  swap(size_, other.size_);
  swap(node_count_, other.node_count_);
  swap(node_alloc_, other.node_alloc_);
  swap(comp_, other.comp_);
}

// insert_impl
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
void sorted_chain<T, NodeCapacity, Compare, Allocator>::insert_impl(T item) {
  if (head_ == nullptr) {
    head_ = allocate_node(std::move(item));
    ++node_count_;
    ++size_;
    return;
  }

  // Storage for the one node this insert may add. It is reserved before the
  // first eviction, so a failed allocation leaves the chain unchanged.
  chain_node* spare = nullptr;
  auto new_node = [&](T&& value) {
    chain_node* storage = spare != nullptr
                              ? std::exchange(spare, nullptr)
                              : node_alloc_traits::allocate(node_alloc_, 1);
    chain_node* node = construct_node(storage, std::move(value));
    ++node_count_;
    return node;
  };

  try {
    // link is the owning pointer of the node under the cursor: head_ or the
    // previous node's next
    chain_node** link = &head_;
    while (true) {
      chain_node* node = *link;

      // Past this node's max and not below the successor's min: the element
      // belongs to the successor's range, even if this node still has room
      if (node->next != nullptr && comp_(node->items.max(), item) &&
          !comp_(item, node->next->items.min())) {
        link = &node->next;
        continue;
      }

      // A full node evicts when the element falls inside its range
      if (spare == nullptr && node->items.full() &&
          !comp_(node->items.max(), item) && !comp_(item, node->items.min())) {
        spare = node_alloc_traits::allocate(node_alloc_, 1);
      }

      insert_result<T> result = node->items.insert(std::move(item));

      if (result.status == InsertStatus::Absorbed) {
        break;
      }

      if (result.status == InsertStatus::Rejected &&
          result.side == AbsoluteOrdering::Less) {
        // Below this node's range: splice a new node in front of it. The old
        // node keeps its array and successor, one link deeper.
        chain_node* spliced = new_node(std::move(*result.item));
        spliced->next = node;
        *link = spliced;
        break;
      }

      // Rejected above the range, or the former maximum was evicted: either
      // way the handed-back element continues down the chain
      if (node->next == nullptr) {
        node->next = new_node(std::move(*result.item));
        break;
      }
      item = std::move(*result.item);
      link = &node->next;
    }
  } catch (...) {
    if (spare != nullptr) {
      node_alloc_traits::deallocate(node_alloc_, spare, 1);
    }
    throw;
  }

  if (spare != nullptr) {
    node_alloc_traits::deallocate(node_alloc_, spare, 1);
  }
  ++size_;
}

// find
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
std::optional<typename sorted_chain<T, NodeCapacity, Compare,
                                    Allocator>::size_type>
sorted_chain<T, NodeCapacity, Compare, Allocator>::find(const T& item) const {
  size_type offset = 0;
  for (const chain_node* node = head_; node != nullptr; node = node->next) {
    const find_result result = node->items.find(item);
    switch (result.status) {
      case FindStatus::Found:
        return offset + result.index;
      case FindStatus::NotFound:
        return std::nullopt;
      case FindStatus::OutOfRange:
        // Every later node starts at or above this node's max
        if (result.side == AbsoluteOrdering::Less) {
          return std::nullopt;
        }
        break;
    }
    offset += node->items.size();
  }
  return std::nullopt;
}

// at
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
const T& sorted_chain<T, NodeCapacity, Compare, Allocator>::at(
    size_type pos) const {
  if (pos >= size_) {
    throw std::out_of_range("sorted_chain::at: position out of range");
  }
  const chain_node* node = head_;
  while (pos >= node->items.size()) {
    pos -= node->items.size();
    node = node->next;
  }
  return node->items[pos];
}

// allocate_node
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename... Args>
typename sorted_chain<T, NodeCapacity, Compare, Allocator>::chain_node*
sorted_chain<T, NodeCapacity, Compare, Allocator>::allocate_node(
    Args&&... args) {
  return construct_node(node_alloc_traits::allocate(node_alloc_, 1),
                        std::forward<Args>(args)...);
}

// construct_node - takes ownership of storage; releases it if construction
// throws
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
template <typename... Args>
typename sorted_chain<T, NodeCapacity, Compare, Allocator>::chain_node*
sorted_chain<T, NodeCapacity, Compare, Allocator>::construct_node(
    chain_node* storage, Args&&... args) {
  try {
    node_alloc_traits::construct(node_alloc_, storage,
                                 std::forward<Args>(args)...);
  } catch (...) {
    node_alloc_traits::deallocate(node_alloc_, storage, 1);
    throw;
  }
  return storage;
}

// deallocate_node
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
void sorted_chain<T, NodeCapacity, Compare, Allocator>::deallocate_node(
    chain_node* node) {
  node_alloc_traits::destroy(node_alloc_, node);
  node_alloc_traits::deallocate(node_alloc_, node, 1);
}

// deallocate_chain - iterative so long chains cannot exhaust the stack
template <typename T, std::size_t NodeCapacity, typename Compare,
          typename Allocator>
  requires ComparatorCompatible<T, Compare>
void sorted_chain<T, NodeCapacity, Compare, Allocator>::deallocate_chain() {
  chain_node* node = head_;
  while (node != nullptr) {
    chain_node* next = node->next;
    deallocate_node(node);
    node = next;
  }

  head_ = nullptr;
  size_ = 0;
  node_count_ = 0;
}

}  // namespace kressler::chain_containers
