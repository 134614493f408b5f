// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// bounded_sorted_array.ipp - Implementation details for bounded_sorted_array
// This file is included at the end of bounded_sorted_array.hpp
// DO NOT include this file directly

namespace kressler::chain_containers {

// ============================================================================
// Constructors and Assignment Operators
// ============================================================================

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>::bounded_sorted_array(const T& item)
    : size_(1), comp_() {
  std::construct_at(slots(), item);
}

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>::bounded_sorted_array(T&& item)
    : size_(1), comp_() {
  std::construct_at(slots(), std::move(item));
}

/**
 * Copy constructor - creates a deep copy of another array
 * Complexity: O(n) where n is the size of the other array
 */
template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>::bounded_sorted_array(
    const bounded_sorted_array& other)
    : size_(0), comp_(other.comp_) {
  T* dst = slots();
  const T* src = other.data();
  try {
    for (; size_ < other.size_; ++size_) {
      std::construct_at(dst + size_, src[size_]);
    }
  } catch (...) {
    destroy_elements();
    throw;
  }
}

/**
 * Move constructor - move-constructs the active elements.
 * Note: Due to inline storage this is O(n); the source stays non-empty and
 * holds moved-from elements.
 */
template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>::bounded_sorted_array(
    bounded_sorted_array&& other) noexcept(
    std::is_nothrow_move_constructible_v<T>)
    : size_(0), comp_(std::move(other.comp_)) {
  T* dst = slots();
  T* src = other.slots();
  if constexpr (std::is_trivially_copyable_v<T>) {
    std::memcpy(static_cast<void*>(dst), src, other.size_ * sizeof(T));
    size_ = other.size_;
  } else {
    try {
      for (; size_ < other.size_; ++size_) {
        std::construct_at(dst + size_, std::move(src[size_]));
      }
    } catch (...) {
      destroy_elements();
      throw;
    }
  }
}

/**
 * Copy assignment - assigns the common prefix, then constructs or destroys
 * the remaining slots so exactly other.size() slots stay constructed.
 */
template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>&
bounded_sorted_array<T, Length, Compare>::operator=(
    const bounded_sorted_array& other) {
  if (this == &other) {
    return *this;
  }
  T* dst = slots();
  const T* src = other.data();
  const size_type common = std::min<size_type>(size_, other.size_);
  std::copy(src, src + common, dst);
  if (other.size_ > size_) {
    for (; size_ < other.size_; ++size_) {
      std::construct_at(dst + size_, src[size_]);
    }
  } else {
    if constexpr (!std::is_trivially_destructible_v<T>) {
      std::destroy(dst + other.size_, dst + size_);
    }
    size_ = other.size_;
  }
  comp_ = other.comp_;
  return *this;
}

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
bounded_sorted_array<T, Length, Compare>&
bounded_sorted_array<T, Length, Compare>::operator=(
    bounded_sorted_array&& other) noexcept(
    std::is_nothrow_move_constructible_v<T>) {
  if (this == &other) {
    return *this;
  }
  T* dst = slots();
  T* src = other.slots();
  const size_type common = std::min<size_type>(size_, other.size_);
  std::move(src, src + common, dst);
  if (other.size_ > size_) {
    for (; size_ < other.size_; ++size_) {
      std::construct_at(dst + size_, std::move(src[size_]));
    }
  } else {
    if constexpr (!std::is_trivially_destructible_v<T>) {
      std::destroy(dst + other.size_, dst + size_);
    }
    size_ = other.size_;
  }
  comp_ = std::move(other.comp_);
  return *this;
}

// ============================================================================
// Insert and Find Operations
// ============================================================================

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
insert_result<T> bounded_sorted_array<T, Length, Compare>::insert(T item) {
  // Fast path: beyond the current maximum
  if (comp_(max(), item)) {
    if (full()) {
      return insert_result<T>::rejected(std::move(item),
                                        AbsoluteOrdering::Greater);
    }
    push_back(std::move(item));
    return insert_result<T>::absorbed();
  }

  // Fast path: below the current minimum
  if (comp_(item, min())) {
    if (full()) {
      return insert_result<T>::rejected(std::move(item),
                                        AbsoluteOrdering::Less);
    }
    insert_at(0, std::move(item));
    return insert_result<T>::absorbed();
  }

  // min <= item <= max, so lower_bound lands strictly before end()
  const T* first = data();
  const size_type idx = static_cast<size_type>(
      std::lower_bound(first, first + size_, item, comp_) - first);

  std::optional<T> evicted = insert_at(idx, std::move(item));
  if (evicted.has_value()) {
    return insert_result<T>::evicted(std::move(*evicted));
  }
  return insert_result<T>::absorbed();
}

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
find_result bounded_sorted_array<T, Length, Compare>::find(
    const T& item) const {
  if (comp_(max(), item)) {
    return find_result{FindStatus::OutOfRange, 0, AbsoluteOrdering::Greater};
  }
  if (comp_(item, min())) {
    return find_result{FindStatus::OutOfRange, 0, AbsoluteOrdering::Less};
  }

  const T* first = data();
  const T* it = std::lower_bound(first, first + size_, item, comp_);
  // In range, so it != end; equal iff !(item < *it)
  if (!comp_(item, *it)) {
    return find_result{FindStatus::Found, static_cast<size_type>(it - first),
                       AbsoluteOrdering::Greater};
  }
  return find_result{FindStatus::NotFound, 0, AbsoluteOrdering::Greater};
}

// ============================================================================
// Internal Helpers
// ============================================================================

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
void bounded_sorted_array<T, Length, Compare>::push_back(T&& item) {
  assert(!full() && "push_back on a full array");
  assert(!comp_(item, max()) && "push_back would break sorted order");
  std::construct_at(slots() + size_, std::move(item));
  ++size_;
}

template <typename T, std::size_t Length, typename Compare>
  requires ComparatorCompatible<T, Compare>
std::optional<T> bounded_sorted_array<T, Length, Compare>::insert_at(
    size_type index, T&& item) {
  if (index >= size_) {
    throw std::runtime_error(
        "Cannot insert: index is past the last element of the array");
  }

  T* first = slots();
  const size_type last = size_ - 1;
  std::optional<T> evicted;

  if (full()) {
    // The maximum falls off the end; its slot is reused by the shift
    evicted.emplace(std::move(first[last]));
  } else {
    // Open a new slot at the end from the current maximum
    std::construct_at(first + size_, std::move(first[last]));
    ++size_;
  }

  // a, b, c, d, e  insert X at 1 (full)  ->  a, X, b, c, d  (e evicted)
  std::move_backward(first + index, first + last, first + last + 1);
  first[index] = std::move(item);

  return evicted;
}

}  // namespace kressler::chain_containers
