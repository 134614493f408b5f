// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <new>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace kressler::chain_containers {

// Concept to enforce that a comparator is compatible with an element type
template <typename T, typename Compare>
concept ComparatorCompatible = requires(Compare comp, T a, T b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

// Side of a buffer's [min, max] range on which an element falls
enum class AbsoluteOrdering { Less, Greater };

// Outcome of bounded_sorted_array::insert
enum class InsertStatus {
  Absorbed,  // Placed without displacing anything
  Evicted,   // Placed; the previous maximum was pushed out
  Rejected   // Buffer full and element outside [min, max]; handed back
};

// Outcome of bounded_sorted_array::find
enum class FindStatus {
  Found,      // An equal element exists at index
  NotFound,   // Within [min, max] but absent
  OutOfRange  // Below min or above max, see side
};

/**
 * Result of inserting into a bounded_sorted_array.
 *
 * For Evicted, `item` holds the former maximum. For Rejected, `item` holds
 * the element that was passed in, unchanged, and `side` tells on which side
 * of the buffer's range it lies. For Absorbed, `item` is empty.
 */
template <typename T>
struct insert_result {
  InsertStatus status = InsertStatus::Absorbed;
  std::optional<T> item;
  AbsoluteOrdering side = AbsoluteOrdering::Greater;

  static insert_result absorbed() { return insert_result{}; }

  static insert_result evicted(T&& former_max) {
    return insert_result{InsertStatus::Evicted, std::move(former_max),
                         AbsoluteOrdering::Greater};
  }

  static insert_result rejected(T&& item, AbsoluteOrdering side) {
    return insert_result{InsertStatus::Rejected, std::move(item), side};
  }
};

/**
 * Result of looking up an element in a bounded_sorted_array.
 * `index` is meaningful only for Found, `side` only for OutOfRange.
 */
struct find_result {
  FindStatus status = FindStatus::NotFound;
  std::size_t index = 0;
  AbsoluteOrdering side = AbsoluteOrdering::Greater;

  bool found() const { return status == FindStatus::Found; }
};

/**
 * A fixed-capacity, never-empty array that keeps its elements in ascending
 * order. Elements live inline in raw storage; only the first size() slots
 * hold constructed objects. Duplicates are allowed and kept adjacent.
 *
 * When full, insert() does not fail: it either displaces the current
 * maximum (element inside the range) or hands the element back with the
 * side it falls on (element outside the range). The caller decides where
 * the overflow goes next.
 *
 * @tparam T The element type
 * @tparam Length The capacity, between 1 and 255
 * @tparam Compare The comparison function object type (must be
 * default-constructible)
 */
template <typename T, std::size_t Length, typename Compare = std::less<T>>
  requires ComparatorCompatible<T, Compare>
class bounded_sorted_array {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using value_compare = Compare;
  using const_iterator = const T*;

  static_assert(Length > 0 && Length <= UINT8_MAX,
                "bounded_sorted_array capacity must be between 1 and 255");

  /**
   * Creates an array holding exactly one element.
   *
   * @param item The initial element
   */
  explicit bounded_sorted_array(const T& item);
  explicit bounded_sorted_array(T&& item);

  /**
   * Copy constructor - copy-constructs each active element
   * Complexity: O(n)
   */
  bounded_sorted_array(const bounded_sorted_array& other);

  /**
   * Move constructor - move-constructs each active element.
   * The source keeps its size and is left holding moved-from elements.
   * Complexity: O(n)
   */
  bounded_sorted_array(bounded_sorted_array&& other) noexcept(
      std::is_nothrow_move_constructible_v<T>);

  bounded_sorted_array& operator=(const bounded_sorted_array& other);
  bounded_sorted_array& operator=(bounded_sorted_array&& other) noexcept(
      std::is_nothrow_move_constructible_v<T>);

  ~bounded_sorted_array() { destroy_elements(); }

  /**
   * Insert an element preserving ascending order.
   *
   * Checks max() then min() first so appends and prepends skip the binary
   * search. Inside the range the position is found with lower_bound and
   * trailing elements shift right by one.
   *
   * @param item The element to insert
   * @return Absorbed if there was room; Evicted with the former maximum if
   * the array was full and the item fell inside [min, max]; Rejected with
   * the item and its side if the array was full and the item fell outside
   * @throws std::runtime_error if the computed insertion index is out of
   * bounds (broken internal invariant)
   */
  insert_result<T> insert(T item);

  /**
   * Binary search for an element.
   *
   * @param item The element to search for
   * @return Found with the index of the first equal element, NotFound if
   * the item lies within [min, max] but is absent, OutOfRange with the side
   * otherwise
   */
  find_result find(const T& item) const;

  bool contains(const T& item) const { return find(item).found(); }

  // Always defined: the array is never empty
  const T& min() const { return data()[0]; }
  const T& max() const { return data()[size_ - 1]; }

  const T& operator[](size_type index) const {
    assert(index < size_ && "Index out of bounds");
    return data()[index];
  }

  const T* data() const {
    return std::launder(reinterpret_cast<const T*>(storage_));
  }

  const_iterator begin() const { return data(); }
  const_iterator end() const { return data() + size_; }

  size_type size() const { return size_; }
  static constexpr size_type capacity() { return Length; }
  bool full() const { return size_ == Length; }

  friend bool operator==(const bounded_sorted_array& lhs,
                         const bounded_sorted_array& rhs) {
    return lhs.size_ == rhs.size_ &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin());
  }

 private:
  T* slots() { return std::launder(reinterpret_cast<T*>(storage_)); }

  // Append past the current maximum. Requires !full().
  void push_back(T&& item);

  /**
   * Insert at index, shifting [index, size) right by one.
   * If the array is full, the maximum falls off the end and is returned.
   * Requires index < size(); appends go through push_back.
   */
  std::optional<T> insert_at(size_type index, T&& item);

  void destroy_elements() {
    if constexpr (!std::is_trivially_destructible_v<T>) {
      std::destroy_n(slots(), size_);
    }
  }

  alignas(T) std::byte storage_[sizeof(T) * Length];
  std::uint8_t size_;
  [[no_unique_address]] Compare comp_;
};

/**
 * Debug dump: [a, b, c]. Not a stable format.
 */
template <typename T, std::size_t Length, typename Compare>
std::ostream& operator<<(std::ostream& os,
                         const bounded_sorted_array<T, Length, Compare>& arr) {
  os << '[';
  for (std::size_t i = 0; i < arr.size(); ++i) {
    if (i != 0) {
      os << ", ";
    }
    os << arr[i];
  }
  return os << ']';
}

}  // namespace kressler::chain_containers

// Include implementation
#include "bounded_sorted_array.ipp"
