// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

#include "config.hpp"

#if MANAGED_CONTAINERS_HAS_ALLOC
#include <vector>
#endif

namespace kressler::managed_containers {

/**
 * A contiguous sequence that is either borrowed from the caller (a mutable
 * span) or owned (a std::vector), chosen at construction.
 *
 * Both alternatives expose the same element access; the owned alternative is
 * compiled out when MANAGED_CONTAINERS_NO_ALLOC is defined. Length is fixed
 * for the borrowed alternative.
 *
 * @tparam T The element type
 */
template <typename T>
class managed_slice {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using iterator = T*;
  using const_iterator = const T*;

  // Construction is implicit so call sites can pass storage directly.

  managed_slice(std::span<T> elements)
      : storage_(std::in_place_type<std::span<T>>, elements) {}

  template <std::size_t N>
  managed_slice(std::array<T, N>& elements)
      : managed_slice(std::span<T>(elements)) {}

  template <std::size_t N>
  managed_slice(T (&elements)[N]) : managed_slice(std::span<T>(elements)) {}

#if MANAGED_CONTAINERS_HAS_ALLOC
  managed_slice(std::vector<T>&& elements)
      : storage_(std::in_place_type<std::vector<T>>, std::move(elements)) {}
#endif

  managed_slice(managed_slice&&) noexcept = default;
  managed_slice& operator=(managed_slice&&) noexcept = default;

  T* data() {
    return std::visit([](auto& s) -> T* { return s.data(); }, storage_);
  }
  const T* data() const {
    return std::visit([](const auto& s) -> const T* { return s.data(); },
                      storage_);
  }

  size_type size() const {
    return std::visit([](const auto& s) -> size_type { return s.size(); },
                      storage_);
  }
  bool empty() const { return size() == 0; }

  T& operator[](size_type i) {
    assert(i < size() && "Index out of bounds");
    return data()[i];
  }
  const T& operator[](size_type i) const {
    assert(i < size() && "Index out of bounds");
    return data()[i];
  }

  iterator begin() { return data(); }
  iterator end() { return data() + size(); }
  const_iterator begin() const { return data(); }
  const_iterator end() const { return data() + size(); }

  operator std::span<T>() { return {data(), size()}; }
  operator std::span<const T>() const { return {data(), size()}; }

  bool is_owned() const {
    return !std::holds_alternative<std::span<T>>(storage_);
  }

 private:
#if MANAGED_CONTAINERS_HAS_ALLOC
  using storage_type = std::variant<std::span<T>, std::vector<T>>;
#else
  using storage_type = std::variant<std::span<T>>;
#endif

  storage_type storage_;
};

}  // namespace kressler::managed_containers
