// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <span>

namespace kressler::managed_containers {

/**
 * Rotate a span left by n positions.
 *
 * Postcondition: for a span of length L, s[i] == old s[(i + n) % L] for every
 * i in [0, L). The first n elements end up at the back, in order.
 *
 * Elements are only moved (never copied), and nothing is allocated.
 *
 * @param s The span to rotate in place
 * @param n Rotation amount, 0 <= n <= s.size()
 */
template <typename T>
void rotate_left(std::span<T> s, std::size_t n) {
  assert(n <= s.size() && "Rotation amount exceeds span length");
  if (n == 0 || n == s.size()) {
    return;
  }
  std::rotate(s.begin(), s.begin() + n, s.end());
}

/**
 * Rotate a span right by n positions.
 *
 * Postcondition: for a span of length L, s[(i + n) % L] == old s[i] for every
 * i in [0, L). The last n elements end up at the front, in order.
 *
 * @param s The span to rotate in place
 * @param n Rotation amount, 0 <= n <= s.size()
 */
template <typename T>
void rotate_right(std::span<T> s, std::size_t n) {
  assert(n <= s.size() && "Rotation amount exceeds span length");
  if (n == 0 || n == s.size()) {
    return;
  }
  rotate_left(s, s.size() - n);
}

}  // namespace kressler::managed_containers
