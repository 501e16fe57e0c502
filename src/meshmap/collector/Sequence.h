/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>

namespace meshmap {
namespace collector {

/**
 * A lazily produced, single-pass sequence of values.
 *
 * Implementations may block inside next() while the next value is produced.
 */
template <typename T>
class Sequence {
 public:
  virtual ~Sequence() = default;

  // Returns the next value, or std::nullopt once the sequence has ended.
  // Calling next() again after the end keeps returning std::nullopt.
  virtual std::optional<T> next() = 0;
};

} // namespace collector
} // namespace meshmap
