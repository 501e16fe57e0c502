/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <string>

namespace meshmap {

/**
 * Time-related utilities for the collection cadence.
 */
class TimeUtils {
 public:
  /** Returns a time point representing steady_clock's current point in time. */
  static std::chrono::steady_clock::time_point getSteadyTimePoint();

  /** Returns the number of seconds (fractional) in the given duration. */
  static double toSeconds(std::chrono::steady_clock::duration duration);

  /**
   * Returns the time left until the next period boundary, measured from the
   * start of the current period: period - (elapsed mod period).
   *
   * A run that overshoots one or more periods sleeps only until the next
   * boundary, so the schedule does not drift. Returns 'period' when
   * 'period' is not positive.
   */
  static std::chrono::milliseconds timeUntilNextPeriod(
      std::chrono::milliseconds elapsed, std::chrono::milliseconds period);

  /** Format a duration as e.g. "12.34s (0.21m)" for logging. */
  static std::string formatDuration(
      std::chrono::steady_clock::duration duration);
};

} // namespace meshmap
