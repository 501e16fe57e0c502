/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TimeUtils.h"

#include <folly/Format.h>

namespace meshmap {

std::chrono::steady_clock::time_point
TimeUtils::getSteadyTimePoint() {
  return std::chrono::steady_clock::now();
}

double
TimeUtils::toSeconds(std::chrono::steady_clock::duration duration) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(duration)
      .count();
}

std::chrono::milliseconds
TimeUtils::timeUntilNextPeriod(
    std::chrono::milliseconds elapsed, std::chrono::milliseconds period) {
  if (period.count() <= 0) {
    return period;
  }
  if (elapsed.count() < 0) {
    elapsed = std::chrono::milliseconds(0);
  }
  return period - (elapsed % period);
}

std::string
TimeUtils::formatDuration(std::chrono::steady_clock::duration duration) {
  const double seconds = toSeconds(duration);
  return folly::sformat("{:.2f}s ({:.2f}m)", seconds, seconds / 60);
}

} // namespace meshmap
