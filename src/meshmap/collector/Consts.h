/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace meshmap {
namespace collector {

class CollectorConsts {
 public:
  // --- OLSR daemon ---
  // constant-initialized, it is a gflags default
  static constexpr const char* kOlsrDefaultHost{"localnode.local.mesh"};
  const static int kOlsrDefaultPort;
  // Label used by the daemon for links that cannot currently be used
  const static std::string kOlsrUnreachableLabel;
  // Finite stand-in for an unreachable link's cost
  const static double kOlsrUnreachableCost;

  // --- Node status endpoint ---
  const static int kNodeStatusPort;
  const static std::string kNodeStatusPath;
  // Firmware below this API version does not report link cost itself
  const static std::pair<int, int> kLinkCostApiVersion;

  // --- Names ---
  const static std::string kMeshDomainSuffix;
  const static std::string kUnknownInterface;

  // --- Timeouts ---
  const static std::chrono::milliseconds kOlsrReadTimeout;
};

} // namespace collector
} // namespace meshmap
