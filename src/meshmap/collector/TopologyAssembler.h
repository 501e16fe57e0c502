/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "NodePoller.h"
#include "OlsrStream.h"
#include "SystemInfo.h"

namespace meshmap {
namespace collector {

/**
 * One consistent view of the network built from a single polling cycle.
 */
struct NetworkInfo {
  // Successfully polled nodes, ordered by address
  std::vector<SystemInfo> nodes;
  // Merged links of all polled nodes
  std::vector<LinkInfo> links;
  // Failed poll outcomes, ordered by address
  std::vector<NodeResult> errors;
  // Summary counters ("node results", "errors (HTTP Error)", ...)
  std::map<std::string, int64_t> counters;
  // Counters of the OLSR stream session
  std::map<std::string, int64_t> olsrStats;
  // Wall-clock time spent polling nodes and draining links
  std::chrono::steady_clock::duration pollingDuration{};
};

/**
 * Merges node-reported links with links from the OLSR topology export.
 *
 * Links reported by a node through its status endpoint always win. The OLSR
 * export is used to fill in the cost on firmware too old to report it, and
 * as the only source of links for nodes that report none.
 */
class TopologyAssembler {
 public:
  explicit TopologyAssembler(NodePoller& poller);

  /**
   * Poll every node in 'stream' while draining its links, then merge.
   *
   * Exceptions from the stream or the poller propagate; per-node failures
   * end up in NetworkInfo::errors.
   */
  NetworkInfo assemble(OlsrStream& stream);

  /**
   * Merge already collected poll results with OLSR links.
   *
   * The output does not depend on the order of 'results'.
   */
  static NetworkInfo merge(
      std::vector<NodeResult> results, const std::vector<OlsrLink>& olsrLinks);

 private:
  // Build the links of a node that reports none from OLSR data
  static std::vector<LinkInfo> olsrLinksFor(
      const SystemInfo& node,
      const std::vector<OlsrLink>& olsrLinks,
      const std::unordered_map<std::string, std::string>& ipNameMap);

  NodePoller& poller_;
};

} // namespace collector
} // namespace meshmap
