/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "SystemInfo.h"
#include "meshmap/store/TopologyStore.h"

namespace meshmap {
namespace collector {

/**
 * Writes a polled topology into the store.
 *
 * All methods operate inside the caller's transaction and return counters
 * describing what they changed.
 */
class TopologyReconciler {
 public:
  /**
   * Create or refresh the stored record of every polled node.
   *
   * A node is matched against stored nodes by (MAC address and name), then
   * by MAC address among active nodes, then by name among active nodes.
   * The most recently seen match is updated; any other active match is
   * marked inactive. Without a match a new record is created.
   */
  static std::map<std::string, int64_t> saveNodes(
      store::TopologyTransaction& txn,
      const std::vector<SystemInfo>& nodes,
      store::TimePoint now);

  /**
   * Mark the links of the previous cycle RECENT, then store 'links' as
   * CURRENT. A link whose endpoints are not both active nodes is dropped
   * and counted as an error.
   */
  static std::map<std::string, int64_t> saveLinks(
      store::TopologyTransaction& txn,
      const std::vector<LinkInfo>& links,
      store::TimePoint now);

  /**
   * Mark RECENT links and ACTIVE nodes not seen for the given number of
   * days INACTIVE.
   */
  static std::map<std::string, int64_t> expireData(
      store::TopologyTransaction& txn,
      store::TimePoint now,
      int nodeInactiveDays,
      int linkInactiveDays);

  // Find the stored node that represents 'node', demoting duplicates
  static std::optional<store::NodeRecord> findNodeRecord(
      store::TopologyTransaction& txn,
      const SystemInfo& node,
      std::map<std::string, int64_t>& counters);

 private:
  static void applySystemInfo(
      store::NodeRecord& record, const SystemInfo& node, store::TimePoint now);
};

} // namespace collector
} // namespace meshmap
