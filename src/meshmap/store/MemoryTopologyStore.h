/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <utility>
#include <vector>

#include <folly/Synchronized.h>

#include "TopologyStore.h"

namespace meshmap {
namespace store {

/**
 * Topology store held in process memory.
 *
 * A transaction works on a private copy of the data and holds the write
 * lock for its lifetime, so transactions are serialized. commit() swaps the
 * copy in.
 */
class MemoryTopologyStore final : public TopologyStore {
 public:
  struct State {
    std::map<int64_t, NodeRecord> nodes;
    std::map<std::pair<int64_t, int64_t>, LinkRecord> links;
    std::vector<CollectorStat> collectorStats;
    int64_t nextNodeId{1};
  };

  std::unique_ptr<TopologyTransaction> begin() override;

  // Committed contents
  std::vector<NodeRecord> getNodes() const;
  std::vector<LinkRecord> getLinks() const;
  std::vector<CollectorStat> getCollectorStats() const;

 private:
  class Transaction;

  folly::Synchronized<State> state_;
};

} // namespace store
} // namespace meshmap
