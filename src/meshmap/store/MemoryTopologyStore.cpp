/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "MemoryTopologyStore.h"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

namespace {
bool
matches(const meshmap::store::NodeRecord& node,
        const meshmap::store::NodeQuery& query) {
  if (query.wlanMacAddress && node.wlanMacAddress != *query.wlanMacAddress) {
    return false;
  }
  if (query.name && node.name != *query.name) {
    return false;
  }
  if (query.wlanIp && node.wlanIp != *query.wlanIp) {
    return false;
  }
  if (query.status && node.status != *query.status) {
    return false;
  }
  return true;
}
} // namespace

namespace meshmap {
namespace store {

class MemoryTopologyStore::Transaction final : public TopologyTransaction {
 public:
  explicit Transaction(folly::Synchronized<State>::WLockedPtr lockedState)
      : lockedState_(std::move(lockedState)), working_(*lockedState_) {}

  ~Transaction() override {
    if (!committed_) {
      VLOG(2) << "Discarding uncommitted transaction";
    }
  }

  std::vector<NodeRecord>
  findNodes(const NodeQuery& query) override {
    std::vector<NodeRecord> result;
    for (const auto& kv : working_.nodes) {
      if (matches(kv.second, query)) {
        result.push_back(kv.second);
      }
    }
    std::stable_sort(
        result.begin(),
        result.end(),
        [](const NodeRecord& a, const NodeRecord& b) {
          return a.lastSeen > b.lastSeen;
        });
    return result;
  }

  void
  saveNode(NodeRecord& node) override {
    checkOpen();
    if (node.id == 0) {
      node.id = working_.nextNodeId++;
    } else if (!working_.nodes.count(node.id)) {
      throw std::invalid_argument("Unknown node id");
    }
    working_.nodes[node.id] = node;
  }

  std::optional<LinkRecord>
  findLink(int64_t sourceId, int64_t destinationId) override {
    auto it = working_.links.find(std::make_pair(sourceId, destinationId));
    if (it == working_.links.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void
  saveLink(const LinkRecord& link) override {
    checkOpen();
    if (!working_.nodes.count(link.sourceId) ||
        !working_.nodes.count(link.destinationId)) {
      throw std::invalid_argument("Link endpoint does not exist");
    }
    working_.links[std::make_pair(link.sourceId, link.destinationId)] = link;
  }

  int64_t
  updateLinkStatus(LinkStatus from, LinkStatus to) override {
    checkOpen();
    int64_t count = 0;
    for (auto& kv : working_.links) {
      if (kv.second.status == from) {
        kv.second.status = to;
        count++;
      }
    }
    return count;
  }

  int64_t
  expireLinks(TimePoint cutoff) override {
    checkOpen();
    int64_t count = 0;
    for (auto& kv : working_.links) {
      if (kv.second.status == LinkStatus::RECENT &&
          kv.second.lastSeen < cutoff) {
        kv.second.status = LinkStatus::INACTIVE;
        count++;
      }
    }
    return count;
  }

  int64_t
  expireNodes(TimePoint cutoff) override {
    checkOpen();
    int64_t count = 0;
    for (auto& kv : working_.nodes) {
      if (kv.second.status == NodeStatus::ACTIVE &&
          kv.second.lastSeen < cutoff) {
        kv.second.status = NodeStatus::INACTIVE;
        count++;
      }
    }
    return count;
  }

  void
  addCollectorStat(const CollectorStat& stat) override {
    checkOpen();
    working_.collectorStats.push_back(stat);
  }

  void
  commit() override {
    checkOpen();
    *lockedState_ = std::move(working_);
    committed_ = true;
    // let other transactions in
    lockedState_.unlock();
  }

 private:
  void
  checkOpen() const {
    if (committed_) {
      throw std::logic_error("Transaction already committed");
    }
  }

  folly::Synchronized<State>::WLockedPtr lockedState_;
  State working_;
  bool committed_{false};
};

std::unique_ptr<TopologyTransaction>
MemoryTopologyStore::begin() {
  return std::make_unique<Transaction>(state_.wlock());
}

std::vector<NodeRecord>
MemoryTopologyStore::getNodes() const {
  std::vector<NodeRecord> nodes;
  auto lockedState = state_.rlock();
  for (const auto& kv : lockedState->nodes) {
    nodes.push_back(kv.second);
  }
  return nodes;
}

std::vector<LinkRecord>
MemoryTopologyStore::getLinks() const {
  std::vector<LinkRecord> links;
  auto lockedState = state_.rlock();
  for (const auto& kv : lockedState->links) {
    links.push_back(kv.second);
  }
  return links;
}

std::vector<CollectorStat>
MemoryTopologyStore::getCollectorStats() const {
  return state_.rlock()->collectorStats;
}

} // namespace store
} // namespace meshmap
