/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshmap {
namespace store {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;

enum class NodeStatus {
  ACTIVE,
  INACTIVE,
};

// Freshness ladder: CURRENT (seen this cycle) -> RECENT -> INACTIVE
enum class LinkStatus {
  CURRENT,
  RECENT,
  INACTIVE,
};

std::string toString(NodeStatus status);
std::string toString(LinkStatus status);

// Throws std::invalid_argument on unknown names
NodeStatus parseNodeStatus(const std::string& status);
LinkStatus parseLinkStatus(const std::string& status);

struct NodeRecord {
  // 0 for records not yet saved
  int64_t id{0};
  std::string name;
  NodeStatus status{NodeStatus::ACTIVE};
  std::string wlanIp;
  std::string wlanMacAddress;
  std::string description;
  std::string upTime;
  std::vector<double> loadAverages;
  std::string model;
  std::string boardId;
  std::string firmwareVersion;
  std::string firmwareManufacturer;
  std::string apiVersion;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::string gridSquare;
  std::string ssid;
  std::string channel;
  std::string channelBandwidth;
  std::string band;
  std::string servicesJson;
  bool tunnelInstalled{false};
  int64_t activeTunnelCount{0};
  int64_t linkCount{0};
  std::string systemInfoJson;
  TimePoint lastSeen{};
};

struct LinkRecord {
  int64_t sourceId{0};
  int64_t destinationId{0};
  LinkStatus status{LinkStatus::CURRENT};
  // Link type name ("RF", "DTD", "TUN", "UNKNOWN")
  std::string type;
  std::string interface;
  std::optional<double> olsrCost;
  std::optional<int64_t> signal;
  std::optional<int64_t> noise;
  std::optional<double> txRate;
  std::optional<double> rxRate;
  std::optional<double> quality;
  std::optional<double> neighborQuality;
  // Kilometers and degrees; unset when either endpoint has no position
  std::optional<double> distance;
  std::optional<double> bearing;
  TimePoint lastSeen{};
};

// Statistics of one collector cycle
struct CollectorStat {
  TimePoint startedAt{};
  TimePoint finishedAt{};
  int64_t nodeCount{0};
  int64_t linkCount{0};
  int64_t errorCount{0};
  double pollingDurationS{0};
  double totalDurationS{0};
  // Free-form counters, serialized JSON object
  std::string otherStats{"{}"};
};

/**
 * Node filter. Every field that is set must match; an empty query matches
 * every node.
 */
struct NodeQuery {
  std::optional<std::string> wlanMacAddress;
  std::optional<std::string> name;
  std::optional<std::string> wlanIp;
  std::optional<NodeStatus> status;
};

/**
 * One unit of work against the store.
 *
 * Changes become visible to other transactions only when commit() is
 * called; destroying an uncommitted transaction discards its changes.
 */
class TopologyTransaction {
 public:
  virtual ~TopologyTransaction() = default;

  // Matching nodes, most recently seen first
  virtual std::vector<NodeRecord> findNodes(const NodeQuery& query) = 0;

  // Insert (id == 0, id is assigned) or update the node
  virtual void saveNode(NodeRecord& node) = 0;

  virtual std::optional<LinkRecord> findLink(
      int64_t sourceId, int64_t destinationId) = 0;

  // Insert or update the link keyed by (sourceId, destinationId)
  virtual void saveLink(const LinkRecord& link) = 0;

  // Move every link in status 'from' to 'to', returning the count
  virtual int64_t updateLinkStatus(LinkStatus from, LinkStatus to) = 0;

  // RECENT links last seen before 'cutoff' become INACTIVE
  virtual int64_t expireLinks(TimePoint cutoff) = 0;

  // ACTIVE nodes last seen before 'cutoff' become INACTIVE
  virtual int64_t expireNodes(TimePoint cutoff) = 0;

  virtual void addCollectorStat(const CollectorStat& stat) = 0;

  virtual void commit() = 0;
};

/**
 * Persistent home of the collected topology.
 */
class TopologyStore {
 public:
  virtual ~TopologyStore() = default;

  // Start a transaction. Implementations may serialize transactions.
  virtual std::unique_ptr<TopologyTransaction> begin() = 0;
};

} // namespace store
} // namespace meshmap
