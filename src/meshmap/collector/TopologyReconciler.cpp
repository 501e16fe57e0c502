/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TopologyReconciler.h"

#include <algorithm>
#include <chrono>

#include <folly/Format.h>
#include <glog/logging.h>

#include "meshmap/common/GeoUtils.h"

namespace meshmap {
namespace collector {

namespace {
// Keep the most recently seen record, demoting the other active ones
std::optional<store::NodeRecord>
mostRecent(
    store::TopologyTransaction& txn,
    std::vector<store::NodeRecord> records,
    std::map<std::string, int64_t>& counters) {
  if (records.empty()) {
    return std::nullopt;
  }

  std::stable_sort(
      records.begin(),
      records.end(),
      [](const store::NodeRecord& a, const store::NodeRecord& b) {
        return a.lastSeen > b.lastSeen;
      });
  for (size_t i = 1; i < records.size(); i++) {
    auto& older = records[i];
    if (older.status == store::NodeStatus::ACTIVE) {
      VLOG(2) << folly::format(
          "Marking older match inactive: {} (id {})", older.name, older.id);
      older.status = store::NodeStatus::INACTIVE;
      txn.saveNode(older);
      counters["duplicates deactivated"]++;
    }
  }
  return records[0];
}

std::string
describeLinkEndpoints(const LinkInfo& link) {
  return folly::sformat("{} -> {}", link.sourceIp, link.destinationIp);
}
} // namespace

std::optional<store::NodeRecord>
TopologyReconciler::findNodeRecord(
    store::TopologyTransaction& txn,
    const SystemInfo& node,
    std::map<std::string, int64_t>& counters) {
  // same hardware and name, regardless of status
  store::NodeQuery query;
  query.wlanMacAddress = node.wlanMacAddress;
  query.name = node.nodeName;
  if (auto record = mostRecent(txn, txn.findNodes(query), counters)) {
    return record;
  }

  // active node with the same hardware
  query = store::NodeQuery();
  query.wlanMacAddress = node.wlanMacAddress;
  query.status = store::NodeStatus::ACTIVE;
  if (auto record = mostRecent(txn, txn.findNodes(query), counters)) {
    return record;
  }

  // active node with the same name
  query = store::NodeQuery();
  query.name = node.nodeName;
  query.status = store::NodeStatus::ACTIVE;
  return mostRecent(txn, txn.findNodes(query), counters);
}

std::map<std::string, int64_t>
TopologyReconciler::saveNodes(
    store::TopologyTransaction& txn,
    const std::vector<SystemInfo>& nodes,
    store::TimePoint now) {
  std::map<std::string, int64_t> counters{
      {"total", 0}, {"added", 0}, {"updated", 0}};

  for (const auto& node : nodes) {
    counters["total"]++;
    auto record = findNodeRecord(txn, node, counters);
    if (!record) {
      VLOG(1) << "Saving " << node.toString() << " to database";
      counters["added"]++;
      record = store::NodeRecord();
    } else {
      VLOG(1) << folly::format(
          "Updating node {} in database with {}", record->id, node.toString());
      counters["updated"]++;
    }

    applySystemInfo(*record, node, now);
    txn.saveNode(*record);
  }

  LOG(INFO) << "Nodes written to database: total " << counters["total"]
            << ", added " << counters["added"] << ", updated "
            << counters["updated"];
  return counters;
}

std::map<std::string, int64_t>
TopologyReconciler::saveLinks(
    store::TopologyTransaction& txn,
    const std::vector<LinkInfo>& links,
    store::TimePoint now) {
  std::map<std::string, int64_t> counters{
      {"total", 0},
      {"new", 0},
      {"updated", 0},
      {"errors", 0},
      {"location calculated", 0},
      {"missing location info", 0}};

  // only the links seen in this cycle stay current
  counters["demoted"] = txn.updateLinkStatus(
      store::LinkStatus::CURRENT, store::LinkStatus::RECENT);

  auto findActive = [&txn](const std::string& ip) {
    store::NodeQuery query;
    query.wlanIp = ip;
    query.status = store::NodeStatus::ACTIVE;
    auto records = txn.findNodes(query);
    // most recently seen first
    return records.empty() ? std::nullopt
                           : std::optional<store::NodeRecord>(records[0]);
  };

  for (const auto& link : links) {
    counters["total"]++;
    auto source = findActive(link.sourceIp);
    auto destination = findActive(link.destinationIp);
    if (!source || !destination) {
      LOG(WARNING) << "Failed to save link " << describeLinkEndpoints(link)
                   << ", node missing from database";
      counters["errors"]++;
      continue;
    }

    auto record = txn.findLink(source->id, destination->id);
    if (!record) {
      counters["new"]++;
      record = store::LinkRecord();
      record->sourceId = source->id;
      record->destinationId = destination->id;
    } else {
      counters["updated"]++;
    }

    record->olsrCost = link.olsrCost;
    record->status = store::LinkStatus::CURRENT;
    record->lastSeen = now;
    record->type = toString(link.type);
    record->interface = link.interface;
    record->signal = link.signal;
    record->noise = link.noise;
    record->txRate = link.txRate;
    record->rxRate = link.rxRate;
    record->quality = link.quality;
    record->neighborQuality = link.neighborQuality;

    if (!source->latitude || !source->longitude || !destination->latitude ||
        !destination->longitude) {
      counters["missing location info"]++;
      record->distance = std::nullopt;
      record->bearing = std::nullopt;
    } else {
      counters["location calculated"]++;
      record->distance = GeoUtils::distance(
          *source->latitude,
          *source->longitude,
          *destination->latitude,
          *destination->longitude);
      record->bearing = GeoUtils::bearing(
          *source->latitude,
          *source->longitude,
          *destination->latitude,
          *destination->longitude);
    }
    txn.saveLink(*record);
  }

  LOG(INFO) << "Links written to database: total " << counters["total"]
            << ", new " << counters["new"] << ", updated "
            << counters["updated"] << ", errors " << counters["errors"];
  return counters;
}

std::map<std::string, int64_t>
TopologyReconciler::expireData(
    store::TopologyTransaction& txn,
    store::TimePoint now,
    int nodeInactiveDays,
    int linkInactiveDays) {
  std::map<std::string, int64_t> counters;

  const auto linkCutoff = now - std::chrono::hours(24 * linkInactiveDays);
  counters["links expired"] = txn.expireLinks(linkCutoff);
  LOG(INFO) << folly::format(
      "Marked {} links inactive that have not been seen in {} days",
      counters["links expired"],
      linkInactiveDays);

  const auto nodeCutoff = now - std::chrono::hours(24 * nodeInactiveDays);
  counters["nodes expired"] = txn.expireNodes(nodeCutoff);
  LOG(INFO) << folly::format(
      "Marked {} nodes inactive that have not been seen in {} days",
      counters["nodes expired"],
      nodeInactiveDays);
  return counters;
}

void
TopologyReconciler::applySystemInfo(
    store::NodeRecord& record, const SystemInfo& node, store::TimePoint now) {
  record.name = node.nodeName;
  record.status = store::NodeStatus::ACTIVE;
  record.lastSeen = now;
  record.wlanIp = node.ipAddress;
  record.wlanMacAddress = node.wlanMacAddress;
  record.description = node.description;
  record.upTime = node.upTime;
  record.loadAverages = node.loadAverages;
  record.model = node.model;
  record.boardId = node.boardId;
  record.firmwareVersion = node.firmwareVersion;
  record.firmwareManufacturer = node.firmwareManufacturer;
  record.apiVersion = node.apiVersion;
  record.latitude = node.latitude;
  record.longitude = node.longitude;
  record.gridSquare = node.gridSquare;
  record.ssid = node.ssid;
  record.channel = node.channel;
  record.channelBandwidth = node.channelBandwidth;
  record.band = node.band;
  record.servicesJson = node.servicesJson;
  record.tunnelInstalled = node.tunnelInstalled;
  record.activeTunnelCount = node.activeTunnelCount;
  record.linkCount = node.linkCount;
  record.systemInfoJson = node.sourceJson;
}

} // namespace collector
} // namespace meshmap
