/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "PostgresTopologyStore.h"

#include <folly/Conv.h>
#include <folly/String.h>
#include <glog/logging.h>

namespace {
const std::string kNodeColumns{
    "id, name, status, wlan_ip, wlan_mac_address, description, up_time, "
    "load_averages, model, board_id, firmware_version, firmware_mfg, "
    "api_version, latitude, longitude, grid_square, ssid, channel, "
    "channel_bandwidth, band, services, tunnel_installed, "
    "active_tunnel_count, link_count, system_info, "
    "EXTRACT(EPOCH FROM last_seen)::float8"};

double
toEpochSeconds(meshmap::store::TimePoint t) {
  return std::chrono::duration<double>(t.time_since_epoch()).count();
}

meshmap::store::TimePoint
fromEpochSeconds(double seconds) {
  return meshmap::store::TimePoint(
      std::chrono::duration_cast<meshmap::store::Clock::duration>(
          std::chrono::duration<double>(seconds)));
}

// Load averages are stored as comma-separated text
std::string
joinLoads(const std::vector<double>& loads) {
  return folly::join(",", loads);
}

std::vector<double>
splitLoads(const std::string& text) {
  std::vector<double> loads;
  if (text.empty()) {
    return loads;
  }
  std::vector<folly::StringPiece> parts;
  folly::split(',', text, parts);
  for (const auto& part : parts) {
    loads.push_back(folly::to<double>(folly::trimWhitespace(part)));
  }
  return loads;
}

meshmap::store::NodeRecord
toNodeRecord(const pqxx::row& row) {
  meshmap::store::NodeRecord node;
  node.id = row[0].as<int64_t>();
  node.name = row[1].as<std::string>();
  node.status = meshmap::store::parseNodeStatus(row[2].as<std::string>());
  node.wlanIp = row[3].as<std::optional<std::string>>().value_or("");
  node.wlanMacAddress = row[4].as<std::optional<std::string>>().value_or("");
  node.description = row[5].as<std::optional<std::string>>().value_or("");
  node.upTime = row[6].as<std::optional<std::string>>().value_or("");
  node.loadAverages =
      splitLoads(row[7].as<std::optional<std::string>>().value_or(""));
  node.model = row[8].as<std::optional<std::string>>().value_or("");
  node.boardId = row[9].as<std::optional<std::string>>().value_or("");
  node.firmwareVersion = row[10].as<std::optional<std::string>>().value_or("");
  node.firmwareManufacturer =
      row[11].as<std::optional<std::string>>().value_or("");
  node.apiVersion = row[12].as<std::optional<std::string>>().value_or("");
  node.latitude = row[13].as<std::optional<double>>();
  node.longitude = row[14].as<std::optional<double>>();
  node.gridSquare = row[15].as<std::optional<std::string>>().value_or("");
  node.ssid = row[16].as<std::optional<std::string>>().value_or("");
  node.channel = row[17].as<std::optional<std::string>>().value_or("");
  node.channelBandwidth =
      row[18].as<std::optional<std::string>>().value_or("");
  node.band = row[19].as<std::optional<std::string>>().value_or("");
  node.servicesJson = row[20].as<std::optional<std::string>>().value_or("[]");
  node.tunnelInstalled = row[21].as<std::optional<bool>>().value_or(false);
  node.activeTunnelCount = row[22].as<std::optional<int64_t>>().value_or(0);
  node.linkCount = row[23].as<std::optional<int64_t>>().value_or(0);
  node.systemInfoJson = row[24].as<std::optional<std::string>>().value_or("");
  node.lastSeen = fromEpochSeconds(row[25].as<double>());
  return node;
}
} // namespace

namespace meshmap {
namespace store {

class PostgresTopologyStore::Transaction final : public TopologyTransaction {
 public:
  Transaction(pqxx::connection& conn, std::unique_lock<std::mutex> guard)
      : guard_(std::move(guard)), w_(conn) {}

  std::vector<NodeRecord>
  findNodes(const NodeQuery& query) override {
    // unset filters are passed as NULL and ignored
    pqxx::result r = w_.exec_params(
        "SELECT " + kNodeColumns +
            " FROM node"
            " WHERE ($1::text IS NULL OR wlan_mac_address = $1)"
            " AND ($2::text IS NULL OR name = $2)"
            " AND ($3::text IS NULL OR wlan_ip = $3)"
            " AND ($4::text IS NULL OR status = $4)"
            " ORDER BY last_seen DESC",
        query.wlanMacAddress,
        query.name,
        query.wlanIp,
        query.status ? std::optional<std::string>(toString(*query.status))
                     : std::nullopt);

    std::vector<NodeRecord> nodes;
    for (const auto& row : r) {
      nodes.push_back(toNodeRecord(row));
    }
    return nodes;
  }

  void
  saveNode(NodeRecord& node) override {
    if (node.id == 0) {
      pqxx::row r = w_.exec_params1(
          "INSERT INTO node (name, status, wlan_ip, wlan_mac_address, "
          "description, up_time, load_averages, model, board_id, "
          "firmware_version, firmware_mfg, api_version, latitude, longitude, "
          "grid_square, ssid, channel, channel_bandwidth, band, services, "
          "tunnel_installed, active_tunnel_count, link_count, system_info, "
          "last_seen) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, "
          "$12, $13, $14, $15, $16, $17, $18, $19, $20, $21, $22, $23, $24, "
          "to_timestamp($25)) RETURNING id",
          node.name,
          toString(node.status),
          node.wlanIp,
          node.wlanMacAddress,
          node.description,
          node.upTime,
          joinLoads(node.loadAverages),
          node.model,
          node.boardId,
          node.firmwareVersion,
          node.firmwareManufacturer,
          node.apiVersion,
          node.latitude,
          node.longitude,
          node.gridSquare,
          node.ssid,
          node.channel,
          node.channelBandwidth,
          node.band,
          node.servicesJson,
          node.tunnelInstalled,
          node.activeTunnelCount,
          node.linkCount,
          node.systemInfoJson,
          toEpochSeconds(node.lastSeen));
      node.id = r[0].as<int64_t>();
      return;
    }

    w_.exec_params0(
        "UPDATE node SET name = $2, status = $3, wlan_ip = $4, "
        "wlan_mac_address = $5, description = $6, up_time = $7, "
        "load_averages = $8, model = $9, board_id = $10, "
        "firmware_version = $11, firmware_mfg = $12, api_version = $13, "
        "latitude = $14, longitude = $15, grid_square = $16, ssid = $17, "
        "channel = $18, channel_bandwidth = $19, band = $20, services = $21, "
        "tunnel_installed = $22, active_tunnel_count = $23, link_count = $24, "
        "system_info = $25, last_seen = to_timestamp($26) WHERE id = $1",
        node.id,
        node.name,
        toString(node.status),
        node.wlanIp,
        node.wlanMacAddress,
        node.description,
        node.upTime,
        joinLoads(node.loadAverages),
        node.model,
        node.boardId,
        node.firmwareVersion,
        node.firmwareManufacturer,
        node.apiVersion,
        node.latitude,
        node.longitude,
        node.gridSquare,
        node.ssid,
        node.channel,
        node.channelBandwidth,
        node.band,
        node.servicesJson,
        node.tunnelInstalled,
        node.activeTunnelCount,
        node.linkCount,
        node.systemInfoJson,
        toEpochSeconds(node.lastSeen));
  }

  std::optional<LinkRecord>
  findLink(int64_t sourceId, int64_t destinationId) override {
    pqxx::result r = w_.exec_params(
        "SELECT source_id, destination_id, status, type, interface, "
        "olsr_cost, signal, noise, tx_rate, rx_rate, quality, "
        "neighbor_quality, distance, bearing, "
        "EXTRACT(EPOCH FROM last_seen)::float8 "
        "FROM link WHERE source_id = $1 AND destination_id = $2",
        sourceId,
        destinationId);
    if (r.empty()) {
      return std::nullopt;
    }

    const auto& row = r[0];
    LinkRecord link;
    link.sourceId = row[0].as<int64_t>();
    link.destinationId = row[1].as<int64_t>();
    link.status = parseLinkStatus(row[2].as<std::string>());
    link.type = row[3].as<std::optional<std::string>>().value_or("");
    link.interface = row[4].as<std::optional<std::string>>().value_or("");
    link.olsrCost = row[5].as<std::optional<double>>();
    link.signal = row[6].as<std::optional<int64_t>>();
    link.noise = row[7].as<std::optional<int64_t>>();
    link.txRate = row[8].as<std::optional<double>>();
    link.rxRate = row[9].as<std::optional<double>>();
    link.quality = row[10].as<std::optional<double>>();
    link.neighborQuality = row[11].as<std::optional<double>>();
    link.distance = row[12].as<std::optional<double>>();
    link.bearing = row[13].as<std::optional<double>>();
    link.lastSeen = fromEpochSeconds(row[14].as<double>());
    return link;
  }

  void
  saveLink(const LinkRecord& link) override {
    w_.exec_params0(
        "INSERT INTO link (source_id, destination_id, status, type, "
        "interface, olsr_cost, signal, noise, tx_rate, rx_rate, quality, "
        "neighbor_quality, distance, bearing, last_seen) VALUES ($1, $2, $3, "
        "$4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, to_timestamp($15)) "
        "ON CONFLICT (source_id, destination_id) DO UPDATE SET "
        "status = EXCLUDED.status, type = EXCLUDED.type, "
        "interface = EXCLUDED.interface, olsr_cost = EXCLUDED.olsr_cost, "
        "signal = EXCLUDED.signal, noise = EXCLUDED.noise, "
        "tx_rate = EXCLUDED.tx_rate, rx_rate = EXCLUDED.rx_rate, "
        "quality = EXCLUDED.quality, "
        "neighbor_quality = EXCLUDED.neighbor_quality, "
        "distance = EXCLUDED.distance, bearing = EXCLUDED.bearing, "
        "last_seen = EXCLUDED.last_seen",
        link.sourceId,
        link.destinationId,
        toString(link.status),
        link.type,
        link.interface,
        link.olsrCost,
        link.signal,
        link.noise,
        link.txRate,
        link.rxRate,
        link.quality,
        link.neighborQuality,
        link.distance,
        link.bearing,
        toEpochSeconds(link.lastSeen));
  }

  int64_t
  updateLinkStatus(LinkStatus from, LinkStatus to) override {
    pqxx::result r = w_.exec_params0(
        "UPDATE link SET status = $2 WHERE status = $1",
        toString(from),
        toString(to));
    return (int64_t)r.affected_rows();
  }

  int64_t
  expireLinks(TimePoint cutoff) override {
    pqxx::result r = w_.exec_params0(
        "UPDATE link SET status = $1 "
        "WHERE status = $2 AND last_seen < to_timestamp($3)",
        toString(LinkStatus::INACTIVE),
        toString(LinkStatus::RECENT),
        toEpochSeconds(cutoff));
    return (int64_t)r.affected_rows();
  }

  int64_t
  expireNodes(TimePoint cutoff) override {
    pqxx::result r = w_.exec_params0(
        "UPDATE node SET status = $1 "
        "WHERE status = $2 AND last_seen < to_timestamp($3)",
        toString(NodeStatus::INACTIVE),
        toString(NodeStatus::ACTIVE),
        toEpochSeconds(cutoff));
    return (int64_t)r.affected_rows();
  }

  void
  addCollectorStat(const CollectorStat& stat) override {
    w_.exec_params0(
        "INSERT INTO collector_stat (started_at, finished_at, node_count, "
        "link_count, error_count, polling_duration, total_duration, "
        "other_stats) VALUES (to_timestamp($1), to_timestamp($2), $3, $4, "
        "$5, $6, $7, $8::jsonb)",
        toEpochSeconds(stat.startedAt),
        toEpochSeconds(stat.finishedAt),
        stat.nodeCount,
        stat.linkCount,
        stat.errorCount,
        stat.pollingDurationS,
        stat.totalDurationS,
        stat.otherStats);
  }

  void
  commit() override {
    w_.commit();
  }

 private:
  // Declared first so the lock outlives the database transaction
  std::unique_lock<std::mutex> guard_;
  pqxx::work w_;
};

PostgresTopologyStore::PostgresTopologyStore(const std::string& uri)
    : conn_(std::make_unique<pqxx::connection>(uri)) {
  LOG(INFO) << "Connected to database " << conn_->dbname();
}

std::unique_ptr<TopologyTransaction>
PostgresTopologyStore::begin() {
  std::unique_lock<std::mutex> guard(lock_);
  return std::make_unique<Transaction>(*conn_, std::move(guard));
}

} // namespace store
} // namespace meshmap
