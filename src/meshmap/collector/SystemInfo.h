/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <folly/dynamic.h>

namespace meshmap {
namespace collector {

enum class LinkType {
  RF,
  DTD,
  TUN,
  UNKNOWN,
};

std::string toString(LinkType type);

// Parse a firmware link type ("RF", "DTD", "TUN"); anything else is UNKNOWN
LinkType parseLinkType(const std::string& type);

/**
 * One link, either reported by a node itself or derived from OLSR data.
 */
struct LinkInfo {
  // Name and mesh address of the reporting node
  std::string source;
  std::string sourceIp;
  // Name and mesh address of the neighbor
  std::string destination;
  std::string destinationIp;
  LinkType type{LinkType::UNKNOWN};
  std::string interface;
  std::optional<int64_t> signal;
  std::optional<int64_t> noise;
  std::optional<double> txRate;
  std::optional<double> rxRate;
  std::optional<double> quality;
  std::optional<double> neighborQuality;
  // Routing cost; unset when neither the node nor OLSR provided one
  std::optional<double> olsrCost;

  std::string toString() const;

  bool
  operator==(const LinkInfo& other) const {
    return source == other.source && sourceIp == other.sourceIp &&
        destination == other.destination &&
        destinationIp == other.destinationIp && type == other.type &&
        interface == other.interface && signal == other.signal &&
        noise == other.noise && txRate == other.txRate &&
        rxRate == other.rxRate && quality == other.quality &&
        neighborQuality == other.neighborQuality &&
        olsrCost == other.olsrCost;
  }
};

/**
 * Snapshot of one node's status, decoded from its sysinfo.json payload.
 */
struct SystemInfo {
  std::string nodeName;
  // Address the node was polled at (its main mesh address)
  std::string ipAddress;
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
  std::vector<LinkInfo> links;
  int64_t linkCount{0};
  // The complete payload, re-serialized
  std::string sourceJson;

  // API version as (major, minor); unparseable parts count as 0
  std::pair<int, int> apiVersionTuple() const;

  // Whether this firmware reports link cost itself
  bool reportsLinkCost() const;

  std::string toString() const;
};

/**
 * Decode a node's sysinfo.json payload.
 *
 * 'ipAddress' is the address the payload was fetched from.
 *
 * Throws std::invalid_argument (or folly::TypeError) if required fields are
 * missing or have the wrong type.
 */
SystemInfo loadSystemInfo(
    const folly::dynamic& json, const std::string& ipAddress);

// Strip the mesh domain suffix and any "mid<N>." prefix from a host name
std::string normalizeHostName(const std::string& hostName);

// Radio band for a frequency (MHz) or, failing that, a channel number
std::string bandFromFrequency(
    const std::string& frequency, const std::string& channel);

} // namespace collector
} // namespace meshmap
