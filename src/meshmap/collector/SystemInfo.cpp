/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "SystemInfo.h"

#include <algorithm>
#include <regex>
#include <stdexcept>

#include <folly/Conv.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "Consts.h"
#include "meshmap/common/JsonUtils.h"

namespace {
const std::regex kMidPrefixRegex("^mid\\d+\\.");

// Leading integer of a dotted version component ("9-beta" -> 9)
int
versionPart(const std::string& part) {
  auto digits = part.substr(0, part.find_first_not_of("0123456789"));
  auto parsed = folly::tryTo<int>(digits);
  return parsed.hasValue() ? parsed.value() : 0;
}

// Leading number of a string like "5.805 GHz"
std::optional<double>
leadingNumber(const std::string& text) {
  auto trimmed = folly::trimWhitespace(text).str();
  auto end = trimmed.find_first_not_of("0123456789.");
  auto parsed = folly::tryTo<double>(trimmed.substr(0, end));
  if (parsed.hasValue()) {
    return parsed.value();
  }
  return std::nullopt;
}

// Pick the MAC address of the interface carrying the mesh address, falling
// back to the first wireless interface.
std::string
findWlanMac(const folly::dynamic& interfaces, const std::string& ipAddress) {
  std::vector<std::pair<std::string, const folly::dynamic*>> entries;
  if (interfaces.isArray()) {
    for (const auto& iface : interfaces) {
      if (iface.isObject()) {
        entries.emplace_back(
            meshmap::JsonUtils::getString(iface, "name"), &iface);
      }
    }
  } else if (interfaces.isObject()) {
    // older firmware keys the interfaces by name
    for (const auto& kv : interfaces.items()) {
      if (kv.second.isObject()) {
        entries.emplace_back(kv.first.asString(), &kv.second);
      }
    }
  }

  for (const auto& entry : entries) {
    auto mac = meshmap::JsonUtils::getString(*entry.second, "mac");
    if (!mac.empty() &&
        meshmap::JsonUtils::getString(*entry.second, "ip") == ipAddress) {
      return mac;
    }
  }
  for (const auto& entry : entries) {
    auto mac = meshmap::JsonUtils::getString(*entry.second, "mac");
    if (!mac.empty() && entry.first.rfind("wlan", 0) == 0) {
      return mac;
    }
  }
  return "";
}
} // namespace

namespace meshmap {
namespace collector {

std::string
toString(LinkType type) {
  switch (type) {
    case LinkType::RF:
      return "RF";
    case LinkType::DTD:
      return "DTD";
    case LinkType::TUN:
      return "TUN";
    case LinkType::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

LinkType
parseLinkType(const std::string& type) {
  if (type == "RF") {
    return LinkType::RF;
  }
  if (type == "DTD") {
    return LinkType::DTD;
  }
  if (type == "TUN") {
    return LinkType::TUN;
  }
  return LinkType::UNKNOWN;
}

std::string
LinkInfo::toString() const {
  return folly::sformat(
      "{} ({}) -> {} ({}) [{}]",
      source,
      sourceIp,
      destination,
      destinationIp,
      collector::toString(type));
}

std::pair<int, int>
SystemInfo::apiVersionTuple() const {
  std::vector<std::string> parts;
  folly::split('.', apiVersion, parts);
  int major = parts.size() > 0 ? versionPart(parts[0]) : 0;
  int minor = parts.size() > 1 ? versionPart(parts[1]) : 0;
  return std::make_pair(major, minor);
}

bool
SystemInfo::reportsLinkCost() const {
  return apiVersionTuple() >= CollectorConsts::kLinkCostApiVersion;
}

std::string
SystemInfo::toString() const {
  return folly::sformat("{} ({})", nodeName, ipAddress);
}

std::string
normalizeHostName(const std::string& hostName) {
  std::string name = std::regex_replace(hostName, kMidPrefixRegex, "");
  const auto& suffix = CollectorConsts::kMeshDomainSuffix;
  if (name.size() > suffix.size() &&
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
    name.erase(name.size() - suffix.size());
  }
  return name;
}

std::string
bandFromFrequency(const std::string& frequency, const std::string& channel) {
  if (auto freq = leadingNumber(frequency)) {
    double mhz = *freq < 100 ? *freq * 1000 : *freq;
    if (mhz >= 902 && mhz <= 928) {
      return "900MHz";
    }
    if (mhz >= 2400 && mhz < 2500) {
      return "2.4GHz";
    }
    if (mhz >= 3300 && mhz < 3800) {
      return "3.4GHz";
    }
    if (mhz >= 5000 && mhz < 6000) {
      return "5.8GHz";
    }
  }

  auto parsed = folly::tryTo<int>(folly::trimWhitespace(channel));
  if (parsed.hasValue()) {
    int ch = parsed.value();
    if (ch >= -4 && ch <= 14 && ch != 0) {
      return "2.4GHz";
    }
    if (ch >= 76 && ch <= 99) {
      return "3.4GHz";
    }
    if (ch >= 131 && ch <= 184) {
      return "5.8GHz";
    }
  }
  return "Unknown";
}

SystemInfo
loadSystemInfo(const folly::dynamic& json, const std::string& ipAddress) {
  if (!json.isObject()) {
    throw std::invalid_argument("System information is not a JSON object");
  }

  SystemInfo info;
  info.ipAddress = ipAddress;
  info.nodeName = JsonUtils::getString(json, "node");
  if (info.nodeName.empty()) {
    throw std::invalid_argument("Missing node name");
  }
  if (json.get_ptr("node_details") == nullptr) {
    throw std::invalid_argument("Missing node details");
  }

  const auto& details = JsonUtils::getObject(json, "node_details");
  info.description = JsonUtils::getString(details, "description");
  info.model = JsonUtils::getString(details, "model");
  info.boardId = JsonUtils::getString(details, "board_id");
  info.firmwareManufacturer = JsonUtils::getString(details, "firmware_mfg");
  info.firmwareVersion = JsonUtils::getString(details, "firmware_version");
  info.apiVersion = JsonUtils::getString(json, "api_version", "1.0");

  info.latitude = JsonUtils::getOptionalDouble(json, "lat");
  info.longitude = JsonUtils::getOptionalDouble(json, "lon");
  info.gridSquare = JsonUtils::getString(json, "grid_square");

  const auto& sysinfo = JsonUtils::getObject(json, "sysinfo");
  info.upTime = JsonUtils::getString(sysinfo, "uptime");
  if (auto loads = sysinfo.get_ptr("loads")) {
    if (!loads->isArray()) {
      throw std::invalid_argument("Expected 'loads' to be an array");
    }
    for (const auto& load : *loads) {
      info.loadAverages.push_back(load.asDouble());
    }
  }

  // older firmware reports radio settings at the top level
  const auto& meshrf = JsonUtils::getObject(json, "meshrf");
  const auto& rf = meshrf.empty() ? json : meshrf;
  info.ssid = JsonUtils::getString(rf, "ssid");
  info.channel = JsonUtils::getString(rf, "channel");
  info.channelBandwidth = JsonUtils::getString(rf, "chanbw");
  info.band = bandFromFrequency(JsonUtils::getString(rf, "freq"), info.channel);

  const auto& tunnels = JsonUtils::getObject(json, "tunnels");
  const auto& tunnelSource = tunnels.empty() ? json : tunnels;
  info.tunnelInstalled = JsonUtils::getBool(tunnelSource, "tunnel_installed");
  info.activeTunnelCount =
      JsonUtils::getOptionalInt(tunnelSource, "active_tunnel_count")
          .value_or(0);

  if (auto services = json.get_ptr("services_local")) {
    info.servicesJson = JsonUtils::toSortedJson(*services);
  } else {
    info.servicesJson = "[]";
  }

  if (auto interfaces = json.get_ptr("interfaces")) {
    info.wlanMacAddress = findWlanMac(*interfaces, ipAddress);
  }

  const auto& linkInfo = JsonUtils::getObject(json, "link_info");
  const bool hasCost = info.reportsLinkCost();
  for (const auto& kv : linkInfo.items()) {
    if (!kv.second.isObject()) {
      throw std::invalid_argument(folly::sformat(
          "Expected link information for {} to be an object",
          kv.first.asString()));
    }
    const auto& entry = kv.second;
    LinkInfo link;
    link.source = info.nodeName;
    link.sourceIp = ipAddress;
    link.destinationIp = kv.first.asString();
    link.destination =
        normalizeHostName(JsonUtils::getString(entry, "hostname"));
    link.type = parseLinkType(JsonUtils::getString(entry, "linkType"));
    link.interface = JsonUtils::getString(entry, "olsrInterface");
    link.signal = JsonUtils::getOptionalInt(entry, "signal");
    link.noise = JsonUtils::getOptionalInt(entry, "noise");
    link.txRate = JsonUtils::getOptionalDouble(entry, "tx_rate");
    link.rxRate = JsonUtils::getOptionalDouble(entry, "rx_rate");
    link.quality = JsonUtils::getOptionalDouble(entry, "linkQuality");
    link.neighborQuality =
        JsonUtils::getOptionalDouble(entry, "neighborLinkQuality");
    if (hasCost) {
      link.olsrCost = JsonUtils::getOptionalDouble(entry, "linkCost");
    }
    info.links.push_back(std::move(link));
  }
  // object key order is unspecified
  std::sort(
      info.links.begin(),
      info.links.end(),
      [](const LinkInfo& a, const LinkInfo& b) {
        return a.destinationIp < b.destinationIp;
      });
  info.linkCount = (int64_t)info.links.size();

  info.sourceJson = JsonUtils::toSortedJson(json);
  VLOG(3) << "Loaded system information for " << info.toString();
  return info;
}

} // namespace collector
} // namespace meshmap
