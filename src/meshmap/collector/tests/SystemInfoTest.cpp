/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/init/Init.h>
#include <folly/json.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "../SystemInfo.h"

using namespace meshmap::collector;

namespace {
// Trimmed sysinfo.json from a node running API 1.9
const std::string kSysinfoJson = R"({
  "api_version": "1.9",
  "grid_square": "CM98hq",
  "lat": "38.682400",
  "lon": "-121.188790",
  "node": "N0CALL-hAP-1",
  "node_details": {
    "board_id": "0x0000",
    "description": "Rooftop node",
    "firmware_mfg": "AREDN",
    "firmware_version": "3.22.6.0",
    "model": "MikroTik RouterBOARD RB952Ui-5ac2nD (hAP ac lite)"
  },
  "meshrf": {
    "chanbw": "10",
    "channel": "-2",
    "freq": "2.397",
    "ssid": "AREDN-10-v3"
  },
  "tunnels": {"active_tunnel_count": "2", "tunnel_installed": "true"},
  "sysinfo": {"loads": [0.15, 0.1, 0.05], "uptime": "3 days, 1:02:03"},
  "interfaces": [
    {"name": "eth0", "mac": "11:22:33:44:55:66", "ip": "10.10.10.1"},
    {"name": "wlan0", "mac": "AA:BB:CC:DD:EE:FF", "ip": "10.32.66.190"}
  ],
  "services_local": [{"name": "web", "link": "http://n0call:8080/"}],
  "link_info": {
    "10.80.213.95": {
      "hostname": "N0CALL-rocket.local.mesh",
      "linkType": "RF",
      "olsrInterface": "wlan0",
      "signal": -72,
      "noise": -95,
      "tx_rate": 26,
      "rx_rate": 39,
      "linkQuality": 1,
      "neighborLinkQuality": 0.96,
      "linkCost": 1.04
    },
    "10.44.1.2": {
      "hostname": "mid2.KK6XYZ-tunnel.local.mesh",
      "linkType": "TUN",
      "olsrInterface": "tun50",
      "linkQuality": 1,
      "neighborLinkQuality": 1,
      "linkCost": 1
    }
  }
})";
} // namespace

TEST(SystemInfoTest, LoadFullPayload) {
  auto info = loadSystemInfo(folly::parseJson(kSysinfoJson), "10.32.66.190");

  EXPECT_EQ("N0CALL-hAP-1", info.nodeName);
  EXPECT_EQ("10.32.66.190", info.ipAddress);
  EXPECT_EQ("AA:BB:CC:DD:EE:FF", info.wlanMacAddress);
  EXPECT_EQ("Rooftop node", info.description);
  EXPECT_EQ("3.22.6.0", info.firmwareVersion);
  EXPECT_EQ("AREDN", info.firmwareManufacturer);
  EXPECT_EQ("1.9", info.apiVersion);
  EXPECT_DOUBLE_EQ(38.6824, *info.latitude);
  EXPECT_DOUBLE_EQ(-121.18879, *info.longitude);
  EXPECT_EQ("CM98hq", info.gridSquare);
  EXPECT_EQ("3 days, 1:02:03", info.upTime);
  EXPECT_EQ((std::vector<double>{0.15, 0.1, 0.05}), info.loadAverages);
  EXPECT_EQ("AREDN-10-v3", info.ssid);
  EXPECT_EQ("-2", info.channel);
  EXPECT_EQ("10", info.channelBandwidth);
  EXPECT_EQ("2.4GHz", info.band);
  EXPECT_TRUE(info.tunnelInstalled);
  EXPECT_EQ(2, info.activeTunnelCount);
  EXPECT_NE(std::string::npos, info.servicesJson.find("\"web\""));
  EXPECT_FALSE(info.sourceJson.empty());

  // links are ordered by neighbor address
  ASSERT_EQ(2u, info.links.size());
  EXPECT_EQ(2, info.linkCount);

  const auto& tunnel = info.links[0];
  EXPECT_EQ("10.44.1.2", tunnel.destinationIp);
  EXPECT_EQ("KK6XYZ-tunnel", tunnel.destination);
  EXPECT_EQ(LinkType::TUN, tunnel.type);
  EXPECT_EQ("tun50", tunnel.interface);
  EXPECT_FALSE(tunnel.signal.has_value());

  const auto& rf = info.links[1];
  EXPECT_EQ("N0CALL-hAP-1", rf.source);
  EXPECT_EQ("10.32.66.190", rf.sourceIp);
  EXPECT_EQ("N0CALL-rocket", rf.destination);
  EXPECT_EQ(LinkType::RF, rf.type);
  EXPECT_EQ(-72, rf.signal);
  EXPECT_EQ(-95, rf.noise);
  EXPECT_EQ(26.0, rf.txRate);
  EXPECT_EQ(0.96, rf.neighborQuality);
  EXPECT_EQ(1.04, rf.olsrCost);
}

TEST(SystemInfoTest, OlderApiIgnoresLinkCost) {
  auto json = folly::parseJson(kSysinfoJson);
  json["api_version"] = "1.7";
  auto info = loadSystemInfo(json, "10.32.66.190");
  EXPECT_FALSE(info.reportsLinkCost());
  ASSERT_EQ(2u, info.links.size());
  EXPECT_FALSE(info.links[0].olsrCost.has_value());
  EXPECT_FALSE(info.links[1].olsrCost.has_value());
}

TEST(SystemInfoTest, ApiVersion) {
  SystemInfo info;
  info.apiVersion = "1.9";
  EXPECT_EQ(std::make_pair(1, 9), info.apiVersionTuple());
  EXPECT_TRUE(info.reportsLinkCost());

  info.apiVersion = "1.10";
  EXPECT_EQ(std::make_pair(1, 10), info.apiVersionTuple());
  EXPECT_TRUE(info.reportsLinkCost());

  info.apiVersion = "2.0";
  EXPECT_TRUE(info.reportsLinkCost());

  info.apiVersion = "1.8";
  EXPECT_FALSE(info.reportsLinkCost());

  info.apiVersion = "1";
  EXPECT_EQ(std::make_pair(1, 0), info.apiVersionTuple());
  EXPECT_FALSE(info.reportsLinkCost());

  info.apiVersion = "bogus";
  EXPECT_EQ(std::make_pair(0, 0), info.apiVersionTuple());
}

TEST(SystemInfoTest, LegacyPayload) {
  // older firmware: no meshrf/tunnels objects, interfaces keyed by name
  auto json = folly::parseJson(R"({
    "node": "KK6XYZ-nsm2",
    "node_details": {"model": "NanoStation M2", "firmware_version": "3.16.1"},
    "ssid": "AREDN-20-v3",
    "channel": "1",
    "chanbw": "20",
    "tunnel_installed": "false",
    "active_tunnel_count": "0",
    "lat": 38.5,
    "lon": -121.5,
    "interfaces": {
      "eth0": {"mac": "00:00:00:00:00:01"},
      "wlan0": {"mac": "00:00:00:00:00:02"}
    }
  })");
  auto info = loadSystemInfo(json, "10.1.2.3");
  EXPECT_EQ("1.0", info.apiVersion);
  EXPECT_EQ("AREDN-20-v3", info.ssid);
  EXPECT_EQ("2.4GHz", info.band);
  EXPECT_FALSE(info.tunnelInstalled);
  EXPECT_EQ("00:00:00:00:00:02", info.wlanMacAddress);
  EXPECT_EQ(38.5, info.latitude);
  EXPECT_EQ("[]", info.servicesJson);
  EXPECT_TRUE(info.links.empty());
  EXPECT_EQ(0, info.linkCount);
}

TEST(SystemInfoTest, EmptyPosition) {
  auto json = folly::parseJson(kSysinfoJson);
  json["lat"] = "";
  json["lon"] = nullptr;
  auto info = loadSystemInfo(json, "10.32.66.190");
  EXPECT_FALSE(info.latitude.has_value());
  EXPECT_FALSE(info.longitude.has_value());
}

TEST(SystemInfoTest, InvalidPayloads) {
  EXPECT_THROW(
      loadSystemInfo(folly::parseJson("[1, 2]"), "10.1.1.1"),
      std::invalid_argument);
  EXPECT_THROW(
      loadSystemInfo(folly::parseJson(R"({"node_details": {}})"), "10.1.1.1"),
      std::invalid_argument);
  EXPECT_THROW(
      loadSystemInfo(folly::parseJson(R"({"node": "x"})"), "10.1.1.1"),
      std::invalid_argument);

  auto json = folly::parseJson(kSysinfoJson);
  json["lat"] = "north";
  EXPECT_THROW(loadSystemInfo(json, "10.32.66.190"), std::invalid_argument);

  json = folly::parseJson(kSysinfoJson);
  json["link_info"]["10.44.1.2"] = "broken";
  EXPECT_THROW(loadSystemInfo(json, "10.32.66.190"), std::invalid_argument);

  // counts that do not fit an integer
  json = folly::parseJson(kSysinfoJson);
  json["tunnels"]["active_tunnel_count"] = "nan";
  EXPECT_THROW(loadSystemInfo(json, "10.32.66.190"), std::invalid_argument);
}

TEST(SystemInfoTest, NormalizeHostName) {
  EXPECT_EQ("N0CALL-hAP", normalizeHostName("N0CALL-hAP.local.mesh"));
  EXPECT_EQ("N0CALL-hAP", normalizeHostName("mid1.N0CALL-hAP.local.mesh"));
  EXPECT_EQ("N0CALL-hAP", normalizeHostName("mid12.N0CALL-hAP"));
  EXPECT_EQ("N0CALL-hAP", normalizeHostName("N0CALL-hAP"));
  EXPECT_EQ("dtdlink.N0CALL", normalizeHostName("dtdlink.N0CALL.local.mesh"));
  EXPECT_EQ("", normalizeHostName(""));
}

TEST(SystemInfoTest, BandFromFrequency) {
  EXPECT_EQ("900MHz", bandFromFrequency("912", ""));
  EXPECT_EQ("2.4GHz", bandFromFrequency("2.412 GHz", ""));
  EXPECT_EQ("2.4GHz", bandFromFrequency("2412", ""));
  EXPECT_EQ("3.4GHz", bandFromFrequency("3.380", ""));
  EXPECT_EQ("5.8GHz", bandFromFrequency("5805", "161"));

  // channel is used when the frequency is unknown
  EXPECT_EQ("2.4GHz", bandFromFrequency("", "-2"));
  EXPECT_EQ("3.4GHz", bandFromFrequency("", "84"));
  EXPECT_EQ("5.8GHz", bandFromFrequency("", "149"));
  EXPECT_EQ("Unknown", bandFromFrequency("", ""));
  EXPECT_EQ("Unknown", bandFromFrequency("", "50"));
}

TEST(SystemInfoTest, LinkTypes) {
  EXPECT_EQ(LinkType::RF, parseLinkType("RF"));
  EXPECT_EQ(LinkType::DTD, parseLinkType("DTD"));
  EXPECT_EQ(LinkType::TUN, parseLinkType("TUN"));
  EXPECT_EQ(LinkType::UNKNOWN, parseLinkType(""));
  EXPECT_EQ(LinkType::UNKNOWN, parseLinkType("SUPERNODE"));
  EXPECT_EQ("DTD", toString(LinkType::DTD));
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
