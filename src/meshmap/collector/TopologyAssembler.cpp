/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TopologyAssembler.h"

#include <algorithm>

#include <folly/Format.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/executors/thread_factory/NamedThreadFactory.h>
#include <folly/futures/Future.h>
#include <glog/logging.h>

#include "Consts.h"
#include "meshmap/common/TimeUtils.h"

namespace meshmap {
namespace collector {

TopologyAssembler::TopologyAssembler(NodePoller& poller) : poller_(poller) {}

NetworkInfo
TopologyAssembler::assemble(OlsrStream& stream) {
  const auto startTime = TimeUtils::getSteadyTimePoint();

  // poll nodes as their addresses arrive, while this thread drains links
  folly::CPUThreadPoolExecutor pollExecutor(
      1, std::make_shared<folly::NamedThreadFactory>("TopologyAssembler"));
  auto pollFuture = folly::via(
      folly::getKeepAliveToken(pollExecutor), [this, &stream]() {
        return poller_.pollNodes(stream.nodes());
      });

  std::vector<OlsrLink> olsrLinks;
  while (auto link = stream.links().next()) {
    olsrLinks.push_back(std::move(*link));
  }
  VLOG(1) << "Drained " << olsrLinks.size() << " OLSR links";

  auto results = std::move(pollFuture).get();

  auto networkInfo = merge(std::move(results), olsrLinks);
  networkInfo.olsrStats = stream.getStats().toMap();
  networkInfo.pollingDuration = TimeUtils::getSteadyTimePoint() - startTime;
  return networkInfo;
}

NetworkInfo
TopologyAssembler::merge(
    std::vector<NodeResult> results, const std::vector<OlsrLink>& olsrLinks) {
  NetworkInfo networkInfo;
  auto& counters = networkInfo.counters;
  counters["node results"] = (int64_t)results.size();
  counters["errors (totals)"] = 0;
  counters["using link_info json"] = 0;
  counters["using olsr for link cost"] = 0;
  counters["using olsr for link data"] = 0;

  // completion order of the poll tasks must not leak into the output
  std::sort(
      results.begin(),
      results.end(),
      [](const NodeResult& a, const NodeResult& b) {
        return a.getIpAddress() < b.getIpAddress();
      });

  // declared names of every node that answered
  std::unordered_map<std::string, std::string> ipNameMap;
  for (const auto& result : results) {
    if (result.ok() && !result.getName().empty() &&
        !result.getIpAddress().empty()) {
      ipNameMap[result.getIpAddress()] = result.getName();
    }
  }

  std::unordered_map<std::string, std::vector<OlsrLink>> olsrBySource;
  for (const auto& link : olsrLinks) {
    olsrBySource[link.source].push_back(link);
  }
  const std::vector<OlsrLink> kNoLinks;

  for (auto& result : results) {
    if (!result.ok()) {
      counters["errors (totals)"]++;
      const auto kind = toString(result.getError().error);
      counters[folly::sformat("errors ({})", kind)]++;
      networkInfo.errors.push_back(std::move(result));
      continue;
    }

    SystemInfo node = std::move(result.getSystemInfo());
    auto it = olsrBySource.find(node.ipAddress);
    const auto& nodeOlsrLinks =
        it == olsrBySource.end() ? kNoLinks : it->second;

    if (!node.links.empty()) {
      counters["using link_info json"]++;
      if (!node.reportsLinkCost()) {
        // older firmware does not report the cost, take it from OLSR
        counters["using olsr for link cost"]++;
        for (auto& link : node.links) {
          auto olsrLink = std::find_if(
              nodeOlsrLinks.begin(),
              nodeOlsrLinks.end(),
              [&link](const OlsrLink& l) {
                return l.destination == link.destinationIp;
              });
          if (olsrLink == nodeOlsrLinks.end()) {
            LOG(WARNING) << folly::format(
                "No OLSR link found for {} -> {}",
                node.toString(),
                link.destinationIp);
            continue;
          }
          link.olsrCost = olsrLink->cost;
        }
      }
      node.linkCount = (int64_t)node.links.size();
    } else {
      counters["using olsr for link data"]++;
      if (nodeOlsrLinks.empty()) {
        LOG(WARNING) << "No links found for " << node.toString();
      } else {
        node.links = olsrLinksFor(node, nodeOlsrLinks, ipNameMap);
      }
      // counts OLSR neighbors, including ones that could not be named
      node.linkCount = (int64_t)nodeOlsrLinks.size();
    }

    networkInfo.links.insert(
        networkInfo.links.end(), node.links.begin(), node.links.end());
    networkInfo.nodes.push_back(std::move(node));
  }

  LOG(INFO) << "Network Info Summary:";
  for (const auto& kv : counters) {
    LOG(INFO) << folly::format("  {}: {}", kv.first, kv.second);
  }
  return networkInfo;
}

std::vector<LinkInfo>
TopologyAssembler::olsrLinksFor(
    const SystemInfo& node,
    const std::vector<OlsrLink>& olsrLinks,
    const std::unordered_map<std::string, std::string>& ipNameMap) {
  std::vector<LinkInfo> links;
  for (const auto& olsrLink : olsrLinks) {
    auto nameIt = ipNameMap.find(olsrLink.destination);
    if (nameIt == ipNameMap.end()) {
      LOG(WARNING) << folly::format(
          "Could not find name for {}, ignoring OLSR link from {}",
          olsrLink.destination,
          node.toString());
      continue;
    }

    LinkInfo link;
    link.source = node.nodeName;
    link.sourceIp = node.ipAddress;
    link.destination = nameIt->second;
    link.destinationIp = olsrLink.destination;
    link.type = LinkType::UNKNOWN;
    link.interface = CollectorConsts::kUnknownInterface;
    link.olsrCost = olsrLink.cost;
    links.push_back(std::move(link));
  }
  return links;
}

} // namespace collector
} // namespace meshmap
