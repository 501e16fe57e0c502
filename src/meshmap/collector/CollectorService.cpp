/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "CollectorService.h"

#include <algorithm>

#include <folly/Format.h>
#include <folly/dynamic.h>
#include <glog/logging.h>

#include "TopologyReconciler.h"
#include "meshmap/common/JsonUtils.h"
#include "meshmap/common/TimeUtils.h"

namespace {
folly::dynamic
toDynamic(const std::map<std::string, int64_t>& counters) {
  folly::dynamic obj = folly::dynamic::object;
  for (const auto& kv : counters) {
    obj[kv.first] = kv.second;
  }
  return obj;
}
} // namespace

namespace meshmap {
namespace collector {

std::string
toString(CollectorService::State state) {
  switch (state) {
    case CollectorService::State::CONNECTING:
      return "CONNECTING";
    case CollectorService::State::POLLING:
      return "POLLING";
    case CollectorService::State::RECONCILING:
      return "RECONCILING";
    case CollectorService::State::SLEEPING:
      return "SLEEPING";
    case CollectorService::State::ABORTED:
      return "ABORTED";
    case CollectorService::State::STOPPED:
      return "STOPPED";
  }
  return "UNKNOWN";
}

CollectorService::CollectorService(
    const CollectorConfig& config,
    NodePoller& poller,
    store::TopologyStore& store,
    StreamConnector connector,
    Sleeper sleeper)
    : config_(config),
      assembler_(poller),
      store_(store),
      connector_(std::move(connector)),
      sleeper_(std::move(sleeper)) {}

CollectorService::StreamConnector
CollectorService::makeStreamConnector(const CollectorConfig& config) {
  return [host = config.olsrHost,
          port = config.olsrPort,
          timeout = config.olsrTimeout]() {
    return OlsrStream::connect(host, port, timeout);
  };
}

void
CollectorService::setState(State state) {
  VLOG(1) << "Collector state: " << toString(state_.load()) << " -> "
          << toString(state);
  state_ = state;
}

void
CollectorService::run() {
  const int maxAttempts = std::max(config_.maxRetries, 1);
  int failedAttempts = 0;

  while (true) {
    const auto cycleStart = TimeUtils::getSteadyTimePoint();
    setState(State::CONNECTING);

    std::unique_ptr<OlsrStream> stream;
    try {
      stream = connector_();
    } catch (const ConnectError& ex) {
      failedAttempts++;
      LOG(ERROR) << folly::format(
          "Connection attempt {} of {} failed: {}",
          failedAttempts,
          maxAttempts,
          ex.what());
      if (config_.runOnce || failedAttempts >= maxAttempts) {
        setState(State::ABORTED);
        throw ServiceAborted(folly::sformat(
            "Unable to connect to OLSR daemon {}:{} after {} attempt(s): {}",
            config_.olsrHost,
            config_.olsrPort,
            failedAttempts,
            ex.what()));
      }
      setState(State::SLEEPING);
      sleeper_(config_.pollingPeriod);
      continue;
    }
    failedAttempts = 0;

    runCycle(std::move(stream), cycleStart);

    if (config_.runOnce) {
      setState(State::STOPPED);
      LOG(INFO) << "Single collection run finished";
      return;
    }

    setState(State::SLEEPING);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        TimeUtils::getSteadyTimePoint() - cycleStart);
    const auto sleepTime =
        TimeUtils::timeUntilNextPeriod(elapsed, config_.pollingPeriod);
    LOG(INFO) << "Sleeping for " << TimeUtils::formatDuration(sleepTime);
    sleeper_(sleepTime);
  }
}

NetworkInfo
CollectorService::runCycle(
    std::unique_ptr<OlsrStream> stream,
    std::chrono::steady_clock::time_point cycleStart) {
  const auto startedAt = store::Clock::now();

  setState(State::POLLING);
  auto networkInfo = assembler_.assemble(*stream);
  // the daemon connection is not needed past this point
  stream.reset();
  LOG(INFO) << "Network polling took "
            << TimeUtils::formatDuration(networkInfo.pollingDuration);

  setState(State::RECONCILING);
  const auto dbStart = TimeUtils::getSteadyTimePoint();
  const auto now = store::Clock::now();
  auto txn = store_.begin();
  auto nodeCounters =
      TopologyReconciler::saveNodes(*txn, networkInfo.nodes, now);
  auto linkCounters =
      TopologyReconciler::saveLinks(*txn, networkInfo.links, now);
  // expire after saving so a long pause does not expire refreshed data
  auto expiryCounters = TopologyReconciler::expireData(
      *txn, now, config_.nodeInactiveDays, config_.linkInactiveDays);

  folly::dynamic otherStats = folly::dynamic::object;
  otherStats["olsr"] = toDynamic(networkInfo.olsrStats);
  otherStats["network info"] = toDynamic(networkInfo.counters);
  otherStats["nodes"] = toDynamic(nodeCounters);
  otherStats["links"] = toDynamic(linkCounters);
  otherStats["expired"] = toDynamic(expiryCounters);

  store::CollectorStat stat;
  stat.startedAt = startedAt;
  stat.finishedAt = store::Clock::now();
  stat.nodeCount = (int64_t)networkInfo.nodes.size();
  stat.linkCount = (int64_t)networkInfo.links.size();
  stat.errorCount = (int64_t)networkInfo.errors.size();
  stat.pollingDurationS = TimeUtils::toSeconds(networkInfo.pollingDuration);
  stat.totalDurationS =
      TimeUtils::toSeconds(TimeUtils::getSteadyTimePoint() - cycleStart);
  stat.otherStats = JsonUtils::toSortedJson(otherStats);
  txn->addCollectorStat(stat);
  txn->commit();

  cycleCount_++;
  LOG(INFO) << "Database update took "
            << TimeUtils::formatDuration(
                   TimeUtils::getSteadyTimePoint() - dbStart);
  LOG(INFO) << "Collection cycle took "
            << TimeUtils::formatDuration(
                   TimeUtils::getSteadyTimePoint() - cycleStart);
  return networkInfo;
}

} // namespace collector
} // namespace meshmap
