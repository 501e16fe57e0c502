/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "NodePoller.h"
#include "OlsrStream.h"
#include "TopologyAssembler.h"
#include "meshmap/store/TopologyStore.h"

namespace meshmap {
namespace collector {

// The collector loop gave up; the message names the reason
class ServiceAborted : public std::runtime_error {
 public:
  explicit ServiceAborted(const std::string& what)
      : std::runtime_error(what) {}
};

struct CollectorConfig {
  std::string olsrHost;
  int olsrPort{0};
  std::chrono::milliseconds olsrTimeout{5000};
  std::chrono::milliseconds pollingPeriod{std::chrono::minutes(30)};
  int nodeInactiveDays{1};
  int linkInactiveDays{1};
  // Consecutive failed connection attempts before giving up
  int maxRetries{5};
  // Run a single cycle and stop
  bool runOnce{false};
};

/**
 * The collector's main loop.
 *
 * Each cycle connects to the OLSR daemon, polls every node it lists,
 * merges the results and writes them to the store in one transaction, then
 * sleeps until the next period boundary.
 */
class CollectorService {
 public:
  enum class State {
    CONNECTING,
    POLLING,
    RECONCILING,
    SLEEPING,
    ABORTED,
    STOPPED,
  };

  // Opens a new OLSR stream; throws ConnectError on failure
  using StreamConnector = std::function<std::unique_ptr<OlsrStream>()>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  CollectorService(
      const CollectorConfig& config,
      NodePoller& poller,
      store::TopologyStore& store,
      StreamConnector connector,
      Sleeper sleeper);

  // Connector using OlsrStream::connect() with the configured target
  static StreamConnector makeStreamConnector(const CollectorConfig& config);

  /**
   * Run cycles until stopped (only when configured to run once).
   *
   * Throws ServiceAborted when connecting fails 'maxRetries' times in a
   * row, or on the first failure when running once. Store errors propagate
   * as thrown by the store.
   */
  void run();

  /**
   * Poll and store one cycle's topology from an open stream.
   *
   * Returns the merged network information.
   */
  NetworkInfo runCycle(
      std::unique_ptr<OlsrStream> stream,
      std::chrono::steady_clock::time_point cycleStart);

  State
  getState() const {
    return state_;
  }

  int64_t
  getCycleCount() const {
    return cycleCount_;
  }

 private:
  void setState(State state);

  const CollectorConfig config_;
  TopologyAssembler assembler_;
  store::TopologyStore& store_;
  StreamConnector connector_;
  Sleeper sleeper_;

  std::atomic<State> state_{State::CONNECTING};
  std::atomic<int64_t> cycleCount_{0};
};

std::string toString(CollectorService::State state);

} // namespace collector
} // namespace meshmap
