/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "HttpClient.h"
#include "NameResolver.h"
#include "Sequence.h"
#include "SystemInfo.h"

namespace meshmap {
namespace collector {

/**
 * Ways polling a single node can fail.
 */
enum class PollingError {
  CONNECTION_ERROR,
  TIMEOUT_ERROR,
  HTTP_ERROR,
  INVALID_RESPONSE,
  PARSE_ERROR,
};

// Human-readable name, e.g. "HTTP Error", "Timeout Error"
std::string toString(PollingError error);

struct NodeError {
  PollingError error;
  // Response body (or transport error message) for diagnosis
  std::string response;

  // e.g. "HTTP Error ('404: Not F...')"
  std::string toString() const;
};

/**
 * Outcome of polling one node: either system information or an error.
 */
class NodeResult {
 public:
  static NodeResult success(const std::string& ipAddress, SystemInfo info);

  static NodeResult failure(
      const std::string& ipAddress,
      const std::string& name,
      NodeError error);

  const std::string&
  getIpAddress() const {
    return ipAddress_;
  }

  const std::string&
  getName() const {
    return name_;
  }

  bool
  ok() const {
    return systemInfo_.has_value();
  }

  // Only valid when ok()
  const SystemInfo&
  getSystemInfo() const {
    return *systemInfo_;
  }

  SystemInfo&
  getSystemInfo() {
    return *systemInfo_;
  }

  // Only valid when !ok()
  const NodeError&
  getError() const {
    return *error_;
  }

  // "<name> (<ip>)", or "name unknown (<ip>)"
  std::string label() const;

 private:
  NodeResult() = default;

  std::string ipAddress_;
  std::string name_;
  std::optional<SystemInfo> systemInfo_;
  std::optional<NodeError> error_;
};

struct PollerConfig {
  // Maximum number of requests in flight at once
  size_t maxConnections{50};
};

/**
 * Polls the status endpoint of every node address it is given.
 *
 * Each address is scheduled as soon as it is drawn from the input sequence,
 * so polling overlaps with the production of the addresses. At most
 * 'maxConnections' requests run concurrently; excess requests wait.
 */
class NodePoller {
 public:
  NodePoller(
      const PollerConfig& config,
      std::shared_ptr<HttpClient> httpClient,
      NameResolver nameResolver);

  /**
   * Poll all addresses produced by 'addresses' and return one result per
   * node. Results of tasks that fail unexpectedly are logged and omitted.
   *
   * If the address sequence itself throws, the requests already scheduled
   * are finished before the exception is rethrown.
   */
  std::vector<NodeResult> pollNodes(Sequence<std::string>& addresses);

  /** Query one node and classify the outcome. */
  NodeResult pollNode(const std::string& ipAddress);


 private:
  NodeResult handleConnectionError(
      const std::string& ipAddress, const HttpResponse& response);

  NodeResult handleResponseError(
      const std::string& ipAddress,
      PollingError error,
      const std::string& response,
      const std::string& reason = "");

  const PollerConfig config_;
  std::shared_ptr<HttpClient> httpClient_;
  NameResolver nameResolver_;
};

} // namespace collector
} // namespace meshmap
