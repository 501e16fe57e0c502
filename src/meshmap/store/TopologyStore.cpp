/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TopologyStore.h"

#include <stdexcept>

namespace meshmap {
namespace store {

std::string
toString(NodeStatus status) {
  switch (status) {
    case NodeStatus::ACTIVE:
      return "active";
    case NodeStatus::INACTIVE:
      return "inactive";
  }
  return "unknown";
}

std::string
toString(LinkStatus status) {
  switch (status) {
    case LinkStatus::CURRENT:
      return "current";
    case LinkStatus::RECENT:
      return "recent";
    case LinkStatus::INACTIVE:
      return "inactive";
  }
  return "unknown";
}

NodeStatus
parseNodeStatus(const std::string& status) {
  if (status == "active") {
    return NodeStatus::ACTIVE;
  }
  if (status == "inactive") {
    return NodeStatus::INACTIVE;
  }
  throw std::invalid_argument("Unknown node status: " + status);
}

LinkStatus
parseLinkStatus(const std::string& status) {
  if (status == "current") {
    return LinkStatus::CURRENT;
  }
  if (status == "recent") {
    return LinkStatus::RECENT;
  }
  if (status == "inactive") {
    return LinkStatus::INACTIVE;
  }
  throw std::invalid_argument("Unknown link status: " + status);
}

} // namespace store
} // namespace meshmap
