/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "NameResolver.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <cstring>

#include <glog/logging.h>

#include "SystemInfo.h"

namespace meshmap {
namespace collector {

std::string
reverseLookupName(const std::string& ipAddress) {
  struct sockaddr_storage addr;
  memset(&addr, 0, sizeof(addr));
  socklen_t addrLen;

  auto addr4 = reinterpret_cast<struct sockaddr_in*>(&addr);
  auto addr6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
  if (inet_pton(AF_INET, ipAddress.c_str(), &addr4->sin_addr) == 1) {
    addr4->sin_family = AF_INET;
    addrLen = sizeof(struct sockaddr_in);
  } else if (inet_pton(AF_INET6, ipAddress.c_str(), &addr6->sin6_addr) == 1) {
    addr6->sin6_family = AF_INET6;
    addrLen = sizeof(struct sockaddr_in6);
  } else {
    VLOG(2) << "Not an IP address, skipping name lookup: " << ipAddress;
    return "";
  }

  char host[NI_MAXHOST];
  if (int res = getnameinfo(
          (struct sockaddr*)&addr,
          addrLen,
          host,
          sizeof(host),
          nullptr,
          0,
          NI_NAMEREQD)) {
    VLOG(2) << "Name lookup failed for " << ipAddress << ": "
            << gai_strerror(res);
    return "";
  }
  return normalizeHostName(host);
}

} // namespace collector
} // namespace meshmap
