/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <string>

namespace meshmap {
namespace collector {

// Maps a node address to a display name. Must not throw; an unknown name is
// returned as an empty string.
using NameResolver = std::function<std::string(const std::string&)>;

/**
 * Reverse DNS lookup of an IPv4/IPv6 address, with the mesh domain suffix
 * removed ("n0call-hap.local.mesh" -> "n0call-hap").
 *
 * Returns an empty string if the address is invalid or has no name.
 */
std::string reverseLookupName(const std::string& ipAddress);

} // namespace collector
} // namespace meshmap
