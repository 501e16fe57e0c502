/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Consts.h"

namespace meshmap {
namespace collector {

// --- OLSR daemon ---
const int CollectorConsts::kOlsrDefaultPort{2004};
const std::string CollectorConsts::kOlsrUnreachableLabel{"INFINITE"};
const double CollectorConsts::kOlsrUnreachableCost{99.99};

// --- Node status endpoint ---
const int CollectorConsts::kNodeStatusPort{8080};
const std::string CollectorConsts::kNodeStatusPath{"/cgi-bin/sysinfo.json"};
const std::pair<int, int> CollectorConsts::kLinkCostApiVersion{1, 9};

// --- Names ---
const std::string CollectorConsts::kMeshDomainSuffix{".local.mesh"};
const std::string CollectorConsts::kUnknownInterface{"unknown"};

// --- Timeouts ---
const std::chrono::milliseconds CollectorConsts::kOlsrReadTimeout{60000};

} // namespace collector
} // namespace meshmap
