/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "HttpClient.h"

namespace meshmap {
namespace collector {

CurlHttpClient::CurlHttpClient(
    std::chrono::milliseconds connectTimeout,
    std::chrono::milliseconds readTimeout)
    : connectTimeout_(connectTimeout), readTimeout_(readTimeout) {}

HttpResponse
CurlHttpClient::get(
    const std::string& url,
    const std::unordered_map<std::string, std::string>& params) {
  return CurlUtil::get(url, params, connectTimeout_, readTimeout_);
}

} // namespace collector
} // namespace meshmap
