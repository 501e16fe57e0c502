/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace meshmap {

/**
 * Result of a single HTTP request.
 *
 * 'transport' reports whether a response was received at all; 'status' and
 * 'body' are only meaningful when it is OK.
 */
struct HttpResponse {
  enum class Transport {
    OK,
    TIMEOUT,
    FAILED,
  };

  Transport transport{Transport::FAILED};
  long status{0};
  std::string body;
  // Transport-level error description (empty when transport is OK)
  std::string error;
};

/**
 * Wrapper class around libcurl.
 *
 * curl_global_init() must have been called once by the process before any
 * request is issued from multiple threads.
 */
class CurlUtil {
 public:
  /**
   * Issue an HTTP GET for the given URL with the query parameters appended.
   *
   * 'connectTimeout' bounds connection establishment. 'readTimeout' aborts the
   * transfer when no data arrives for that long.
   *
   * Never throws for network failures; those are reported in the returned
   * HttpResponse. Throws std::runtime_error if curl cannot be initialized.
   */
  static HttpResponse get(
      const std::string& url,
      const std::unordered_map<std::string, std::string>& params,
      std::chrono::milliseconds connectTimeout,
      std::chrono::milliseconds readTimeout);

  /** Build "url?k1=v1&k2=v2" with URL-escaped keys and values. */
  static std::string buildUrl(
      const std::string& url,
      const std::unordered_map<std::string, std::string>& params);
};

} // namespace meshmap
