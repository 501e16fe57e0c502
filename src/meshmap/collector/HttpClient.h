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

#include "meshmap/common/CurlUtil.h"

namespace meshmap {
namespace collector {

/**
 * Minimal HTTP GET interface used to fetch node status pages.
 *
 * Implementations must be callable from several threads at once.
 */
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(
      const std::string& url,
      const std::unordered_map<std::string, std::string>& params) = 0;
};

/**
 * HttpClient backed by libcurl.
 */
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient(
      std::chrono::milliseconds connectTimeout,
      std::chrono::milliseconds readTimeout);

  HttpResponse get(
      const std::string& url,
      const std::unordered_map<std::string, std::string>& params) override;

 private:
  const std::chrono::milliseconds connectTimeout_;
  const std::chrono::milliseconds readTimeout_;
};

} // namespace collector
} // namespace meshmap
