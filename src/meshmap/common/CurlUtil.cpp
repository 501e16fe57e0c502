/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "CurlUtil.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <curl/curl.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

extern "C" {
static size_t
curlWrite(void* ptr, size_t size, size_t nmemb, void* userp) {
  size_t realSize = size * nmemb;
  auto body = static_cast<std::string*>(userp);
  body->append(static_cast<const char*>(ptr), realSize);
  return realSize;
}
}

namespace meshmap {

std::string
CurlUtil::buildUrl(
    const std::string& url,
    const std::unordered_map<std::string, std::string>& params) {
  if (params.empty()) {
    return url;
  }

  // sort for a stable URL regardless of hash order
  std::vector<std::pair<std::string, std::string>> sorted(
      params.begin(), params.end());
  std::sort(sorted.begin(), sorted.end());

  std::vector<std::string> parts;
  for (const auto& param : sorted) {
    parts.push_back(folly::sformat(
        "{}={}",
        folly::uriEscape<std::string>(param.first, folly::UriEscapeMode::QUERY),
        folly::uriEscape<std::string>(
            param.second, folly::UriEscapeMode::QUERY)));
  }
  return folly::sformat("{}?{}", url, folly::join("&", parts));
}

HttpResponse
CurlUtil::get(
    const std::string& url,
    const std::unordered_map<std::string, std::string>& params,
    std::chrono::milliseconds connectTimeout,
    std::chrono::milliseconds readTimeout) {
  auto curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Unable to initialize curl");
  }

  const std::string fullUrl = buildUrl(url, params);
  HttpResponse response;

  curl_easy_setopt(curl, CURLOPT_URL, fullUrl.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
  // required when used from multiple threads
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(
      curl, CURLOPT_CONNECTTIMEOUT_MS, (long)connectTimeout.count());
  // abort if the transfer is below 1 byte/sec for the read timeout
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(
      curl,
      CURLOPT_LOW_SPEED_TIME,
      std::max(
          1L,
          (long)std::chrono::duration_cast<std::chrono::seconds>(readTimeout)
              .count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curlWrite);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*)&response.body);

  auto res = curl_easy_perform(curl);
  if (res == CURLE_OK) {
    response.transport = HttpResponse::Transport::OK;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  } else {
    response.transport = res == CURLE_OPERATION_TIMEDOUT
        ? HttpResponse::Transport::TIMEOUT
        : HttpResponse::Transport::FAILED;
    response.error = folly::sformat(
        "CURL error for {}: {}", fullUrl, curl_easy_strerror(res));
    VLOG(3) << response.error;
  }

  curl_easy_cleanup(curl);
  return response;
}

} // namespace meshmap
