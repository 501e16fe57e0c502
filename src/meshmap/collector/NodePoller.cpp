/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "NodePoller.h"

#include <exception>

#include <folly/ExceptionString.h>
#include <folly/Format.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/executors/thread_factory/NamedThreadFactory.h>
#include <folly/futures/Future.h>
#include <folly/json.h>
#include <glog/logging.h>

#include "Consts.h"
#include "meshmap/common/JsonUtils.h"
#include "meshmap/common/TimeUtils.h"

namespace {
// Number of response characters skipped when summarizing an error
const size_t kResponseExcerptOffset{10};
// Maximum response characters kept in log messages
const size_t kMaxLoggedResponse{200};

std::string
truncate(const std::string& s, size_t len) {
  return s.size() <= len ? s : s.substr(0, len) + "...";
}
} // namespace

namespace meshmap {
namespace collector {

std::string
toString(PollingError error) {
  switch (error) {
    case PollingError::CONNECTION_ERROR:
      return "Connection Error";
    case PollingError::TIMEOUT_ERROR:
      return "Timeout Error";
    case PollingError::HTTP_ERROR:
      return "HTTP Error";
    case PollingError::INVALID_RESPONSE:
      return "Invalid Response";
    case PollingError::PARSE_ERROR:
      return "Parse Error";
  }
  return "Unknown Error";
}

std::string
NodeError::toString() const {
  std::string excerpt = response.size() > kResponseExcerptOffset
      ? response.substr(kResponseExcerptOffset)
      : "";
  return folly::sformat(
      "{} ('{}...')", collector::toString(error), truncate(excerpt, 40));
}

NodeResult
NodeResult::success(const std::string& ipAddress, SystemInfo info) {
  NodeResult result;
  result.ipAddress_ = ipAddress;
  result.name_ = info.nodeName;
  result.systemInfo_ = std::move(info);
  return result;
}

NodeResult
NodeResult::failure(
    const std::string& ipAddress, const std::string& name, NodeError error) {
  NodeResult result;
  result.ipAddress_ = ipAddress;
  result.name_ = name;
  result.error_ = std::move(error);
  return result;
}

std::string
NodeResult::label() const {
  return folly::sformat(
      "{} ({})", name_.empty() ? "name unknown" : name_, ipAddress_);
}

NodePoller::NodePoller(
    const PollerConfig& config,
    std::shared_ptr<HttpClient> httpClient,
    NameResolver nameResolver)
    : config_(config),
      httpClient_(std::move(httpClient)),
      nameResolver_(std::move(nameResolver)) {
  if (config_.maxConnections == 0) {
    throw std::invalid_argument("maxConnections must be positive");
  }
}

std::vector<NodeResult>
NodePoller::pollNodes(Sequence<std::string>& addresses) {
  const auto startTime = TimeUtils::getSteadyTimePoint();

  // Session-scoped pool: the thread count is the concurrency limit, and the
  // executor is joined on every path out of this function
  folly::CPUThreadPoolExecutor executor(
      config_.maxConnections,
      std::make_shared<folly::NamedThreadFactory>("NodePoller"));

  std::vector<folly::Future<NodeResult>> tasks;
  std::exception_ptr addressError;
  try {
    while (auto address = addresses.next()) {
      VLOG(2) << "Creating task to poll " << *address;
      tasks.push_back(folly::via(
          folly::getKeepAliveToken(executor),
          [this, ipAddress = *address]() { return pollNode(ipAddress); }));
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed reading node addresses: " << folly::exceptionStr(ex);
    addressError = std::current_exception();
  }

  // collect all the results in a single list, dropping any exceptions
  std::vector<NodeResult> results;
  auto tries = folly::collectAll(tasks.begin(), tasks.end()).get();
  for (auto& t : tries) {
    if (t.hasException()) {
      LOG(ERROR) << "Unexpected exception polling nodes: "
                 << t.exception().what();
      continue;
    }
    results.push_back(std::move(t.value()));
  }
  executor.join();

  if (addressError) {
    std::rethrow_exception(addressError);
  }

  LOG(INFO) << "Querying nodes took "
            << TimeUtils::formatDuration(
                   TimeUtils::getSteadyTimePoint() - startTime);
  return results;
}

NodeResult
NodePoller::pollNode(const std::string& ipAddress) {
  VLOG(1) << ipAddress << " begin polling...";

  const std::string url = folly::sformat(
      "http://{}:{}{}",
      ipAddress,
      CollectorConsts::kNodeStatusPort,
      CollectorConsts::kNodeStatusPath);
  auto response =
      httpClient_->get(url, {{"services_local", "1"}, {"link_info", "1"}});

  if (response.transport != HttpResponse::Transport::OK) {
    return handleConnectionError(ipAddress, response);
  }

  // copying and pasting Unicode into node descriptions leaves invalid bytes
  const std::string text = JsonUtils::toValidUtf8(response.body);

  if (response.status != 200) {
    return handleResponseError(
        ipAddress,
        PollingError::HTTP_ERROR,
        folly::sformat("{}: {}", response.status, text));
  }

  folly::dynamic json;
  try {
    json = folly::parseJson(text);
  } catch (const std::exception& ex) {
    return handleResponseError(
        ipAddress,
        PollingError::INVALID_RESPONSE,
        text,
        folly::exceptionStr(ex).toStdString());
  }

  try {
    auto info = loadSystemInfo(json, ipAddress);
    LOG(INFO) << "Finished polling " << info.toString();
    return NodeResult::success(ipAddress, std::move(info));
  } catch (const std::exception& ex) {
    return handleResponseError(
        ipAddress,
        PollingError::PARSE_ERROR,
        text,
        folly::exceptionStr(ex).toStdString());
  }
}

NodeResult
NodePoller::handleConnectionError(
    const std::string& ipAddress, const HttpResponse& response) {
  // timeouts are checked first, they are a special kind of transport failure
  if (response.transport == HttpResponse::Transport::TIMEOUT) {
    auto result = NodeResult::failure(
        ipAddress,
        nameResolver_(ipAddress),
        NodeError{PollingError::TIMEOUT_ERROR, "Timeout error"});
    LOG(ERROR) << result.label() << ": " << response.error;
    return result;
  }

  auto result = NodeResult::failure(
      ipAddress,
      nameResolver_(ipAddress),
      NodeError{PollingError::CONNECTION_ERROR, response.error});
  LOG(ERROR) << result.label() << ": " << response.error;
  return result;
}

NodeResult
NodePoller::handleResponseError(
    const std::string& ipAddress,
    PollingError error,
    const std::string& response,
    const std::string& reason) {
  auto result = NodeResult::failure(
      ipAddress, nameResolver_(ipAddress), NodeError{error, response});

  switch (error) {
    case PollingError::HTTP_ERROR:
      LOG(ERROR) << result.label() << ": HTTP error "
                 << truncate(response, kMaxLoggedResponse);
      break;
    case PollingError::INVALID_RESPONSE:
      LOG(ERROR) << result.label() << ": Invalid JSON response: " << reason
                 << " (" << truncate(response, kMaxLoggedResponse) << ")";
      break;
    case PollingError::PARSE_ERROR:
      LOG(ERROR) << result.label()
                 << ": Parsing node information failed: " << reason;
      break;
    default:
      LOG(ERROR) << result.label() << ": " << toString(error);
      break;
  }
  return result;
}

} // namespace collector
} // namespace meshmap
