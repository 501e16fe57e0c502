/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

#include <curl/curl.h>
#include <folly/ExceptionString.h>
#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "CollectorService.h"
#include "Consts.h"
#include "HttpClient.h"
#include "NameResolver.h"
#include "NodePoller.h"
#include "meshmap/store/MemoryTopologyStore.h"
#include "meshmap/store/PostgresTopologyStore.h"

using namespace meshmap;
using namespace meshmap::collector;

// OLSR daemon
DEFINE_string(
    olsr_host,
    CollectorConsts::kOlsrDefaultHost,
    "The host running the OLSR daemon's topology export");
DEFINE_int32(
    olsr_port,
    CollectorConsts::kOlsrDefaultPort,
    "The port of the OLSR topology export");
DEFINE_int32(
    olsr_timeout_s, 5, "Timeout connecting to the OLSR daemon (in seconds)");

// Node polling
DEFINE_int32(
    max_connections, 50, "Maximum number of nodes polled concurrently");
DEFINE_int32(
    connect_timeout_s, 10, "Timeout connecting to a node (in seconds)");
DEFINE_int32(
    read_timeout_s, 15, "Timeout reading a node's response (in seconds)");

// Service loop
DEFINE_int32(polling_period_m, 30, "Time between collections (in minutes)");
DEFINE_int32(
    node_inactive_days,
    1,
    "Days without a sighting before a node is marked inactive");
DEFINE_int32(
    link_inactive_days,
    1,
    "Days without a sighting before a recent link is marked inactive");
DEFINE_int32(
    max_retries,
    5,
    "Consecutive OLSR connection failures tolerated before exiting");
DEFINE_bool(run_once, false, "Run a single collection and exit");

// Storage
DEFINE_string(
    db_uri,
    "",
    "PostgreSQL connection string (an in-memory store is used when empty)");


int
main(int argc, char** argv) {
  folly::init(&argc, &argv);

  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    LOG(ERROR) << "curl_global_init() failed";
    return 1;
  }

  PollerConfig pollerConfig;
  pollerConfig.maxConnections = std::max(FLAGS_max_connections, 1);

  CollectorConfig collectorConfig;
  collectorConfig.olsrHost = FLAGS_olsr_host;
  collectorConfig.olsrPort = FLAGS_olsr_port;
  collectorConfig.olsrTimeout = std::chrono::seconds(FLAGS_olsr_timeout_s);
  collectorConfig.pollingPeriod = std::chrono::minutes(FLAGS_polling_period_m);
  collectorConfig.nodeInactiveDays = FLAGS_node_inactive_days;
  collectorConfig.linkInactiveDays = FLAGS_link_inactive_days;
  collectorConfig.maxRetries = FLAGS_max_retries;
  collectorConfig.runOnce = FLAGS_run_once;

  int ret = 0;
  try {
    std::unique_ptr<store::TopologyStore> topologyStore;
    if (FLAGS_db_uri.empty()) {
      LOG(WARNING) << "No database configured, results are kept in memory";
      topologyStore = std::make_unique<store::MemoryTopologyStore>();
    } else {
      topologyStore = std::make_unique<store::PostgresTopologyStore>(
          FLAGS_db_uri);
    }

    NodePoller poller(
        pollerConfig,
        std::make_shared<CurlHttpClient>(
            std::chrono::seconds(FLAGS_connect_timeout_s),
            std::chrono::seconds(FLAGS_read_timeout_s)),
        reverseLookupName);

    CollectorService service(
        collectorConfig,
        poller,
        *topologyStore,
        CollectorService::makeStreamConnector(collectorConfig),
        [](std::chrono::milliseconds duration) {
          std::this_thread::sleep_for(duration);
        });

    LOG(INFO) << "Starting collector (polling every "
              << FLAGS_polling_period_m << " minutes)";
    service.run();
  } catch (const ServiceAborted& ex) {
    LOG(ERROR) << "Collector aborted: " << ex.what();
    ret = 1;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Collector failed: " << folly::exceptionStr(ex);
    ret = 1;
  }

  curl_global_cleanup();
  return ret;
}
