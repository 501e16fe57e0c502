/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/init/Init.h>
#include <folly/json.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "../CollectorService.h"
#include "CollectorTestUtils.h"
#include "meshmap/store/MemoryTopologyStore.h"

using namespace meshmap;
using namespace meshmap::collector;
using namespace meshmap::collector::test;

namespace {
// Thrown by the test sleeper to leave the perpetual loop
class StopLoop : public std::runtime_error {
 public:
  StopLoop() : std::runtime_error("stop") {}
};
} // namespace

class CollectorServiceFixture : public ::testing::Test {
 protected:
  void
  SetUp() override {
    httpClient_ = std::make_shared<FakeHttpClient>();
    httpClient_->setBody(
        "10.1.1.1", folly::toJson(makeSysinfo("aa-node", "1.5")));
    httpClient_->setBody(
        "10.1.1.2", folly::toJson(makeSysinfo("bb-node", "1.5")));
    poller_ = std::make_unique<NodePoller>(
        PollerConfig(), httpClient_, [](const std::string&) {
          return std::string();
        });

    config_.olsrHost = "localnode";
    config_.olsrPort = 2004;
    config_.pollingPeriod = std::chrono::minutes(30);
  }

  // Connector following 'script': true opens a stream, false fails
  CollectorService::StreamConnector
  scriptedConnector(std::vector<bool> script) {
    return [this, script]() -> std::unique_ptr<OlsrStream> {
      size_t attempt = connectAttempts_++;
      if (attempt < script.size() && script[attempt]) {
        return makeStream({
            olsrLine("10.1.1.1", "10.1.1.2", "1.000"),
            olsrLine("10.1.1.2", "10.1.1.1", "1.000"),
        });
      }
      throw ConnectError("Connection refused");
    };
  }

  std::unique_ptr<CollectorService>
  makeService(
      CollectorService::StreamConnector connector, size_t maxSleeps = 100) {
    return std::make_unique<CollectorService>(
        config_,
        *poller_,
        store_,
        std::move(connector),
        [this, maxSleeps](std::chrono::milliseconds duration) {
          sleeps_.push_back(duration);
          if (sleeps_.size() >= maxSleeps) {
            throw StopLoop();
          }
        });
  }

  CollectorConfig config_;
  std::shared_ptr<FakeHttpClient> httpClient_;
  std::unique_ptr<NodePoller> poller_;
  store::MemoryTopologyStore store_;
  size_t connectAttempts_{0};
  std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(CollectorServiceFixture, AbortsAfterMaxRetries) {
  config_.maxRetries = 2;
  auto service = makeService(scriptedConnector({}));

  try {
    service->run();
    FAIL() << "Expected ServiceAborted";
  } catch (const ServiceAborted& ex) {
    std::string what = ex.what();
    EXPECT_NE(std::string::npos, what.find("localnode:2004"));
    EXPECT_NE(std::string::npos, what.find("2 attempt"));
    EXPECT_NE(std::string::npos, what.find("Connection refused"));
  }

  EXPECT_EQ(2u, connectAttempts_);
  // one full period between the two attempts
  ASSERT_EQ(1u, sleeps_.size());
  EXPECT_EQ(config_.pollingPeriod, sleeps_[0]);
  EXPECT_EQ(CollectorService::State::ABORTED, service->getState());
  EXPECT_EQ(0, service->getCycleCount());
  EXPECT_TRUE(store_.getCollectorStats().empty());
}

TEST_F(CollectorServiceFixture, NonPositiveRetriesMeansOneAttempt) {
  config_.maxRetries = 0;
  auto service = makeService(scriptedConnector({}));
  EXPECT_THROW(service->run(), ServiceAborted);
  EXPECT_EQ(1u, connectAttempts_);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(CollectorServiceFixture, RunOnceFailureAborts) {
  config_.runOnce = true;
  auto service = makeService(scriptedConnector({false, true}));
  EXPECT_THROW(service->run(), ServiceAborted);
  EXPECT_EQ(1u, connectAttempts_);
  EXPECT_TRUE(sleeps_.empty());
  EXPECT_EQ(CollectorService::State::ABORTED, service->getState());
}

TEST_F(CollectorServiceFixture, RunOnce) {
  config_.runOnce = true;
  auto service = makeService(scriptedConnector({true}));
  service->run();

  EXPECT_EQ(CollectorService::State::STOPPED, service->getState());
  EXPECT_EQ(1, service->getCycleCount());
  EXPECT_TRUE(sleeps_.empty());

  auto nodes = store_.getNodes();
  ASSERT_EQ(2u, nodes.size());
  EXPECT_EQ("aa-node", nodes[0].name);
  EXPECT_EQ("bb-node", nodes[1].name);
  EXPECT_EQ(1, nodes[0].linkCount);

  auto links = store_.getLinks();
  ASSERT_EQ(2u, links.size());
  for (const auto& link : links) {
    EXPECT_EQ(store::LinkStatus::CURRENT, link.status);
    EXPECT_EQ(1.0, link.olsrCost.value());
  }

  auto stats = store_.getCollectorStats();
  ASSERT_EQ(1u, stats.size());
  EXPECT_EQ(2, stats[0].nodeCount);
  EXPECT_EQ(2, stats[0].linkCount);
  EXPECT_EQ(0, stats[0].errorCount);
  EXPECT_LE(stats[0].startedAt, stats[0].finishedAt);

  auto otherStats = folly::parseJson(stats[0].otherStats);
  EXPECT_EQ(2, otherStats["nodes"]["added"].asInt());
  EXPECT_EQ(2, otherStats["links"]["new"].asInt());
  EXPECT_EQ(2, otherStats["network info"]["node results"].asInt());
  EXPECT_TRUE(otherStats.count("olsr"));
  EXPECT_TRUE(otherStats.count("expired"));
}

TEST_F(CollectorServiceFixture, PollErrorsAreCounted) {
  config_.runOnce = true;
  httpClient_->setBody("10.1.1.2", "Server Error", 500);
  auto service = makeService(scriptedConnector({true}));
  service->run();

  auto stats = store_.getCollectorStats();
  ASSERT_EQ(1u, stats.size());
  EXPECT_EQ(1, stats[0].nodeCount);
  EXPECT_EQ(1, stats[0].errorCount);
  // the failed node is not an active endpoint
  EXPECT_TRUE(store_.getLinks().empty());
}

TEST_F(CollectorServiceFixture, SuccessResetsRetryCount) {
  config_.maxRetries = 3;
  auto service = makeService(
      scriptedConnector({false, false, true, false, false, false}));

  try {
    service->run();
    FAIL() << "Expected ServiceAborted";
  } catch (const ServiceAborted& ex) {
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("3 attempt"));
  }

  EXPECT_EQ(6u, connectAttempts_);
  EXPECT_EQ(1, service->getCycleCount());
  ASSERT_EQ(5u, sleeps_.size());
  EXPECT_EQ(config_.pollingPeriod, sleeps_[0]);
  EXPECT_EQ(config_.pollingPeriod, sleeps_[1]);
  // after a cycle, only the rest of the period is slept
  EXPECT_LE(sleeps_[2], config_.pollingPeriod);
  EXPECT_GT(sleeps_[2].count(), 0);
  EXPECT_EQ(config_.pollingPeriod, sleeps_[3]);
}

TEST_F(CollectorServiceFixture, RepeatedCycles) {
  auto service = makeService(scriptedConnector({true, true, true}), 3);
  EXPECT_THROW(service->run(), StopLoop);

  EXPECT_EQ(3, service->getCycleCount());
  EXPECT_EQ(3u, store_.getCollectorStats().size());
  // the same nodes are refreshed, not duplicated
  EXPECT_EQ(2u, store_.getNodes().size());
  EXPECT_EQ(2u, store_.getLinks().size());
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
