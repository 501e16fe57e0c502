/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <thread>

#include <folly/init/Init.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "../MemoryTopologyStore.h"

using namespace meshmap::store;

namespace {
NodeRecord
makeNode(
    const std::string& name,
    const std::string& mac,
    const std::string& ip,
    TimePoint lastSeen) {
  NodeRecord node;
  node.name = name;
  node.wlanMacAddress = mac;
  node.wlanIp = ip;
  node.lastSeen = lastSeen;
  return node;
}
} // namespace

class MemoryTopologyStoreFixture : public ::testing::Test {
 protected:
  MemoryTopologyStore store_;
  const TimePoint now_ = Clock::now();
};

TEST_F(MemoryTopologyStoreFixture, SaveAndFindNodes) {
  {
    auto txn = store_.begin();
    auto older =
        makeNode("node-a", "aa", "10.1.1.1", now_ - std::chrono::hours(2));
    auto newer = makeNode("node-a", "bb", "10.1.1.2", now_);
    txn->saveNode(older);
    txn->saveNode(newer);
    EXPECT_EQ(1, older.id);
    EXPECT_EQ(2, newer.id);

    // most recently seen first
    NodeQuery byName;
    byName.name = "node-a";
    auto found = txn->findNodes(byName);
    ASSERT_EQ(2u, found.size());
    EXPECT_EQ(2, found[0].id);
    EXPECT_EQ(1, found[1].id);

    NodeQuery byMacAndName;
    byMacAndName.name = "node-a";
    byMacAndName.wlanMacAddress = "aa";
    EXPECT_EQ(1u, txn->findNodes(byMacAndName).size());

    NodeQuery inactive;
    inactive.status = NodeStatus::INACTIVE;
    EXPECT_TRUE(txn->findNodes(inactive).empty());

    EXPECT_EQ(2u, txn->findNodes(NodeQuery()).size());
    txn->commit();
  }
  EXPECT_EQ(2u, store_.getNodes().size());
}

TEST_F(MemoryTopologyStoreFixture, UncommittedChangesAreDiscarded) {
  {
    auto txn = store_.begin();
    auto node = makeNode("node-a", "aa", "10.1.1.1", now_);
    txn->saveNode(node);
    txn->commit();
  }
  {
    auto txn = store_.begin();
    auto node = makeNode("node-b", "bb", "10.1.1.2", now_);
    txn->saveNode(node);
    txn->addCollectorStat(CollectorStat());
    // destroyed without commit
  }
  auto nodes = store_.getNodes();
  ASSERT_EQ(1u, nodes.size());
  EXPECT_EQ("node-a", nodes[0].name);
  EXPECT_TRUE(store_.getCollectorStats().empty());
}

TEST_F(MemoryTopologyStoreFixture, CommitTwiceFails) {
  auto txn = store_.begin();
  txn->commit();
  EXPECT_THROW(txn->commit(), std::logic_error);
}

TEST_F(MemoryTopologyStoreFixture, Links) {
  auto txn = store_.begin();
  auto a = makeNode("node-a", "aa", "10.1.1.1", now_);
  auto b = makeNode("node-b", "bb", "10.1.1.2", now_);
  txn->saveNode(a);
  txn->saveNode(b);

  LinkRecord link;
  link.sourceId = a.id;
  link.destinationId = b.id;
  link.olsrCost = 1.5;
  link.lastSeen = now_;
  txn->saveLink(link);

  auto found = txn->findLink(a.id, b.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(1.5, found->olsrCost);
  EXPECT_FALSE(txn->findLink(b.id, a.id).has_value());

  // links need existing endpoints
  LinkRecord dangling;
  dangling.sourceId = a.id;
  dangling.destinationId = 99;
  EXPECT_THROW(txn->saveLink(dangling), std::invalid_argument);

  EXPECT_EQ(
      1, txn->updateLinkStatus(LinkStatus::CURRENT, LinkStatus::RECENT));
  EXPECT_EQ(
      0, txn->updateLinkStatus(LinkStatus::CURRENT, LinkStatus::RECENT));
  EXPECT_EQ(LinkStatus::RECENT, txn->findLink(a.id, b.id)->status);
}

TEST_F(MemoryTopologyStoreFixture, Expiry) {
  auto txn = store_.begin();
  auto stale =
      makeNode("stale", "aa", "10.1.1.1", now_ - std::chrono::hours(48));
  auto fresh = makeNode("fresh", "bb", "10.1.1.2", now_);
  txn->saveNode(stale);
  txn->saveNode(fresh);

  LinkRecord oldLink;
  oldLink.sourceId = stale.id;
  oldLink.destinationId = fresh.id;
  oldLink.status = LinkStatus::RECENT;
  oldLink.lastSeen = now_ - std::chrono::hours(48);
  txn->saveLink(oldLink);

  // current links are left alone even when old
  LinkRecord currentLink = oldLink;
  currentLink.sourceId = fresh.id;
  currentLink.destinationId = stale.id;
  currentLink.status = LinkStatus::CURRENT;
  txn->saveLink(currentLink);

  const auto cutoff = now_ - std::chrono::hours(24);
  EXPECT_EQ(1, txn->expireLinks(cutoff));
  EXPECT_EQ(1, txn->expireNodes(cutoff));
  EXPECT_EQ(0, txn->expireNodes(cutoff));

  EXPECT_EQ(LinkStatus::INACTIVE, txn->findLink(stale.id, fresh.id)->status);
  EXPECT_EQ(LinkStatus::CURRENT, txn->findLink(fresh.id, stale.id)->status);

  NodeQuery active;
  active.status = NodeStatus::ACTIVE;
  auto nodes = txn->findNodes(active);
  ASSERT_EQ(1u, nodes.size());
  EXPECT_EQ("fresh", nodes[0].name);
}

TEST_F(MemoryTopologyStoreFixture, TransactionsAreSerialized) {
  auto first = store_.begin();
  auto node = makeNode("node-a", "aa", "10.1.1.1", now_);
  first->saveNode(node);

  size_t seen = 0;
  std::thread other([&]() {
    // blocks until the first transaction commits
    auto second = store_.begin();
    seen = second->findNodes(NodeQuery()).size();
    second->commit();
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  first->commit();
  other.join();

  EXPECT_EQ(1u, seen);
}

TEST(TopologyStoreTest, StatusNames) {
  EXPECT_EQ("active", toString(NodeStatus::ACTIVE));
  EXPECT_EQ(NodeStatus::INACTIVE, parseNodeStatus("inactive"));
  EXPECT_EQ("recent", toString(LinkStatus::RECENT));
  EXPECT_EQ(LinkStatus::CURRENT, parseLinkStatus("current"));
  EXPECT_THROW(parseLinkStatus("stale"), std::invalid_argument);
  EXPECT_THROW(parseNodeStatus(""), std::invalid_argument);
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
