/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <pqxx/pqxx>

#include "TopologyStore.h"

namespace meshmap {
namespace store {

/**
 * Topology store backed by PostgreSQL tables "node", "link" and
 * "collector_stat". The schema is created and migrated elsewhere.
 *
 * One connection is shared by all transactions, which are serialized.
 */
class PostgresTopologyStore final : public TopologyStore {
 public:
  // Throws pqxx::broken_connection if the database is unreachable
  explicit PostgresTopologyStore(const std::string& uri);

  std::unique_ptr<TopologyTransaction> begin() override;

 private:
  class Transaction;

  std::unique_ptr<pqxx::connection> conn_;
  std::mutex lock_;
};

} // namespace store
} // namespace meshmap
