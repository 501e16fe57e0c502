/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "Consts.h"
#include "Sequence.h"

namespace meshmap {
namespace collector {

/**
 * Failure to open a connection to the OLSR daemon.
 */
class ConnectError : public std::runtime_error {
 public:
  explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Link between two mesh addresses as exported by the OLSR daemon.
 */
struct OlsrLink {
  std::string source;
  std::string destination;
  double cost{0};

  // Build a link from the daemon's text label. The unreachable label maps
  // to a large finite cost; anything else must parse as a number.
  static OlsrLink
  fromStrings(
      const std::string& source,
      const std::string& destination,
      const std::string& label);

  std::string toString() const;

  bool
  operator==(const OlsrLink& other) const {
    return source == other.source && destination == other.destination &&
        cost == other.cost;
  }
};

/**
 * Diagnostic counters for one stream session.
 */
struct OlsrStats {
  int64_t linesProcessed{0};
  int64_t nodesReturned{0};
  int64_t duplicateNodes{0};
  int64_t linksReturned{0};
  int64_t duplicateLinks{0};
  int64_t invalidLinks{0};

  std::map<std::string, int64_t> toMap() const;
};

/**
 * Source of raw text lines.
 */
class LineReader {
 public:
  virtual ~LineReader() = default;

  // Returns the next line without its terminator, or std::nullopt once the
  // underlying stream has ended (or failed).
  virtual std::optional<std::string> readLine() = 0;

  // Release the underlying resource. Safe to call more than once.
  virtual void close() = 0;
};

/**
 * LineReader over a connected stream socket. Owns the descriptor.
 */
class SocketLineReader final : public LineReader {
 public:
  explicit SocketLineReader(int sockFd);
  ~SocketLineReader() override;

  SocketLineReader(const SocketLineReader&) = delete;
  SocketLineReader& operator=(const SocketLineReader&) = delete;

  std::optional<std::string> readLine() override;
  void close() override;

 private:
  int sockFd_;
  std::string buffer_;
  bool eof_{false};
};

/**
 * Reader for the OLSR daemon's topology export.
 *
 * The export is consumed line by line and fanned out to two lazy views:
 * nodes() yields unique node addresses and links() yields unique links.
 * Both views share a single read loop guarded by one mutex, so the views
 * can be consumed from different threads without racing the connection:
 * a view whose local queue is empty reads the next line on behalf of both.
 */
class OlsrStream {
 public:
  template <typename T>
  class View final : public Sequence<T> {
   public:
    explicit View(OlsrStream& stream) : stream_(stream) {}

    std::optional<T> next() override;

   private:
    friend class OlsrStream;

    OlsrStream& stream_;
    // Parsed values not yet handed out (guarded by stream_.lock_)
    std::deque<T> queue_;
  };

  /**
   * Connect to the daemon and wrap the connection.
   *
   * Throws ConnectError if the connection cannot be established within
   * 'timeout'. The name lookup and every resolved address share that one
   * deadline. Never retries.
   */
  static std::unique_ptr<OlsrStream> connect(
      const std::string& host,
      int port,
      std::chrono::milliseconds timeout,
      std::chrono::milliseconds readTimeout =
          CollectorConsts::kOlsrReadTimeout);

  explicit OlsrStream(std::unique_ptr<LineReader> reader);

  OlsrStream(const OlsrStream&) = delete;
  OlsrStream& operator=(const OlsrStream&) = delete;

  Sequence<std::string>&
  nodes() {
    return nodes_;
  }

  Sequence<OlsrLink>&
  links() {
    return links_;
  }

  // Whether the end of the export has been reached
  bool isFinished();

  OlsrStats getStats();

 private:
  // Read one line and route it to the matching view queues.
  // Must be called with lock_ held.
  void populateQueues();

  // Mark the stream finished and release the connection.
  // Must be called with lock_ held.
  void finish();

  // Return the node address on this line if it is one not seen before
  std::optional<std::string> getAddress(const std::string& line);

  // Return the link on this line if it is one not seen before
  std::optional<OlsrLink> getLink(const std::string& line);

  std::mutex lock_;
  std::unique_ptr<LineReader> reader_;
  bool finished_{false};

  View<std::string> nodes_;
  View<OlsrLink> links_;

  OlsrStats stats_;
  std::unordered_set<std::string> nodesSeen_;
  std::set<std::pair<std::string, std::string>> linksSeen_;
};

extern template class OlsrStream::View<std::string>;
extern template class OlsrStream::View<OlsrLink>;

} // namespace collector
} // namespace meshmap
