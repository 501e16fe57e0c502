/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "OlsrStream.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <regex>
#include <thread>

#include <folly/Conv.h>
#include <folly/ExceptionString.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

namespace {
// Lines naming a node, e.g. "10.32.66.190" -> "10.80.213.95"[label="1.000"];
// (the second address is sometimes a CIDR address)
const std::regex kNodeRegex(
    R"re(^"(\d{2}\.\d{1,3}\.\d{1,3}\.\d{1,3})" -> "\d+)re");

// Lines describing a link between two mesh addresses. Records where the
// second address is a CIDR network (labelled "HNA") do not match.
const std::regex kLinkRegex(
    R"re(^"(10\.\d{1,3}\.\d{1,3}\.\d{1,3})" -> )re"
    R"re("(10\.\d{1,3}\.\d{1,3}\.\d{1,3})"\[label="(.+?)"\];)re");

const size_t kReadChunkSize{4096};

const int kSockFdInvalid{-1};

// Wait for a non-blocking connect() to finish. Returns 0 on success, or an
// errno value (ETIMEDOUT when 'timeout' expires first).
int
waitForConnect(int sockFd, std::chrono::milliseconds timeout) {
  struct pollfd pfd;
  pfd.fd = sockFd;
  pfd.events = POLLOUT;
  pfd.revents = 0;

  int ret;
  do {
    ret = poll(&pfd, 1, (int)timeout.count());
  } while (ret < 0 && errno == EINTR);

  if (ret == 0) {
    return ETIMEDOUT;
  }
  if (ret < 0) {
    return errno;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  if (getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
    return errno;
  }
  return soError;
}

// Time left until 'deadline', rounded up to whole milliseconds
std::chrono::milliseconds
remainingTime(std::chrono::steady_clock::time_point deadline) {
  auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return std::max(remaining, std::chrono::milliseconds(0));
}

// getaddrinfo() call running on its own thread. The thread may outlive the
// caller, in which case it frees the result itself.
struct AddressLookup {
  std::mutex lock;
  std::condition_variable cv;
  bool done{false};
  bool abandoned{false};
  int status{0};
  struct addrinfo* addrs{nullptr};
};

// Resolve 'host' before 'deadline'. Returns the getaddrinfo() status, or
// std::nullopt if the resolver did not answer in time. On success the
// caller owns 'addrs'.
std::optional<int>
lookupAddresses(
    const std::string& host,
    const std::string& port,
    std::chrono::steady_clock::time_point deadline,
    struct addrinfo*& addrs) {
  auto lookup = std::make_shared<AddressLookup>();
  std::thread([lookup, host, port]() {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* result = nullptr;
    int status = getaddrinfo(host.c_str(), port.c_str(), &hints, &result);

    std::lock_guard<std::mutex> guard(lookup->lock);
    if (lookup->abandoned) {
      if (status == 0) {
        freeaddrinfo(result);
      }
      return;
    }
    lookup->done = true;
    lookup->status = status;
    lookup->addrs = result;
    lookup->cv.notify_one();
  }).detach();

  std::unique_lock<std::mutex> guard(lookup->lock);
  if (!lookup->cv.wait_until(
          guard, deadline, [&lookup]() { return lookup->done; })) {
    lookup->abandoned = true;
    return std::nullopt;
  }
  addrs = lookup->addrs;
  return lookup->status;
}
} // namespace

namespace meshmap {
namespace collector {

OlsrLink
OlsrLink::fromStrings(
    const std::string& source,
    const std::string& destination,
    const std::string& label) {
  OlsrLink link;
  link.source = source;
  link.destination = destination;
  link.cost = label == CollectorConsts::kOlsrUnreachableLabel
      ? CollectorConsts::kOlsrUnreachableCost
      : folly::to<double>(label);
  return link;
}

std::string
OlsrLink::toString() const {
  return folly::sformat("{} -> {} ({})", source, destination, cost);
}

std::map<std::string, int64_t>
OlsrStats::toMap() const {
  return {
      {"lines processed", linesProcessed},
      {"nodes returned", nodesReturned},
      {"duplicate node", duplicateNodes},
      {"links returned", linksReturned},
      {"duplicate link", duplicateLinks},
      {"invalid link", invalidLinks},
  };
}

SocketLineReader::SocketLineReader(int sockFd) : sockFd_(sockFd) {}

SocketLineReader::~SocketLineReader() {
  close();
}

std::optional<std::string>
SocketLineReader::readLine() {
  while (true) {
    auto pos = buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      return line;
    }
    if (eof_ || sockFd_ == kSockFdInvalid) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      // final line without a terminator
      std::string line;
      line.swap(buffer_);
      return line;
    }

    char chunk[kReadChunkSize];
    ssize_t n = recv(sockFd_, chunk, sizeof(chunk), 0);
    if (n > 0) {
      buffer_.append(chunk, n);
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR) {
      LOG(ERROR) << "Error reading OLSR data: " << folly::errnoStr(errno);
      eof_ = true;
    }
  }
}

void
SocketLineReader::close() {
  if (sockFd_ != kSockFdInvalid) {
    ::close(sockFd_);
    sockFd_ = kSockFdInvalid;
  }
}

std::unique_ptr<OlsrStream>
OlsrStream::connect(
    const std::string& host,
    int port,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds readTimeout) {
  VLOG(1) << folly::format("Connecting to OLSR daemon {}:{}", host, port);

  // name lookup and every address tried share one deadline
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto timeoutError = [&]() {
    LOG(ERROR) << folly::format(
        "Timeout attempting to connect to {}:{}", host, port);
    return ConnectError(folly::sformat(
        "Timeout connecting to OLSR daemon {}:{}", host, port));
  };

  struct addrinfo* addrs = nullptr;
  auto status =
      lookupAddresses(host, folly::to<std::string>(port), deadline, addrs);
  if (!status) {
    throw timeoutError();
  }
  if (*status != 0) {
    LOG(ERROR) << folly::format(
        "Failed to connect to {}:{} ({})", host, port, gai_strerror(*status));
    throw ConnectError(folly::sformat(
        "Failed to connect to OLSR daemon {}:{}: {}",
        host,
        port,
        gai_strerror(*status)));
  }

  int sockFd = kSockFdInvalid;
  int lastError = 0;
  for (auto ai = addrs; ai != nullptr; ai = ai->ai_next) {
    const auto remaining = remainingTime(deadline);
    if (remaining.count() == 0) {
      lastError = ETIMEDOUT;
      break;
    }

    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastError = errno;
      continue;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int res = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    int err = (res == 0) ? 0 : errno;
    if (err == EINPROGRESS) {
      err = waitForConnect(fd, remaining);
    }
    if (err != 0) {
      lastError = err;
      ::close(fd);
      continue;
    }

    // back to blocking reads, bounded by the read timeout
    fcntl(fd, F_SETFL, flags);
    struct timeval tv;
    tv.tv_sec = readTimeout.count() / 1000;
    tv.tv_usec = (readTimeout.count() % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
      LOG(WARNING) << "setsockopt() SO_RCVTIMEO failed: "
                   << folly::errnoStr(errno);
    }
    sockFd = fd;
    break;
  }
  freeaddrinfo(addrs);

  if (sockFd == kSockFdInvalid) {
    if (lastError == ETIMEDOUT) {
      throw timeoutError();
    }
    LOG(ERROR) << folly::format(
        "Failed to connect to {}:{} ({})",
        host,
        port,
        folly::errnoStr(lastError));
    throw ConnectError(folly::sformat(
        "Failed to connect to OLSR daemon {}:{}: {}",
        host,
        port,
        folly::errnoStr(lastError)));
  }

  return std::make_unique<OlsrStream>(
      std::make_unique<SocketLineReader>(sockFd));
}

OlsrStream::OlsrStream(std::unique_ptr<LineReader> reader)
    : reader_(std::move(reader)), nodes_(*this), links_(*this) {}

template <typename T>
std::optional<T>
OlsrStream::View<T>::next() {
  std::lock_guard<std::mutex> guard(stream_.lock_);
  while (queue_.empty() && !stream_.finished_) {
    stream_.populateQueues();
  }
  if (queue_.empty()) {
    return std::nullopt;
  }
  T value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

template class OlsrStream::View<std::string>;
template class OlsrStream::View<OlsrLink>;

bool
OlsrStream::isFinished() {
  std::lock_guard<std::mutex> guard(lock_);
  return finished_;
}

OlsrStats
OlsrStream::getStats() {
  std::lock_guard<std::mutex> guard(lock_);
  return stats_;
}

void
OlsrStream::populateQueues() {
  if (finished_) {
    return;
  }

  auto line = reader_->readLine();
  if (!line) {
    // all data from the daemon has been processed
    finish();
    return;
  }

  stats_.linesProcessed++;
  const std::string text = folly::rtrimWhitespace(*line).str();
  VLOG(4) << "OLSR data: " << text;

  if (auto address = getAddress(text)) {
    nodes_.queue_.push_back(std::move(*address));
  }
  if (auto link = getLink(text)) {
    links_.queue_.push_back(std::move(*link));
  }
}

void
OlsrStream::finish() {
  finished_ = true;
  reader_->close();

  LOG(INFO) << "OLSR Data Statistics: lines processed "
            << stats_.linesProcessed << ", nodes returned "
            << stats_.nodesReturned << ", duplicate nodes "
            << stats_.duplicateNodes << ", links returned "
            << stats_.linksReturned << ", duplicate links "
            << stats_.duplicateLinks << ", invalid links "
            << stats_.invalidLinks;
  if (stats_.nodesReturned == 0) {
    LOG(WARNING) << folly::format(
        "Failed to find any nodes in {} lines of OLSR data.",
        stats_.linesProcessed);
  }
  if (stats_.linksReturned == 0) {
    LOG(WARNING) << folly::format(
        "Failed to find any links in {} lines of OLSR data.",
        stats_.linesProcessed);
  }
}

std::optional<std::string>
OlsrStream::getAddress(const std::string& line) {
  std::smatch match;
  if (!std::regex_search(line, match, kNodeRegex)) {
    return std::nullopt;
  }

  std::string address = match[1].str();
  if (!nodesSeen_.insert(address).second) {
    stats_.duplicateNodes++;
    return std::nullopt;
  }
  stats_.nodesReturned++;
  return address;
}

std::optional<OlsrLink>
OlsrStream::getLink(const std::string& line) {
  std::smatch match;
  if (!std::regex_search(line, match, kLinkRegex)) {
    return std::nullopt;
  }

  // the daemon has been seen to repeat links within one export
  auto linkId = std::make_pair(match[1].str(), match[2].str());
  if (linksSeen_.count(linkId)) {
    stats_.duplicateLinks++;
    return std::nullopt;
  }

  OlsrLink link;
  try {
    link = OlsrLink::fromStrings(linkId.first, linkId.second, match[3].str());
  } catch (const std::exception& ex) {
    LOG(WARNING) << folly::format(
        "Ignoring OLSR link with invalid cost: {} ({})",
        line,
        folly::exceptionStr(ex));
    stats_.invalidLinks++;
    return std::nullopt;
  }
  // only a parsed link claims its source and destination pair
  linksSeen_.insert(std::move(linkId));
  stats_.linksReturned++;
  return link;
}

} // namespace collector
} // namespace meshmap
