/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JsonUtils.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <folly/Conv.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <folly/Unicode.h>
#include <folly/json.h>

namespace meshmap {

const folly::dynamic JsonUtils::kEmptyObject = folly::dynamic::object;

std::string
JsonUtils::toValidUtf8(const std::string& bytes) {
  std::string decoded;
  decoded.reserve(bytes.size());
  auto p = reinterpret_cast<const unsigned char*>(bytes.data());
  const auto end = p + bytes.size();
  while (p < end) {
    if (*p < 0x80) {
      decoded.push_back(static_cast<char>(*p++));
      continue;
    }
    // skipOnError yields U+FFFD and advances past the bad byte
    decoded += folly::codePointToUtf8(
        folly::utf8ToCodePoint(p, end, true /* skipOnError */));
  }
  return decoded;
}

std::string
JsonUtils::toSortedJson(const folly::dynamic& object) {
  folly::json::serialization_opts opts;
  opts.sort_keys = true;
  return folly::json::serialize(object, opts);
}

const folly::dynamic&
JsonUtils::getObject(const folly::dynamic& obj, const std::string& key) {
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return kEmptyObject;
  }
  if (!value->isObject()) {
    throw std::invalid_argument(
        folly::sformat("Expected '{}' to be an object", key));
  }
  return *value;
}

std::string
JsonUtils::getString(
    const folly::dynamic& obj,
    const std::string& key,
    const std::string& defaultValue) {
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return defaultValue;
  }
  if (value->isString()) {
    return value->getString();
  }
  if (value->isNumber() || value->isBool()) {
    return value->asString();
  }
  throw std::invalid_argument(
      folly::sformat("Expected '{}' to be a string", key));
}

std::optional<double>
JsonUtils::getOptionalDouble(
    const folly::dynamic& obj, const std::string& key) {
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return std::nullopt;
  }
  if (value->isNumber()) {
    return value->asDouble();
  }
  if (value->isString()) {
    auto text = folly::trimWhitespace(value->getString());
    if (text.empty()) {
      return std::nullopt;
    }
    auto parsed = folly::tryTo<double>(text);
    if (parsed.hasValue()) {
      return parsed.value();
    }
  }
  throw std::invalid_argument(
      folly::sformat("Expected '{}' to be numeric", key));
}

std::optional<int64_t>
JsonUtils::getOptionalInt(const folly::dynamic& obj, const std::string& key) {
  auto value = getOptionalDouble(obj, key);
  if (!value) {
    return std::nullopt;
  }
  // 2^63 is exact as a double, -2^63 is the int64 minimum
  const double limit =
      -static_cast<double>(std::numeric_limits<int64_t>::min());
  if (!std::isfinite(*value) || *value < -limit || *value >= limit) {
    throw std::invalid_argument(
        folly::sformat("Value of '{}' is out of integer range", key));
  }
  return static_cast<int64_t>(*value);
}

bool
JsonUtils::getBool(const folly::dynamic& obj, const std::string& key) {
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return false;
  }
  if (value->isBool()) {
    return value->getBool();
  }
  if (value->isNumber()) {
    return value->asDouble() != 0;
  }
  if (value->isString()) {
    auto text = folly::trimWhitespace(value->getString()).str();
    if (text == "true" || text == "1" || text == "yes") {
      return true;
    }
    if (text.empty() || text == "false" || text == "0" || text == "no") {
      return false;
    }
  }
  throw std::invalid_argument(
      folly::sformat("Expected '{}' to be a boolean", key));
}

} // namespace meshmap
