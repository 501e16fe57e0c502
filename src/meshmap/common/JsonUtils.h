/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <folly/dynamic.h>

namespace meshmap {

/**
 * JSON-related utilities.
 *
 * The getters below are lenient about the representation used by node
 * firmware (numbers are frequently sent as strings), but throw
 * std::invalid_argument when a value cannot be interpreted at all.
 */
class JsonUtils {
 public:
  /**
   * Decode raw bytes as UTF-8, replacing invalid sequences with U+FFFD.
   *
   * Never throws.
   */
  static std::string toValidUtf8(const std::string& bytes);

  /** Serialize a folly::dynamic object with sorted keys (single line). */
  static std::string toSortedJson(const folly::dynamic& object);


  /**
   * Return the object at 'key', or an empty object if the key is missing or
   * null. Throws std::invalid_argument if the value is not an object.
   */
  static const folly::dynamic& getObject(
      const folly::dynamic& obj, const std::string& key);

  /**
   * Return the value at 'key' as a string. Numbers and booleans are
   * converted, missing/null values return 'defaultValue'.
   */
  static std::string getString(
      const folly::dynamic& obj,
      const std::string& key,
      const std::string& defaultValue = "");

  /**
   * Return the value at 'key' as a double. Missing, null and empty-string
   * values return std::nullopt.
   *
   * Throws std::invalid_argument for non-numeric strings or other types.
   */
  static std::optional<double> getOptionalDouble(
      const folly::dynamic& obj, const std::string& key);

  /** Integer flavor of getOptionalDouble(). */
  static std::optional<int64_t> getOptionalInt(
      const folly::dynamic& obj, const std::string& key);

  /**
   * Return the value at 'key' as a bool. Accepts booleans, numbers and the
   * strings "true"/"false"/"1"/"0"/"yes"/"no". Missing values are false.
   */
  static bool getBool(const folly::dynamic& obj, const std::string& key);

 private:
  static const folly::dynamic kEmptyObject;
};

} // namespace meshmap
