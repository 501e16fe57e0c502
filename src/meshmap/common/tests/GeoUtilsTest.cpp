/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/init/Init.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include <cmath>

#include "../GeoUtils.h"

using meshmap::GeoUtils;

TEST(GeoUtilsTest, DistanceSamePoint) {
  EXPECT_EQ(0.0, GeoUtils::distance(0, 0, 0, 0));
  EXPECT_EQ(0.0, GeoUtils::distance(37.7749, -122.4194, 37.7749, -122.4194));
}

TEST(GeoUtilsTest, DistanceKnownValues) {
  // one degree of longitude along the equator
  EXPECT_DOUBLE_EQ(111.195, GeoUtils::distance(0, 0, 0, 1));

  // London to Paris
  EXPECT_DOUBLE_EQ(
      343.556, GeoUtils::distance(51.5074, -0.1278, 48.8566, 2.3522));

  // San Francisco to Los Angeles
  EXPECT_DOUBLE_EQ(
      559.121, GeoUtils::distance(37.7749, -122.4194, 34.0522, -118.2437));

  // antipodal points are half the circumference apart
  EXPECT_DOUBLE_EQ(20015.087, GeoUtils::distance(0, 0, 0, 180));
}

TEST(GeoUtilsTest, DistanceSymmetric) {
  const double points[][4] = {
      {51.5074, -0.1278, 48.8566, 2.3522},
      {37.7749, -122.4194, 34.0522, -118.2437},
      {-33.8688, 151.2093, 35.6762, 139.6503},
      {10.0, 20.0, -10.0, -20.0},
  };
  for (const auto& p : points) {
    EXPECT_EQ(
        GeoUtils::distance(p[0], p[1], p[2], p[3]),
        GeoUtils::distance(p[2], p[3], p[0], p[1]));
  }
}

TEST(GeoUtilsTest, DistanceRounding) {
  // three decimal places at most
  double d = GeoUtils::distance(37.7749, -122.4194, 37.8044, -122.2712);
  EXPECT_DOUBLE_EQ(d, std::round(d * 1000) / 1000);
}

TEST(GeoUtilsTest, BearingCardinalDirections) {
  EXPECT_DOUBLE_EQ(0.0, GeoUtils::bearing(0, 0, 1, 0));
  EXPECT_DOUBLE_EQ(90.0, GeoUtils::bearing(0, 0, 0, 1));
  EXPECT_DOUBLE_EQ(-90.0, GeoUtils::bearing(0, 0, 0, -1));
  EXPECT_DOUBLE_EQ(180.0, GeoUtils::bearing(0, 0, -1, 0));
}

TEST(GeoUtilsTest, BearingKnownValues) {
  EXPECT_DOUBLE_EQ(148.1, GeoUtils::bearing(51.5074, -0.1278, 48.8566, 2.3522));
  EXPECT_DOUBLE_EQ(-30.0, GeoUtils::bearing(48.8566, 2.3522, 51.5074, -0.1278));
  EXPECT_DOUBLE_EQ(
      136.5, GeoUtils::bearing(37.7749, -122.4194, 34.0522, -118.2437));
}

TEST(GeoUtilsTest, BearingRange) {
  for (int lat = -80; lat <= 80; lat += 20) {
    for (int lon = -170; lon <= 170; lon += 34) {
      double b = GeoUtils::bearing(lat, lon, -lat / 2.0, -lon);
      EXPECT_GE(b, -180.0);
      EXPECT_LE(b, 180.0);
    }
  }
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
