/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "GeoUtils.h"

#include <algorithm>
#include <cmath>

namespace {
const double kPi{3.14159265358979323846};

double
toRadians(double degrees) {
  return degrees * kPi / 180.0;
}

double
toDegrees(double radians) {
  return radians * 180.0 / kPi;
}
} // namespace

namespace meshmap {

double
GeoUtils::distance(double lat1, double lon1, double lat2, double lon2) {
  const double phi1 = toRadians(lat1);
  const double phi2 = toRadians(lat2);
  const double lonDelta = toRadians(lon2 - lon1);

  const double h =
      hav(phi2 - phi1) + std::cos(phi1) * std::cos(phi2) * hav(lonDelta);
  // floating point error can push h slightly above 1 for antipodal points
  const double d = 2 * kEarthRadiusKm * std::asin(std::sqrt(std::min(h, 1.0)));
  return round(d, 3);
}

double
GeoUtils::bearing(double lat1, double lon1, double lat2, double lon2) {
  const double phi1 = toRadians(lat1);
  const double phi2 = toRadians(lat2);
  const double lonDelta = toRadians(lon2 - lon1);

  const double b = std::atan2(
      std::sin(lonDelta) * std::cos(phi2),
      std::cos(phi1) * std::sin(phi2) -
          std::sin(phi1) * std::cos(phi2) * std::cos(lonDelta));
  return round(toDegrees(b), 1);
}

double
GeoUtils::hav(double theta) {
  return std::pow(std::sin(theta / 2), 2);
}

double
GeoUtils::round(double value, int places) {
  const double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

} // namespace meshmap
